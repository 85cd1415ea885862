#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace cortex {

// Best-effort hardware descriptor. Implementations never throw; on failure
// they return unknown_hardware().
class HardwareDetector {
public:
    virtual ~HardwareDetector() = default;
    virtual nlohmann::json detect() = 0;
};

nlohmann::json unknown_hardware();

// Reads /proc on Linux
class SystemHardwareDetector : public HardwareDetector {
public:
    explicit SystemHardwareDetector(std::string proc_root = "/proc")
        : proc_root_(std::move(proc_root)) {}

    nlohmann::json detect() override;

private:
    std::string proc_root_;
};

} // namespace cortex
