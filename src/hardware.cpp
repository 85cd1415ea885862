#include "hardware.hpp"
#include "util.hpp"

#include <filesystem>
#include <iostream>
#include <sys/utsname.h>
#include <thread>

namespace cortex {

nlohmann::json unknown_hardware() {
    return {{"status", "unknown"}};
}

namespace {

// "key : value" lines as found in /proc/cpuinfo and /proc/meminfo
std::string proc_field(const std::string& text, const std::string& key) {
    for (const auto& line : split(text, '\n')) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (trim(line.substr(0, colon)) == key) return trim(line.substr(colon + 1));
    }
    return "";
}

} // namespace

nlohmann::json SystemHardwareDetector::detect() {
    try {
        nlohmann::json hw = {{"status", "detected"}};

        utsname uts{};
        if (uname(&uts) == 0) {
            hw["arch"] = uts.machine;
            hw["kernel"] = uts.release;
        }

        std::string cpuinfo;
        if (read_file(proc_root_ + "/cpuinfo", cpuinfo)) {
            std::string model = proc_field(cpuinfo, "model name");
            hw["cpu_model"] = model.empty() ? "unknown" : model;
        }
        hw["cpu_cores"] = std::thread::hardware_concurrency();

        std::string meminfo;
        if (read_file(proc_root_ + "/meminfo", meminfo)) {
            std::string total = proc_field(meminfo, "MemTotal");
            if (!total.empty()) {
                unsigned long long kb = std::stoull(total);
                hw["ram_mb"] = kb / 1024ULL;
                hw["ram_gb"] = (kb + 512ULL * 1024ULL) / (1024ULL * 1024ULL);
            }
        }

        std::error_code ec;
        bool nvidia = std::filesystem::exists(proc_root_ + "/driver/nvidia/version", ec);
        hw["gpu"] = nvidia ? "nvidia" : "none detected";
        return hw;
    } catch (const std::exception& e) {
        std::cerr << "[hardware] Detection failed: " << e.what() << "\n";
        return unknown_hardware();
    }
}

} // namespace cortex
