#include <catch2/catch.hpp>
#include "hardware.hpp"
#include "test_helpers.hpp"

using namespace cortex;

TEST_CASE("SystemHardwareDetector: reads cpu and memory from proc", "[hardware]") {
    TempHome home;
    std::string proc = home.dir + "/proc";
    home.write(proc + "/cpuinfo",
               "processor\t: 0\nmodel name\t: Test CPU @ 3.00GHz\nflags\t\t: fpu\n");
    home.write(proc + "/meminfo", "MemTotal:       16318412 kB\nMemFree:  1 kB\n");

    SystemHardwareDetector detector(proc);
    auto hw = detector.detect();
    REQUIRE(hw["status"] == "detected");
    REQUIRE(hw["cpu_model"] == "Test CPU @ 3.00GHz");
    REQUIRE(hw["ram_mb"] == 15935);
    REQUIRE(hw["ram_gb"] == 16);
    REQUIRE(hw["gpu"] == "none detected");
}

TEST_CASE("SystemHardwareDetector: detects nvidia driver", "[hardware]") {
    TempHome home;
    std::string proc = home.dir + "/proc";
    home.write(proc + "/driver/nvidia/version", "NVRM version: 550\n");
    SystemHardwareDetector detector(proc);
    REQUIRE(detector.detect()["gpu"] == "nvidia");
}

TEST_CASE("SystemHardwareDetector: garbage input yields unknown, never throws", "[hardware]") {
    TempHome home;
    std::string proc = home.dir + "/proc";
    home.write(proc + "/meminfo", "MemTotal: lots\n");
    SystemHardwareDetector detector(proc);
    REQUIRE(detector.detect() == unknown_hardware());
}
