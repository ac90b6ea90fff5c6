// ----------------------------------------------------------------------------
// -                  MapNav: SpaceMouse navigation for QGIS                  -
// ----------------------------------------------------------------------------
// The MIT License (MIT)
//
// Copyright (c) 2026 MapNav contributors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
// ----------------------------------------------------------------------------

#include <chrono>
#include <exception>
#include <thread>

#include "mapnav/MapNav.h"

using namespace mapnav;

void PrintHelp() {
    utility::PrintProgramOptionsHelp(
            "Usage: SpaceMouseMonitor [options]\n"
            "Navigates a simulated map with the first SpaceMouse found.",
            {{"--backend hid|spnav", "device backend (default hid)"},
             {"--poll-interval <ms>", "poll interval, 5 to 100 (default 10)"},
             {"--ticks <n>", "stop after n polls, 0 runs forever (default 0)"},
             {"--deadzone <d>", "deadzone, 0 to 0.2 (default 0.05)"},
             {"--pan-sensitivity <s>", "0.001 to 0.1 (default 0.005)"},
             {"--zoom-sensitivity <s>", "0.001 to 0.1 (default 0.01)"},
             {"--swap-yz", "up/down pans, forward/back zooms"},
             {"--verbose", "print debug messages"},
             {"--help, -h", "print this help"}});
}

int main(int argc, char **argv) {
    if (utility::ProgramOptionExistsAny(argc, argv, {"--help", "-h"})) {
        PrintHelp();
        return 0;
    }
    if (utility::ProgramOptionExists(argc, argv, "--verbose")) {
        utility::SetVerbosityLevel(utility::VerbosityLevel::Debug);
    }

    settings::DeviceOptions options;
    std::string backend_name =
            utility::GetProgramOptionAsString(argc, argv, "--backend", "hid");
    if (!device::ParseBackendName(backend_name, options.backend)) {
        utility::LogWarning("Unknown backend {}.", backend_name);
        PrintHelp();
        return 1;
    }
    options.poll_interval_ms = utility::GetProgramOptionAsInt(
            argc, argv, "--poll-interval",
            settings::DeviceOptions::kDefaultPollIntervalMs,
            settings::DeviceOptions::kMinPollIntervalMs,
            settings::DeviceOptions::kMaxPollIntervalMs);
    int ticks = utility::GetProgramOptionAsInt(argc, argv, "--ticks", 0, 0);

    using navigation::AxisConfig;
    AxisConfig config;
    config.deadzone = utility::GetProgramOptionAsDouble(
            argc, argv, "--deadzone", AxisConfig::kDefaultDeadzone, 0.0,
            AxisConfig::kMaxDeadzone);
    config.pan_sensitivity = utility::GetProgramOptionAsDouble(
            argc, argv, "--pan-sensitivity", AxisConfig::kDefaultPanSensitivity,
            AxisConfig::kMinSensitivity, AxisConfig::kMaxSensitivity);
    config.zoom_sensitivity = utility::GetProgramOptionAsDouble(
            argc, argv, "--zoom-sensitivity",
            AxisConfig::kDefaultZoomSensitivity, AxisConfig::kMinSensitivity,
            AxisConfig::kMaxSensitivity);
    config.swap_yz = utility::ProgramOptionExists(argc, argv, "--swap-yz");

    try {
        host::SimulatedMapCanvas canvas;
        navigation::NavigationController controller(
                device::CreateSpaceMouse(options.backend), canvas);
        controller.SetAxisConfig(config);
        controller.SetStatusCallback([](navigation::DeviceStatus status,
                                        const std::string &message) {
            utility::LogInfo("Status: {} ({})",
                             navigation::GetDeviceStatusName(status), message);
        });
        controller.Enable();

        size_t last_applied = 0;
        for (int i = 0; ticks == 0 || i < ticks; ++i) {
            controller.Tick();
            if (controller.GetAppliedCommandCount() != last_applied) {
                last_applied = controller.GetAppliedCommandCount();
                Eigen::Vector2d center = canvas.GetCenter();
                utility::LogInfo("center ({:.4f}, {:.4f}) scale {:.4f}",
                                 center.x(), center.y(), canvas.GetScale());
            }
            std::this_thread::sleep_for(
                    std::chrono::milliseconds(options.poll_interval_ms));
        }
        controller.Disable();
    } catch (const std::exception &e) {
        utility::LogWarning("{}", e.what());
        return 1;
    }
    return 0;
}
