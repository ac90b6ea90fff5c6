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

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "mapnav/device/SpaceMouse.h"
#include "mapnav/navigation/AxisConfig.h"
#include "mapnav/navigation/NavigationTransform.h"

namespace mapnav {
namespace host {
class MapCanvas;
}

namespace navigation {

/// Lowest zoom factor ApplyCommand() passes to the canvas.
constexpr double kMinZoomFactor = 0.01;

/// Pans and zooms `canvas` by `command`. Pan is scaled by the current
/// extent; screen y grows downwards while map y grows upwards. Returns true
/// if the canvas was changed (and refreshed).
bool ApplyCommand(const NavigationCommand &command, host::MapCanvas &canvas);

enum class DeviceStatus {
    Disabled,
    NotConnected,
    Connected,
};

const char *GetDeviceStatusName(DeviceStatus status);

/// Drives navigation from a periodic timer on the host's UI thread: every
/// Tick() opens the device if needed, polls it, and applies the transformed
/// sample to the canvas.
///
/// Device errors never escape Tick() and never change the enabled state.
/// A missing device is retried on the next tick; a device that fails
/// mid-session is closed and re-opened on the next tick.
class NavigationController {
public:
    using StatusCallback =
            std::function<void(DeviceStatus status, const std::string &message)>;

    NavigationController(std::unique_ptr<device::SpaceMouse> device,
                         host::MapCanvas &canvas);
    ~NavigationController();

    NavigationController(const NavigationController &) = delete;
    NavigationController &operator=(const NavigationController &) = delete;

    void Enable();
    /// Stops navigation and releases the device.
    void Disable();
    bool IsEnabled() const { return enabled_; }

    /// One poll cycle. Does nothing while disabled.
    void Tick();

    /// Drops the current device handle so the next tick enumerates again.
    void Rescan();

    void SetAxisConfig(const AxisConfig &config);
    const AxisConfig &GetAxisConfig() const { return config_; }

    /// Replaces the device reader, closing the old one.
    void SetDevice(std::unique_ptr<device::SpaceMouse> device);
    const device::SpaceMouse &GetDevice() const { return *device_; }

    DeviceStatus GetStatus() const { return status_; }
    /// Reason for the current status. May change without a status
    /// transition, e.g. from "Waiting for SpaceMouse" to the open error.
    const std::string &GetStatusMessage() const { return status_message_; }
    /// Called on every status transition, not on every tick.
    void SetStatusCallback(StatusCallback callback) {
        status_callback_ = std::move(callback);
    }

    /// Number of ticks that changed the canvas since construction.
    size_t GetAppliedCommandCount() const { return applied_count_; }

private:
    void SetStatus(DeviceStatus status, const std::string &message);

private:
    std::unique_ptr<device::SpaceMouse> device_;
    host::MapCanvas &canvas_;
    AxisConfig config_;
    bool enabled_ = false;
    DeviceStatus status_ = DeviceStatus::Disabled;
    std::string status_message_;
    StatusCallback status_callback_;
    uint32_t last_buttons_ = 0;
    size_t applied_count_ = 0;
};

}  // namespace navigation
}  // namespace mapnav
