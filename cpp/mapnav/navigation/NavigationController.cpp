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

#include "mapnav/navigation/NavigationController.h"

#include <algorithm>

#include "mapnav/device/DeviceErrors.h"
#include "mapnav/host/MapCanvas.h"
#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace navigation {

bool ApplyCommand(const NavigationCommand &command, host::MapCanvas &canvas) {
    bool changed = false;

    if (!command.pan.isZero(0.0)) {
        Eigen::Vector2d extent = canvas.GetExtentSize();
        Eigen::Vector2d offset(command.pan.x() * extent.x(),
                               -command.pan.y() * extent.y());
        canvas.SetCenter(canvas.GetCenter() + offset);
        changed = true;
    }

    if (command.zoom != 0.0) {
        canvas.ZoomByFactor(std::max(1.0 - command.zoom, kMinZoomFactor));
        changed = true;
    }

    if (changed) {
        canvas.Refresh();
    }
    return changed;
}

const char *GetDeviceStatusName(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Disabled:
            return "disabled";
        case DeviceStatus::NotConnected:
            return "not connected";
        case DeviceStatus::Connected:
            return "connected";
    }
    return "unknown";
}

NavigationController::NavigationController(
        std::unique_ptr<device::SpaceMouse> device, host::MapCanvas &canvas)
    : device_(std::move(device)), canvas_(canvas) {
    if (!device_) {
        utility::LogError("NavigationController needs a device reader.");
    }
}

NavigationController::~NavigationController() { device_->Close(); }

void NavigationController::Enable() {
    if (enabled_) {
        return;
    }
    enabled_ = true;
    utility::LogInfo("SpaceMouse navigation enabled ({} backend), {}",
                     device::GetBackendName(device_->GetBackend()),
                     config_.ToString());
    SetStatus(DeviceStatus::NotConnected, "Waiting for SpaceMouse");
}

void NavigationController::Disable() {
    if (!enabled_) {
        return;
    }
    enabled_ = false;
    device_->Close();
    last_buttons_ = 0;
    utility::LogInfo("SpaceMouse navigation disabled.");
    SetStatus(DeviceStatus::Disabled, "SpaceMouse navigation disabled");
}

void NavigationController::Tick() {
    if (!enabled_) {
        return;
    }

    try {
        if (!device_->IsOpen()) {
            device_->Open();
            SetStatus(DeviceStatus::Connected,
                      "Connected to " + device_->GetDeviceName());
        }

        device::RawSample sample;
        if (!device_->Poll(sample)) {
            return;
        }
        if (sample.buttons != last_buttons_) {
            utility::LogDebug("SpaceMouse buttons {:#x}", sample.buttons);
            last_buttons_ = sample.buttons;
        }

        NavigationCommand command = Transform(sample, config_);
        if (ApplyCommand(command, canvas_)) {
            applied_count_++;
        }
    } catch (const device::DeviceNotFoundError &e) {
        SetStatus(DeviceStatus::NotConnected, e.what());
    } catch (const device::DeviceIOError &e) {
        utility::LogWarning("SpaceMouse disconnected: {}", e.what());
        device_->Close();
        SetStatus(DeviceStatus::NotConnected, e.what());
    }
}

void NavigationController::Rescan() {
    device_->Close();
    if (enabled_) {
        SetStatus(DeviceStatus::NotConnected, "Rescanning for SpaceMouse");
    }
}

void NavigationController::SetAxisConfig(const AxisConfig &config) {
    config_ = config;
    utility::LogDebug("Using {}", config_.ToString());
}

void NavigationController::SetDevice(
        std::unique_ptr<device::SpaceMouse> device) {
    if (!device) {
        utility::LogError("NavigationController needs a device reader.");
    }
    device_->Close();
    device_ = std::move(device);
    last_buttons_ = 0;
    if (enabled_) {
        SetStatus(DeviceStatus::NotConnected, "Waiting for SpaceMouse");
    }
}

void NavigationController::SetStatus(DeviceStatus status,
                                      const std::string &message) {
    status_message_ = message;
    if (status == status_) {
        return;
    }
    status_ = status;
    utility::LogDebug("SpaceMouse status: {} ({})",
                      GetDeviceStatusName(status), message);
    if (status_callback_) {
        status_callback_(status, message);
    }
}

}  // namespace navigation
}  // namespace mapnav
