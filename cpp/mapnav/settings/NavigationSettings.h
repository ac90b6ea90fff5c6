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

#include <string>

#include "mapnav/device/SpaceMouse.h"
#include "mapnav/navigation/AxisConfig.h"

namespace mapnav {
namespace host {
class SettingsStore;
}

namespace settings {

/// Settings group all keys live under.
extern const char *const kSettingsGroup;

/// How the plugin talks to the device.
struct DeviceOptions {
    static constexpr int kDefaultPollIntervalMs = 10;
    static constexpr int kMinPollIntervalMs = 5;
    static constexpr int kMaxPollIntervalMs = 100;

    bool operator==(const DeviceOptions &other) const {
        return backend == other.backend &&
               poll_interval_ms == other.poll_interval_ms;
    }
    bool operator!=(const DeviceOptions &other) const {
        return !(*this == other);
    }

    device::DeviceBackend backend = device::DeviceBackend::Hid;
    int poll_interval_ms = kDefaultPollIntervalMs;
};

/// Full key ("spacemouse/<name>") of a setting.
std::string SettingsKey(const std::string &name);

/// Reads the axis configuration. Missing or unparsable keys silently fall
/// back to their defaults.
navigation::AxisConfig LoadAxisConfig(const host::SettingsStore &store);
void SaveAxisConfig(host::SettingsStore &store,
                    const navigation::AxisConfig &config);

DeviceOptions LoadDeviceOptions(const host::SettingsStore &store);
void SaveDeviceOptions(host::SettingsStore &store,
                       const DeviceOptions &options);

}  // namespace settings
}  // namespace mapnav
