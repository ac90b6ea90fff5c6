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

#include "mapnav/settings/NavigationSettings.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>

#include <fmt/format.h>

#include "mapnav/host/SettingsStore.h"
#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace settings {

using device::Axis;
using navigation::AxisConfig;

const char *const kSettingsGroup = "spacemouse";

constexpr int DeviceOptions::kDefaultPollIntervalMs;
constexpr int DeviceOptions::kMinPollIntervalMs;
constexpr int DeviceOptions::kMaxPollIntervalMs;

namespace {

const char *const kSwapYZKey = "swap_yz";
const char *const kDeadzoneKey = "deadzone";
const char *const kPanSensitivityKey = "pan_sensitivity";
const char *const kZoomSensitivityKey = "zoom_sensitivity";
const char *const kBackendKey = "backend";
const char *const kPollIntervalKey = "poll_interval_ms";

// Translation axes keep the short names the settings have always used.
std::string InvertKey(Axis axis) {
    switch (axis) {
        case Axis::TX:
            return "invert_x";
        case Axis::TY:
            return "invert_y";
        case Axis::TZ:
            return "invert_z";
        default:
            return std::string("invert_") + device::GetAxisName(axis);
    }
}

void LogFallback(const std::string &key, const std::string &value) {
    utility::LogDebug("Setting {} has unusable value '{}', using default.",
                      key, value);
}

bool ParseBool(const std::string &value, bool &out) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    if (lower == "true" || lower == "1") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0") {
        out = false;
        return true;
    }
    return false;
}

// Always uses the classic locale: the host may have switched LC_NUMERIC to
// one with a decimal comma.
template <typename T>
bool ParseNumber(const std::string &value, T &out) {
    std::istringstream stream(value);
    stream.imbue(std::locale::classic());
    T parsed;
    stream >> parsed;
    if (stream.fail()) {
        return false;
    }
    stream >> std::ws;
    if (!stream.eof()) {
        return false;
    }
    out = parsed;
    return true;
}

bool ReadBool(const host::SettingsStore &store,
              const std::string &name,
              bool default_value) {
    std::string key = SettingsKey(name);
    if (!store.Contains(key)) {
        return default_value;
    }
    std::string value = store.GetValue(key);
    bool result;
    if (!ParseBool(value, result)) {
        LogFallback(key, value);
        return default_value;
    }
    return result;
}

double ReadDouble(const host::SettingsStore &store,
                  const std::string &name,
                  double default_value) {
    std::string key = SettingsKey(name);
    if (!store.Contains(key)) {
        return default_value;
    }
    std::string value = store.GetValue(key);
    double result;
    if (!ParseNumber(value, result) || !std::isfinite(result)) {
        LogFallback(key, value);
        return default_value;
    }
    return result;
}

void WriteBool(host::SettingsStore &store, const std::string &name, bool value) {
    store.SetValue(SettingsKey(name), value ? "true" : "false");
}

// fmt prints the shortest representation that parses back to the same
// double, independent of the locale.
void WriteDouble(host::SettingsStore &store,
                 const std::string &name,
                 double value) {
    store.SetValue(SettingsKey(name), fmt::format("{}", value));
}

}  // namespace

std::string SettingsKey(const std::string &name) {
    return std::string(kSettingsGroup) + "/" + name;
}

AxisConfig LoadAxisConfig(const host::SettingsStore &store) {
    AxisConfig config;
    for (int i = 0; i < device::kNumAxes; ++i) {
        Axis axis = static_cast<Axis>(i);
        config.SetInverted(axis, ReadBool(store, InvertKey(axis), false));
    }
    config.swap_yz = ReadBool(store, kSwapYZKey, false);
    config.deadzone =
            ReadDouble(store, kDeadzoneKey, AxisConfig::kDefaultDeadzone);
    config.pan_sensitivity = ReadDouble(store, kPanSensitivityKey,
                                        AxisConfig::kDefaultPanSensitivity);
    config.zoom_sensitivity = ReadDouble(store, kZoomSensitivityKey,
                                         AxisConfig::kDefaultZoomSensitivity);
    return config;
}

void SaveAxisConfig(host::SettingsStore &store, const AxisConfig &config) {
    for (int i = 0; i < device::kNumAxes; ++i) {
        Axis axis = static_cast<Axis>(i);
        WriteBool(store, InvertKey(axis), config.IsInverted(axis));
    }
    WriteBool(store, kSwapYZKey, config.swap_yz);
    WriteDouble(store, kDeadzoneKey, config.deadzone);
    WriteDouble(store, kPanSensitivityKey, config.pan_sensitivity);
    WriteDouble(store, kZoomSensitivityKey, config.zoom_sensitivity);
    store.Sync();
}

DeviceOptions LoadDeviceOptions(const host::SettingsStore &store) {
    DeviceOptions options;

    std::string backend_key = SettingsKey(kBackendKey);
    if (store.Contains(backend_key)) {
        std::string value = store.GetValue(backend_key);
        if (!device::ParseBackendName(value, options.backend)) {
            LogFallback(backend_key, value);
        }
    }

    std::string interval_key = SettingsKey(kPollIntervalKey);
    if (store.Contains(interval_key)) {
        std::string value = store.GetValue(interval_key);
        int interval;
        if (ParseNumber(value, interval) &&
            interval >= DeviceOptions::kMinPollIntervalMs &&
            interval <= DeviceOptions::kMaxPollIntervalMs) {
            options.poll_interval_ms = interval;
        } else {
            LogFallback(interval_key, value);
        }
    }
    return options;
}

void SaveDeviceOptions(host::SettingsStore &store,
                       const DeviceOptions &options) {
    store.SetValue(SettingsKey(kBackendKey),
                   device::GetBackendName(options.backend));
    store.SetValue(SettingsKey(kPollIntervalKey),
                   std::to_string(options.poll_interval_ms));
    store.Sync();
}

}  // namespace settings
}  // namespace mapnav
