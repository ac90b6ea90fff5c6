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

#include "mapnav/navigation/AxisConfig.h"

#include <fmt/format.h>

namespace mapnav {
namespace navigation {

constexpr double AxisConfig::kDefaultDeadzone;
constexpr double AxisConfig::kDefaultPanSensitivity;
constexpr double AxisConfig::kDefaultZoomSensitivity;
constexpr double AxisConfig::kMinSensitivity;
constexpr double AxisConfig::kMaxSensitivity;
constexpr double AxisConfig::kMaxDeadzone;

AxisConfig::AxisConfig() { invert.fill(false); }

bool AxisConfig::operator==(const AxisConfig &other) const {
    return invert == other.invert && swap_yz == other.swap_yz &&
           deadzone == other.deadzone &&
           pan_sensitivity == other.pan_sensitivity &&
           zoom_sensitivity == other.zoom_sensitivity;
}

std::string AxisConfig::ToString() const {
    std::string inverted;
    for (int i = 0; i < device::kNumAxes; ++i) {
        if (invert[i]) {
            if (!inverted.empty()) {
                inverted += ",";
            }
            inverted += device::GetAxisName(static_cast<device::Axis>(i));
        }
    }
    return fmt::format(
            "AxisConfig(invert=[{}], swap_yz={}, deadzone={}, pan={}, "
            "zoom={})",
            inverted, swap_yz, deadzone, pan_sensitivity, zoom_sensitivity);
}

}  // namespace navigation
}  // namespace mapnav
