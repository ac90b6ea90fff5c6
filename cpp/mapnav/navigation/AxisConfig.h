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

#include <array>
#include <string>

#include "mapnav/device/RawSample.h"

namespace mapnav {
namespace navigation {

/// User configuration of the input-to-navigation mapping. Owned by whoever
/// drives navigation and passed explicitly to Transform().
struct AxisConfig {
    static constexpr double kDefaultDeadzone = 0.05;
    static constexpr double kDefaultPanSensitivity = 0.005;
    static constexpr double kDefaultZoomSensitivity = 0.01;
    static constexpr double kMinSensitivity = 0.001;
    static constexpr double kMaxSensitivity = 0.1;
    static constexpr double kMaxDeadzone = 0.2;

    AxisConfig();

    bool IsInverted(device::Axis axis) const {
        return invert[static_cast<int>(axis)];
    }
    void SetInverted(device::Axis axis, bool inverted) {
        invert[static_cast<int>(axis)] = inverted;
    }

    bool operator==(const AxisConfig &other) const;
    bool operator!=(const AxisConfig &other) const { return !(*this == other); }

    std::string ToString() const;

    /// Per-axis sign inversion, indexed by device::Axis.
    std::array<bool, device::kNumAxes> invert;
    /// false: forward/back pans vertically, up/down zooms.
    /// true: up/down pans vertically, forward/back zooms.
    bool swap_yz = false;
    /// Axis values whose magnitude is below this are treated as zero.
    double deadzone = kDefaultDeadzone;
    double pan_sensitivity = kDefaultPanSensitivity;
    double zoom_sensitivity = kDefaultZoomSensitivity;
};

}  // namespace navigation
}  // namespace mapnav
