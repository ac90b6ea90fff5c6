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

#include <cstdint>

#include <Eigen/Core>

namespace mapnav {
namespace device {

/// The six axes of a 3D mouse, in the orientation of its HID report.
enum class Axis {
    TX = 0,  ///< left/right
    TY = 1,  ///< forward/back
    TZ = 2,  ///< up/down
    RX = 3,
    RY = 4,
    RZ = 5,
};

constexpr int kNumAxes = 6;

const char *GetAxisName(Axis axis);

/// One reading of a 3D mouse: three translation and three rotation axes,
/// normalized to roughly [-1, 1], and the pressed buttons as a bitmask.
struct RawSample {
    RawSample()
        : translation(Eigen::Vector3f::Zero()),
          rotation(Eigen::Vector3f::Zero()) {}
    RawSample(const Eigen::Vector3f &t,
              const Eigen::Vector3f &r,
              uint32_t pressed = 0)
        : translation(t), rotation(r), buttons(pressed) {}

    float Get(Axis axis) const {
        int i = static_cast<int>(axis);
        return i < 3 ? translation(i) : rotation(i - 3);
    }
    bool IsButtonPressed(int button) const {
        return button >= 0 && button < 32 && (buttons >> button) & 1u;
    }

    Eigen::Vector3f translation;
    Eigen::Vector3f rotation;
    uint32_t buttons = 0;
};

}  // namespace device
}  // namespace mapnav
