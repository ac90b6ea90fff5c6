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

#include "mapnav/navigation/NavigationTransform.h"

#include <cmath>

namespace mapnav {
namespace navigation {

using device::Axis;

Vector6d ConditionAxes(const device::RawSample &sample,
                       const AxisConfig &config) {
    Vector6d axes;
    for (int i = 0; i < device::kNumAxes; ++i) {
        double value = sample.Get(static_cast<Axis>(i));
        if (config.invert[i]) {
            value = -value;
        }
        if (std::abs(value) < config.deadzone) {
            value = 0.0;
        }
        axes(i) = value;
    }
    return axes;
}

NavigationCommand Transform(const device::RawSample &sample,
                            const AxisConfig &config) {
    Vector6d axes = ConditionAxes(sample, config);

    int pan_y_axis = static_cast<int>(config.swap_yz ? Axis::TZ : Axis::TY);
    int zoom_axis = static_cast<int>(config.swap_yz ? Axis::TY : Axis::TZ);

    NavigationCommand command;
    command.pan = Eigen::Vector2d(axes(static_cast<int>(Axis::TX)),
                                  axes(pan_y_axis)) *
                  config.pan_sensitivity;
    command.zoom = axes(zoom_axis) * config.zoom_sensitivity;
    return command;
}

}  // namespace navigation
}  // namespace mapnav
