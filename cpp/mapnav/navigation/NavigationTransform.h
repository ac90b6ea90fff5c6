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

#include <Eigen/Core>

#include "mapnav/device/RawSample.h"
#include "mapnav/navigation/AxisConfig.h"

namespace mapnav {
namespace navigation {

using Vector6d = Eigen::Matrix<double, 6, 1>;

/// What one poll tick asks the map view to do.
struct NavigationCommand {
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    NavigationCommand() : pan(Eigen::Vector2d::Zero()), zoom(0.0) {}
    NavigationCommand(const Eigen::Vector2d &p, double z) : pan(p), zoom(z) {}

    bool IsZero() const { return pan.isZero(0.0) && zoom == 0.0; }

    /// Pan in view units: x right, y forward. 1.0 is one full extent.
    Eigen::Vector2d pan;
    /// Relative zoom; positive zooms in.
    double zoom;
};

/// Applies per-axis inversion and then the deadzone to all six axes of
/// `sample`, without any sensitivity scaling. Indexed by device::Axis.
Vector6d ConditionAxes(const device::RawSample &sample,
                       const AxisConfig &config);

/// Maps a raw sample to a pan/zoom command. Pure: the result depends only
/// on the arguments.
///
/// Without swap_yz the left/right and forward/back axes pan and the
/// up/down axis zooms; with swap_yz forward/back and up/down trade places.
NavigationCommand Transform(const device::RawSample &sample,
                            const AxisConfig &config);

}  // namespace navigation
}  // namespace mapnav
