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

#include "mapnav/host/MapCanvas.h"

namespace mapnav {
namespace host {

/// In-memory map view: a center point and an extent size that zooming
/// scales. Used by the console monitor and by tests.
class SimulatedMapCanvas : public MapCanvas {
public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    SimulatedMapCanvas();
    SimulatedMapCanvas(const Eigen::Vector2d &center,
                       const Eigen::Vector2d &extent_size);
    ~SimulatedMapCanvas() override = default;

    Eigen::Vector2d GetExtentSize() const override { return extent_size_; }
    Eigen::Vector2d GetCenter() const override { return center_; }
    void SetCenter(const Eigen::Vector2d &center) override;
    void ZoomByFactor(double factor) override;
    void Refresh() override;

    int GetRefreshCount() const { return refresh_count_; }
    int GetZoomCount() const { return zoom_count_; }
    /// Ratio between the current and the initial extent width.
    double GetScale() const;

private:
    Eigen::Vector2d center_;
    Eigen::Vector2d extent_size_;
    double initial_width_;
    int refresh_count_ = 0;
    int zoom_count_ = 0;
};

}  // namespace host
}  // namespace mapnav
