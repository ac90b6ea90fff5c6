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

#include "mapnav/host/SimulatedMapCanvas.h"

#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace host {

SimulatedMapCanvas::SimulatedMapCanvas()
    : SimulatedMapCanvas(Eigen::Vector2d::Zero(), Eigen::Vector2d(360, 180)) {}

SimulatedMapCanvas::SimulatedMapCanvas(const Eigen::Vector2d &center,
                                       const Eigen::Vector2d &extent_size)
    : center_(center),
      extent_size_(extent_size),
      initial_width_(extent_size.x()) {
    if (extent_size.x() <= 0.0 || extent_size.y() <= 0.0) {
        utility::LogError("Invalid canvas extent {} x {}.", extent_size.x(),
                          extent_size.y());
    }
}

void SimulatedMapCanvas::SetCenter(const Eigen::Vector2d &center) {
    center_ = center;
}

// Zooms about the current center, the way QgsMapCanvas::zoomByFactor does
// when no explicit center is given.
void SimulatedMapCanvas::ZoomByFactor(double factor) {
    if (factor <= 0.0) {
        utility::LogWarning("Ignoring non-positive zoom factor {}.", factor);
        return;
    }
    extent_size_ *= factor;
    zoom_count_++;
}

void SimulatedMapCanvas::Refresh() { refresh_count_++; }

double SimulatedMapCanvas::GetScale() const {
    return extent_size_.x() / initial_width_;
}

}  // namespace host
}  // namespace mapnav
