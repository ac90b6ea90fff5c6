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

#include "mapnav/host/MapCanvas.h"

class QgsMapCanvas;

namespace mapnav {
namespace qgis {

/// MapCanvas view of the QGIS main map canvas. Does not own the canvas.
class QgisMapCanvas : public host::MapCanvas {
public:
    explicit QgisMapCanvas(QgsMapCanvas &canvas);
    ~QgisMapCanvas() override = default;

    Eigen::Vector2d GetExtentSize() const override;
    Eigen::Vector2d GetCenter() const override;
    void SetCenter(const Eigen::Vector2d &center) override;
    void ZoomByFactor(double factor) override;
    void Refresh() override;

private:
    QgsMapCanvas &canvas_;
};

}  // namespace qgis
}  // namespace mapnav
