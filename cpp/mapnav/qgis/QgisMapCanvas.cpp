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

#include "mapnav/qgis/QgisMapCanvas.h"

#include <qgsmapcanvas.h>
#include <qgspointxy.h>
#include <qgsrectangle.h>

namespace mapnav {
namespace qgis {

QgisMapCanvas::QgisMapCanvas(QgsMapCanvas &canvas) : canvas_(canvas) {}

Eigen::Vector2d QgisMapCanvas::GetExtentSize() const {
    const QgsRectangle extent = canvas_.extent();
    return Eigen::Vector2d(extent.width(), extent.height());
}

Eigen::Vector2d QgisMapCanvas::GetCenter() const {
    const QgsPointXY center = canvas_.center();
    return Eigen::Vector2d(center.x(), center.y());
}

void QgisMapCanvas::SetCenter(const Eigen::Vector2d &center) {
    canvas_.setCenter(QgsPointXY(center.x(), center.y()));
}

void QgisMapCanvas::ZoomByFactor(double factor) {
    canvas_.zoomByFactor(factor);
}

void QgisMapCanvas::Refresh() { canvas_.refresh(); }

}  // namespace qgis
}  // namespace mapnav
