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

#include <string>

#include "mapnav/device/SpaceMouse.h"

namespace mapnav {
namespace device {

/// Converts a spacenavd motion triple to the axis orientation of the
/// device's own HID reports, scaled by kAxisFullScale. spacenavd reports y up
/// and z towards the screen, so (x, y, z) becomes (x, -z, -y).
Eigen::Vector3f SpnavToReportOrientation(int x, int y, int z);

/// Reads a 3D mouse through the spacenavd daemon. Use this backend when the
/// daemon already owns the device and raw HID access is not possible.
class SpnavSpaceMouse : public SpaceMouse {
public:
    SpnavSpaceMouse();
    ~SpnavSpaceMouse() override;

    void Open() override;
    void Close() override;
    bool IsOpen() const override { return ready_; }
    bool Poll(RawSample &sample) override;
    std::string GetDeviceName() const override;
    DeviceBackend GetBackend() const override { return DeviceBackend::Spnav; }

private:
    void CheckConnection() const;

private:
    bool ready_ = false;
    RawSample state_;
};

}  // namespace device
}  // namespace mapnav
