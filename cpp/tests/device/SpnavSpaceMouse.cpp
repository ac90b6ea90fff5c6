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

#include "mapnav/device/SpnavSpaceMouse.h"

#include "mapnav/device/DeviceErrors.h"
#include "mapnav/device/HidReport.h"
#include "tests/Tests.h"

namespace mapnav {
namespace tests {

using device::SpnavToReportOrientation;

TEST(SpnavSpaceMouse, ReportOrientation) {
    ExpectEQ(SpnavToReportOrientation(0, 0, 0), Zero3f);
    // x is kept, spacenavd y becomes -z and z becomes -y.
    ExpectEQ(SpnavToReportOrientation(350, 0, 0),
             Eigen::Vector3f(1.0f, 0, 0));
    ExpectEQ(SpnavToReportOrientation(0, 350, 0),
             Eigen::Vector3f(0, 0, -1.0f));
    ExpectEQ(SpnavToReportOrientation(0, 0, 350),
             Eigen::Vector3f(0, -1.0f, 0));
    ExpectEQ(SpnavToReportOrientation(-175, 70, -350),
             Eigen::Vector3f(-0.5f, 1.0f, -0.2f));
}

TEST(SpnavSpaceMouse, ReportOrientationMatchesHidScale) {
    // A full deflection reads the same through either backend.
    Eigen::Vector3f spnav = SpnavToReportOrientation(350, -350, 350);
    EXPECT_FLOAT_EQ(spnav(0), device::DecodeAxis(0x5e, 0x01));
    EXPECT_FLOAT_EQ(spnav(1), device::DecodeAxis(0xa2, 0xfe));
    EXPECT_FLOAT_EQ(spnav(2), device::DecodeAxis(0x5e, 0x01));
}

TEST(SpnavSpaceMouse, ClosedReader) {
    device::SpnavSpaceMouse mouse;
    EXPECT_FALSE(mouse.IsOpen());
    EXPECT_EQ(mouse.GetDeviceName(), "");
    EXPECT_EQ(mouse.GetBackend(), device::DeviceBackend::Spnav);
    device::RawSample sample;
    EXPECT_THROW(mouse.Poll(sample), device::DeviceIOError);
    mouse.Close();
}

}  // namespace tests
}  // namespace mapnav
