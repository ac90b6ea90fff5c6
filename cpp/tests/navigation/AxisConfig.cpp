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

#include "mapnav/navigation/AxisConfig.h"

#include "tests/Tests.h"

namespace mapnav {
namespace tests {

using device::Axis;
using navigation::AxisConfig;

TEST(AxisConfig, Defaults) {
    AxisConfig config;
    for (int i = 0; i < device::kNumAxes; ++i) {
        EXPECT_FALSE(config.IsInverted(static_cast<Axis>(i)));
    }
    EXPECT_FALSE(config.swap_yz);
    EXPECT_DOUBLE_EQ(config.deadzone, 0.05);
    EXPECT_DOUBLE_EQ(config.pan_sensitivity, 0.005);
    EXPECT_DOUBLE_EQ(config.zoom_sensitivity, 0.01);
}

TEST(AxisConfig, Equality) {
    AxisConfig a;
    AxisConfig b;
    EXPECT_EQ(a, b);

    b.SetInverted(Axis::RY, true);
    EXPECT_NE(a, b);
    EXPECT_TRUE(b.IsInverted(Axis::RY));

    b = a;
    b.zoom_sensitivity = 0.02;
    EXPECT_NE(a, b);
}

TEST(AxisConfig, ToString) {
    AxisConfig config;
    config.SetInverted(Axis::TX, true);
    config.SetInverted(Axis::TZ, true);
    config.swap_yz = true;
    std::string text = config.ToString();
    EXPECT_NE(text.find("invert=[tx,tz]"), std::string::npos) << text;
    EXPECT_NE(text.find("swap_yz=true"), std::string::npos) << text;
}

}  // namespace tests
}  // namespace mapnav
