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

#include "tests/Tests.h"

namespace mapnav {
namespace tests {

using device::Axis;
using device::RawSample;
using navigation::AxisConfig;
using navigation::NavigationCommand;
using navigation::Transform;

namespace {

RawSample MakeSample(float tx, float ty, float tz) {
    return RawSample(Eigen::Vector3f(tx, ty, tz), Zero3f);
}

AxisConfig MakeConfig(double deadzone, double pan, double zoom) {
    AxisConfig config;
    config.deadzone = deadzone;
    config.pan_sensitivity = pan;
    config.zoom_sensitivity = zoom;
    return config;
}

}  // namespace

TEST(NavigationTransform, PanExample) {
    AxisConfig config = MakeConfig(0.1, 2.0, 1.0);
    NavigationCommand command = Transform(MakeSample(0.5f, 0, 0), config);
    ExpectEQ(command.pan, Eigen::Vector2d(1.0, 0.0));
    EXPECT_DOUBLE_EQ(command.zoom, 0.0);

    config.SetInverted(Axis::TX, true);
    command = Transform(MakeSample(0.5f, 0, 0), config);
    ExpectEQ(command.pan, Eigen::Vector2d(-1.0, 0.0));
}

TEST(NavigationTransform, InvertNegatesEachAxis) {
    RawSample sample = MakeSample(0.4f, -0.3f, 0.6f);
    AxisConfig plain = MakeConfig(0.05, 1.0, 1.0);
    NavigationCommand reference = Transform(sample, plain);

    AxisConfig invert_x = plain;
    invert_x.SetInverted(Axis::TX, true);
    NavigationCommand command = Transform(sample, invert_x);
    EXPECT_DOUBLE_EQ(command.pan.x(), -reference.pan.x());
    EXPECT_DOUBLE_EQ(command.pan.y(), reference.pan.y());
    EXPECT_DOUBLE_EQ(command.zoom, reference.zoom);

    AxisConfig invert_y = plain;
    invert_y.SetInverted(Axis::TY, true);
    command = Transform(sample, invert_y);
    EXPECT_DOUBLE_EQ(command.pan.y(), -reference.pan.y());

    AxisConfig invert_z = plain;
    invert_z.SetInverted(Axis::TZ, true);
    command = Transform(sample, invert_z);
    EXPECT_DOUBLE_EQ(command.zoom, -reference.zoom);
}

TEST(NavigationTransform, Deadzone) {
    AxisConfig config = MakeConfig(0.1, 1.0, 1.0);

    NavigationCommand command =
            Transform(MakeSample(0.09f, -0.05f, 0.099f), config);
    EXPECT_TRUE(command.IsZero());

    // Each axis is thresholded on its own.
    command = Transform(MakeSample(0.09f, 0.5f, 0.0f), config);
    EXPECT_DOUBLE_EQ(command.pan.x(), 0.0);
    EXPECT_NEAR(command.pan.y(), 0.5, THRESHOLD_1E_6);

    // A magnitude at the deadzone passes.
    config.deadzone = 0.5;
    command = Transform(MakeSample(0.5f, 0, 0), config);
    EXPECT_NEAR(command.pan.x(), 0.5, THRESHOLD_1E_6);
}

TEST(NavigationTransform, DeadzoneAppliesAfterInvert) {
    AxisConfig config = MakeConfig(0.1, 1.0, 1.0);
    config.SetInverted(Axis::TY, true);
    NavigationCommand command = Transform(MakeSample(0, -0.05f, 0), config);
    EXPECT_TRUE(command.IsZero());
}

TEST(NavigationTransform, SensitivityScalesLinearly) {
    RawSample sample = MakeSample(0.3f, -0.7f, 0.45f);
    AxisConfig unit = MakeConfig(0.05, 1.0, 1.0);
    NavigationCommand reference = Transform(sample, unit);

    for (double s : {0.001, 0.005, 0.1, 2.0}) {
        AxisConfig scaled = MakeConfig(0.05, s, s);
        NavigationCommand command = Transform(sample, scaled);
        ExpectEQ(command.pan, Eigen::Vector2d(reference.pan * s));
        EXPECT_NEAR(command.zoom, reference.zoom * s, THRESHOLD_1E_6);
    }
}

TEST(NavigationTransform, SwapExchangesPanAndZoomAxes) {
    RawSample sample = MakeSample(0.0f, 0.3f, 0.8f);
    AxisConfig config = MakeConfig(0.05, 1.0, 1.0);

    NavigationCommand normal = Transform(sample, config);
    EXPECT_NEAR(normal.pan.y(), 0.3, THRESHOLD_1E_6);
    EXPECT_NEAR(normal.zoom, 0.8, THRESHOLD_1E_6);

    config.swap_yz = true;
    NavigationCommand swapped = Transform(sample, config);
    EXPECT_NEAR(swapped.pan.y(), 0.8, THRESHOLD_1E_6);
    EXPECT_NEAR(swapped.zoom, 0.3, THRESHOLD_1E_6);
    EXPECT_DOUBLE_EQ(swapped.pan.x(), normal.pan.x());
}

TEST(NavigationTransform, RotationDoesNotNavigate) {
    RawSample sample(Zero3f, Eigen::Vector3f(0.9f, -0.9f, 0.9f));
    EXPECT_TRUE(Transform(sample, AxisConfig()).IsZero());
}

TEST(NavigationTransform, ConditionAxes) {
    RawSample sample(Eigen::Vector3f(0.5f, 0.01f, -0.5f),
                     Eigen::Vector3f(0.25f, 0.0f, -0.02f));
    AxisConfig config = MakeConfig(0.05, 1.0, 1.0);
    config.SetInverted(Axis::TZ, true);
    config.SetInverted(Axis::RX, true);

    navigation::Vector6d expected;
    expected << 0.5, 0.0, 0.5, -0.25, 0.0, 0.0;
    ExpectEQ(navigation::ConditionAxes(sample, config), expected);
}

}  // namespace tests
}  // namespace mapnav
