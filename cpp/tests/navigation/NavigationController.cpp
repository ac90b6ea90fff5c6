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

#include "mapnav/navigation/NavigationController.h"

#include <deque>
#include <stdexcept>
#include <vector>

#include "mapnav/device/DeviceErrors.h"
#include "mapnav/host/SimulatedMapCanvas.h"
#include "mapnav/utility/Logging.h"
#include "tests/Tests.h"

namespace mapnav {
namespace tests {

using device::RawSample;
using navigation::DeviceStatus;
using navigation::NavigationCommand;
using navigation::NavigationController;

namespace {

// Scripted device state, owned by the test so it outlives the reader.
struct FakeDeviceState {
    bool open = false;
    int open_calls = 0;
    int close_calls = 0;
    int poll_calls = 0;
    bool fail_open = false;
    bool fail_next_poll = false;
    std::deque<RawSample> samples;
};

class FakeSpaceMouse : public device::SpaceMouse {
public:
    explicit FakeSpaceMouse(FakeDeviceState &state) : state_(state) {}
    ~FakeSpaceMouse() override = default;

    void Open() override {
        state_.open_calls++;
        if (state_.fail_open) {
            throw device::DeviceNotFoundError("No SpaceMouse device found");
        }
        state_.open = true;
    }
    void Close() override {
        if (state_.open) {
            state_.close_calls++;
        }
        state_.open = false;
    }
    bool IsOpen() const override { return state_.open; }
    bool Poll(RawSample &sample) override {
        state_.poll_calls++;
        if (state_.fail_next_poll) {
            state_.fail_next_poll = false;
            throw device::DeviceIOError("SpaceMouse unplugged");
        }
        if (state_.samples.empty()) {
            return false;
        }
        sample = state_.samples.front();
        state_.samples.pop_front();
        return true;
    }
    std::string GetDeviceName() const override {
        return state_.open ? "Fake/Puck" : "";
    }
    device::DeviceBackend GetBackend() const override {
        return device::DeviceBackend::Hid;
    }

private:
    FakeDeviceState &state_;
};

RawSample Translation(float tx, float ty, float tz) {
    return RawSample(Eigen::Vector3f(tx, ty, tz), Zero3f);
}

class NavigationControllerTest : public testing::Test {
protected:
    NavigationControllerTest()
        : controller_(std::unique_ptr<device::SpaceMouse>(
                              new FakeSpaceMouse(state_)),
                      canvas_) {
        controller_.SetStatusCallback(
                [this](DeviceStatus status, const std::string &message) {
                    transitions_.push_back(status);
                    messages_.push_back(message);
                });
    }

    FakeDeviceState state_;
    host::SimulatedMapCanvas canvas_;
    NavigationController controller_;
    std::vector<DeviceStatus> transitions_;
    std::vector<std::string> messages_;
};

}  // namespace

TEST(ApplyCommand, PanIsScaledByExtent) {
    host::SimulatedMapCanvas canvas(Eigen::Vector2d(10, 20),
                                    Eigen::Vector2d(100, 50));
    EXPECT_TRUE(navigation::ApplyCommand(
            NavigationCommand(Eigen::Vector2d(0.1, 0.2), 0.0), canvas));
    // Positive pan y lowers the center in map units.
    ExpectEQ(canvas.GetCenter(), Eigen::Vector2d(20, 10));
    EXPECT_EQ(canvas.GetZoomCount(), 0);
    EXPECT_EQ(canvas.GetRefreshCount(), 1);
}

TEST(ApplyCommand, Zoom) {
    host::SimulatedMapCanvas canvas;
    EXPECT_TRUE(
            navigation::ApplyCommand(NavigationCommand(Zero2d, 0.25), canvas));
    EXPECT_NEAR(canvas.GetScale(), 0.75, THRESHOLD_1E_6);
    ExpectEQ(canvas.GetCenter(), Zero2d);

    EXPECT_TRUE(
            navigation::ApplyCommand(NavigationCommand(Zero2d, -1.0), canvas));
    EXPECT_NEAR(canvas.GetScale(), 1.5, THRESHOLD_1E_6);
    EXPECT_EQ(canvas.GetRefreshCount(), 2);
}

TEST(ApplyCommand, ZoomFactorIsClamped) {
    host::SimulatedMapCanvas canvas;
    navigation::ApplyCommand(NavigationCommand(Zero2d, 5.0), canvas);
    EXPECT_NEAR(canvas.GetScale(), navigation::kMinZoomFactor,
                THRESHOLD_1E_6);
}

TEST(ApplyCommand, ZeroCommandLeavesCanvasAlone) {
    host::SimulatedMapCanvas canvas;
    EXPECT_FALSE(navigation::ApplyCommand(NavigationCommand(), canvas));
    EXPECT_EQ(canvas.GetRefreshCount(), 0);
}

TEST(NavigationController, RejectsNullDevice) {
    host::SimulatedMapCanvas canvas;
    EXPECT_THROW(NavigationController(nullptr, canvas), std::runtime_error);
}

TEST_F(NavigationControllerTest, DisabledTicksNeverTouchTheDevice) {
    state_.samples.push_back(Translation(1.0f, 0, 0));
    controller_.Tick();
    controller_.Tick();
    EXPECT_EQ(state_.open_calls, 0);
    EXPECT_EQ(state_.poll_calls, 0);
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::Disabled);
    EXPECT_EQ(canvas_.GetRefreshCount(), 0);
}

TEST_F(NavigationControllerTest, EnableConnectsAndPans) {
    controller_.Enable();
    EXPECT_TRUE(controller_.IsEnabled());
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::NotConnected);

    state_.samples.push_back(Translation(1.0f, 0, 0));
    controller_.Tick();

    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::Connected);
    EXPECT_EQ(controller_.GetStatusMessage(), "Connected to Fake/Puck");
    // 1.0 * 0.005 * 360
    ExpectEQ(canvas_.GetCenter(), Eigen::Vector2d(1.8, 0.0));
    EXPECT_EQ(canvas_.GetRefreshCount(), 1);
    EXPECT_EQ(controller_.GetAppliedCommandCount(), 1u);
}

TEST_F(NavigationControllerTest, ForwardPansUpAndUpZoomsIn) {
    controller_.Enable();
    state_.samples.push_back(Translation(0, 1.0f, 0));
    controller_.Tick();
    // -1.0 * 0.005 * 180
    ExpectEQ(canvas_.GetCenter(), Eigen::Vector2d(0.0, -0.9));

    state_.samples.push_back(Translation(0, 0, 1.0f));
    controller_.Tick();
    EXPECT_NEAR(canvas_.GetScale(), 0.99, THRESHOLD_1E_6);
    EXPECT_EQ(canvas_.GetZoomCount(), 1);
}

TEST_F(NavigationControllerTest, SwappedConfigZoomsWithForwardBack) {
    navigation::AxisConfig config;
    config.swap_yz = true;
    controller_.SetAxisConfig(config);
    controller_.Enable();

    state_.samples.push_back(Translation(0, 1.0f, 0));
    controller_.Tick();
    ExpectEQ(canvas_.GetCenter(), Zero2d);
    EXPECT_NEAR(canvas_.GetScale(), 0.99, THRESHOLD_1E_6);
}

TEST_F(NavigationControllerTest, MotionInsideDeadzoneDoesNothing) {
    controller_.Enable();
    state_.samples.push_back(Translation(0.01f, -0.02f, 0.04f));
    controller_.Tick();
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::Connected);
    EXPECT_EQ(canvas_.GetRefreshCount(), 0);
    EXPECT_EQ(controller_.GetAppliedCommandCount(), 0u);
}

TEST_F(NavigationControllerTest, MissingDeviceIsRetried) {
    state_.fail_open = true;
    controller_.Enable();
    controller_.Tick();
    controller_.Tick();

    EXPECT_TRUE(controller_.IsEnabled());
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::NotConnected);
    EXPECT_EQ(controller_.GetStatusMessage(), "No SpaceMouse device found");
    EXPECT_EQ(state_.open_calls, 2);
    EXPECT_EQ(state_.poll_calls, 0);

    state_.fail_open = false;
    state_.samples.push_back(Translation(1.0f, 0, 0));
    controller_.Tick();
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::Connected);
    EXPECT_EQ(canvas_.GetRefreshCount(), 1);
}

TEST_F(NavigationControllerTest, LostDeviceIsReopened) {
    controller_.Enable();
    controller_.Tick();
    ASSERT_EQ(controller_.GetStatus(), DeviceStatus::Connected);

    state_.fail_next_poll = true;
    {
        utility::VerbosityContextManager quiet(utility::VerbosityLevel::Error);
        controller_.Tick();
    }
    EXPECT_TRUE(controller_.IsEnabled());
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::NotConnected);
    EXPECT_FALSE(state_.open);
    EXPECT_EQ(state_.close_calls, 1);

    controller_.Tick();
    EXPECT_EQ(state_.open_calls, 2);
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::Connected);
}

TEST_F(NavigationControllerTest, CallbackOnlyOnTransitions) {
    state_.fail_open = true;
    controller_.Enable();
    controller_.Tick();
    controller_.Tick();
    controller_.Tick();
    state_.fail_open = false;
    controller_.Tick();
    controller_.Tick();
    controller_.Disable();

    std::vector<DeviceStatus> expected = {DeviceStatus::NotConnected,
                                          DeviceStatus::Connected,
                                          DeviceStatus::Disabled};
    EXPECT_EQ(transitions_, expected);
    EXPECT_EQ(messages_.front(), "Waiting for SpaceMouse");
}

TEST_F(NavigationControllerTest, StatusMessageFollowsTheLatestError) {
    controller_.Enable();
    EXPECT_EQ(controller_.GetStatusMessage(), "Waiting for SpaceMouse");

    state_.fail_open = true;
    controller_.Tick();
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::NotConnected);
    EXPECT_EQ(controller_.GetStatusMessage(), "No SpaceMouse device found");
    // Same status, so no extra callback.
    EXPECT_EQ(transitions_.size(), 1u);

    state_.fail_open = false;
    controller_.Tick();
    ASSERT_EQ(controller_.GetStatus(), DeviceStatus::Connected);
    state_.fail_next_poll = true;
    {
        utility::VerbosityContextManager quiet(utility::VerbosityLevel::Error);
        controller_.Tick();
    }
    EXPECT_EQ(controller_.GetStatusMessage(), "SpaceMouse unplugged");

    state_.fail_open = true;
    controller_.Tick();
    EXPECT_EQ(controller_.GetStatusMessage(), "No SpaceMouse device found");
    EXPECT_EQ(transitions_.size(), 3u);
}

TEST_F(NavigationControllerTest, DisableReleasesTheDevice) {
    controller_.Enable();
    controller_.Tick();
    ASSERT_TRUE(state_.open);

    controller_.Disable();
    EXPECT_FALSE(controller_.IsEnabled());
    EXPECT_FALSE(state_.open);
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::Disabled);

    state_.samples.push_back(Translation(1.0f, 0, 0));
    controller_.Tick();
    EXPECT_EQ(state_.open_calls, 1);
    EXPECT_EQ(canvas_.GetRefreshCount(), 0);
}

TEST_F(NavigationControllerTest, RescanReopens) {
    controller_.Enable();
    controller_.Tick();
    controller_.Rescan();
    EXPECT_FALSE(state_.open);
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::NotConnected);

    controller_.Tick();
    EXPECT_EQ(state_.open_calls, 2);
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::Connected);
}

TEST_F(NavigationControllerTest, SetDeviceClosesTheOldOne) {
    FakeDeviceState other;
    controller_.Enable();
    controller_.Tick();

    controller_.SetDevice(
            std::unique_ptr<device::SpaceMouse>(new FakeSpaceMouse(other)));
    EXPECT_FALSE(state_.open);
    EXPECT_EQ(controller_.GetStatus(), DeviceStatus::NotConnected);

    other.samples.push_back(Translation(1.0f, 0, 0));
    controller_.Tick();
    EXPECT_TRUE(other.open);
    EXPECT_EQ(canvas_.GetRefreshCount(), 1);
    // `other` goes out of scope before the fixture's controller.
    controller_.SetDevice(
            std::unique_ptr<device::SpaceMouse>(new FakeSpaceMouse(state_)));
}

TEST_F(NavigationControllerTest, ButtonChangesAreLogged) {
    LogCapture capture;
    utility::VerbosityContextManager verbose(utility::VerbosityLevel::Debug);
    controller_.Enable();
    state_.samples.push_back(RawSample(Zero3f, Zero3f, 0x2));
    controller_.Tick();
    EXPECT_TRUE(capture.Contains("SpaceMouse buttons 0x2"));
}

}  // namespace tests
}  // namespace mapnav
