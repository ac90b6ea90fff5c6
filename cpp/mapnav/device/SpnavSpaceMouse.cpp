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

#include <poll.h>
#include <spnav.h>

#include "mapnav/device/DeviceErrors.h"
#include "mapnav/device/HidReport.h"
#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace device {

namespace {

// Bounds one Poll() so a flooding daemon cannot stall the UI thread.
constexpr int kMaxEventsPerPoll = 64;

}  // namespace

Eigen::Vector3f SpnavToReportOrientation(int x, int y, int z) {
    return Eigen::Vector3f(static_cast<float>(x), static_cast<float>(-z),
                           static_cast<float>(-y)) /
           kAxisFullScale;
}

SpnavSpaceMouse::SpnavSpaceMouse() {}

SpnavSpaceMouse::~SpnavSpaceMouse() { Close(); }

void SpnavSpaceMouse::Open() {
    if (ready_) {
        return;
    }
    if (spnav_open() < 0) {
        throw DeviceNotFoundError(
                "Cannot connect to spacenavd. Make sure the daemon is "
                "running and the SpaceMouse is plugged in.");
    }
    ready_ = true;
    state_ = RawSample();
    utility::LogInfo("Connected to spacenavd.");
}

void SpnavSpaceMouse::Close() {
    if (!ready_) {
        return;
    }
    spnav_close();
    ready_ = false;
    utility::LogInfo("Disconnected from spacenavd.");
}

std::string SpnavSpaceMouse::GetDeviceName() const {
    return ready_ ? std::string("spacenavd") : std::string();
}

// spnav_poll_event() cannot tell an idle daemon from a dead one, so look at
// the socket itself.
void SpnavSpaceMouse::CheckConnection() const {
    int fd = spnav_fd();
    if (fd < 0) {
        throw DeviceIOError("Lost connection to spacenavd.");
    }
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (::poll(&pfd, 1, 0) < 0 ||
        (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
        throw DeviceIOError("Lost connection to spacenavd.");
    }
}

bool SpnavSpaceMouse::Poll(RawSample &sample) {
    if (!ready_) {
        throw DeviceIOError("spacenavd connection is not open.");
    }

    bool updated = false;
    spnav_event evt;
    for (int i = 0; i < kMaxEventsPerPoll && spnav_poll_event(&evt) != 0;
         ++i) {
        if (evt.type == SPNAV_EVENT_MOTION) {
            state_.translation = SpnavToReportOrientation(
                    evt.motion.x, evt.motion.y, evt.motion.z);
            state_.rotation = SpnavToReportOrientation(
                    evt.motion.rx, evt.motion.ry, evt.motion.rz);
            updated = true;
        } else if (evt.type == SPNAV_EVENT_BUTTON) {
            int bnum = evt.button.bnum;
            if (bnum >= 0 && bnum < 32) {
                if (evt.button.press != 0) {
                    state_.buttons |= (1u << bnum);
                } else {
                    state_.buttons &= ~(1u << bnum);
                }
                updated = true;
            }
        }
    }
    if (!updated) {
        CheckConnection();
        return false;
    }
    sample = state_;
    return true;
}

}  // namespace device
}  // namespace mapnav
