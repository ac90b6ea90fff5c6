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

#include "mapnav/device/HidReport.h"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <vector>

#include "tests/Tests.h"

namespace mapnav {
namespace tests {

using device::HidReportDecoder;
using device::ReportType;

namespace {

// Hands out queued reports the way a non-blocking hid_read() does.
class ReportQueue {
public:
    void Push(const std::vector<uint8_t> &report) { reports_.push_back(report); }

    device::ReportReader Reader() {
        return [this](uint8_t *buffer, size_t size) {
            ++reads_;
            if (reports_.empty()) {
                return 0;
            }
            std::vector<uint8_t> report = reports_.front();
            reports_.pop_front();
            size_t length = std::min(report.size(), size);
            std::copy(report.begin(), report.begin() + length, buffer);
            return static_cast<int>(length);
        };
    }

    int GetReadCount() const { return reads_; }
    size_t Pending() const { return reports_.size(); }

private:
    std::deque<std::vector<uint8_t>> reports_;
    int reads_ = 0;
};

}  // namespace

TEST(HidReport, DecodeAxis) {
    EXPECT_FLOAT_EQ(device::DecodeAxis(0x00, 0x00), 0.0f);
    // 350
    EXPECT_FLOAT_EQ(device::DecodeAxis(0x5e, 0x01), 1.0f);
    // -350
    EXPECT_FLOAT_EQ(device::DecodeAxis(0xa2, 0xfe), -1.0f);
    // -1
    EXPECT_FLOAT_EQ(device::DecodeAxis(0xff, 0xff), -1.0f / 350.0f);
}

TEST(HidReport, Translation) {
    HidReportDecoder decoder;
    std::vector<uint8_t> report = {0x01, 0x5e, 0x01, 0xa2, 0xfe, 0xaf, 0x00};

    EXPECT_EQ(decoder.Decode(report.data(), report.size()),
              ReportType::Translation);
    ExpectEQ(decoder.GetSample().translation,
             Eigen::Vector3f(1.0f, -1.0f, 175.0f / 350.0f));
    ExpectEQ(decoder.GetSample().rotation, Zero3f);
}

TEST(HidReport, TranslationAndRotation) {
    HidReportDecoder decoder;
    std::vector<uint8_t> report = {0x01, 0x5e, 0x01, 0x00, 0x00, 0x00, 0x00,
                                   0x00, 0x00, 0xa2, 0xfe, 0x00, 0x00};

    EXPECT_EQ(decoder.Decode(report.data(), report.size()),
              ReportType::TranslationRotation);
    ExpectEQ(decoder.GetSample().translation, Eigen::Vector3f(1.0f, 0, 0));
    ExpectEQ(decoder.GetSample().rotation, Eigen::Vector3f(0, -1.0f, 0));
}

TEST(HidReport, RotationKeepsTranslation) {
    HidReportDecoder decoder;
    std::vector<uint8_t> translation = {0x01, 0x00, 0x00, 0x5e,
                                        0x01, 0x00, 0x00};
    std::vector<uint8_t> rotation = {0x02, 0x00, 0x00, 0x00,
                                     0x00, 0x5e, 0x01};

    decoder.Decode(translation.data(), translation.size());
    EXPECT_EQ(decoder.Decode(rotation.data(), rotation.size()),
              ReportType::Rotation);
    ExpectEQ(decoder.GetSample().translation, Eigen::Vector3f(0, 1.0f, 0));
    ExpectEQ(decoder.GetSample().rotation, Eigen::Vector3f(0, 0, 1.0f));
}

TEST(HidReport, Buttons) {
    HidReportDecoder decoder;
    std::vector<uint8_t> report = {0x03, 0x03, 0x01};

    EXPECT_EQ(decoder.Decode(report.data(), report.size()),
              ReportType::Buttons);
    EXPECT_EQ(decoder.GetSample().buttons, 0x0103u);
    EXPECT_TRUE(decoder.GetSample().IsButtonPressed(0));
    EXPECT_TRUE(decoder.GetSample().IsButtonPressed(1));
    EXPECT_FALSE(decoder.GetSample().IsButtonPressed(2));
    EXPECT_TRUE(decoder.GetSample().IsButtonPressed(8));

    std::vector<uint8_t> release = {0x03, 0x00, 0x00};
    decoder.Decode(release.data(), release.size());
    EXPECT_EQ(decoder.GetSample().buttons, 0u);
}

TEST(HidReport, ShortAndUnknownReportsAreIgnored) {
    HidReportDecoder decoder;
    std::vector<uint8_t> motion = {0x01, 0x5e, 0x01, 0x00, 0x00, 0x00, 0x00};
    decoder.Decode(motion.data(), motion.size());

    std::vector<uint8_t> short_translation = {0x01, 0x00, 0x00, 0x00};
    std::vector<uint8_t> short_buttons = {0x03};
    std::vector<uint8_t> battery = {0x17, 0x64, 0x00, 0x00, 0x00, 0x00, 0x00};

    EXPECT_EQ(decoder.Decode(short_translation.data(),
                             short_translation.size()),
              ReportType::Ignored);
    EXPECT_EQ(decoder.Decode(short_buttons.data(), short_buttons.size()),
              ReportType::Ignored);
    EXPECT_EQ(decoder.Decode(battery.data(), battery.size()),
              ReportType::Ignored);
    EXPECT_EQ(decoder.Decode(nullptr, 0), ReportType::Ignored);

    ExpectEQ(decoder.GetSample().translation, Eigen::Vector3f(1.0f, 0, 0));
}

TEST(HidReport, Reset) {
    HidReportDecoder decoder;
    std::vector<uint8_t> report = {0x01, 0x5e, 0x01, 0x5e, 0x01, 0x5e, 0x01};
    decoder.Decode(report.data(), report.size());
    decoder.Reset();
    ExpectEQ(decoder.GetSample().translation, Zero3f);
    EXPECT_EQ(decoder.GetSample().buttons, 0u);
}

TEST(HidReport, DecodePendingKeepsLatestState) {
    HidReportDecoder decoder;
    ReportQueue queue;
    queue.Push({0x01, 0x5e, 0x01, 0x00, 0x00, 0x00, 0x00});
    queue.Push({0x02, 0x00, 0x00, 0xa2, 0xfe, 0x00, 0x00});
    queue.Push({0x01, 0x00, 0x00, 0x00, 0x00, 0x5e, 0x01});

    EXPECT_TRUE(decoder.DecodePending(queue.Reader(), 64));
    EXPECT_EQ(queue.Pending(), 0u);
    // Three reports plus the empty read that ends the drain.
    EXPECT_EQ(queue.GetReadCount(), 4);
    ExpectEQ(decoder.GetSample().translation, Eigen::Vector3f(0, 0, 1.0f));
    ExpectEQ(decoder.GetSample().rotation, Eigen::Vector3f(0, -1.0f, 0));
}

TEST(HidReport, DecodePendingIsBounded) {
    HidReportDecoder decoder;
    ReportQueue queue;
    for (int i = 0; i < 100; ++i) {
        queue.Push({0x01, 0x5e, 0x01, 0x00, 0x00, 0x00, 0x00});
    }

    EXPECT_TRUE(decoder.DecodePending(queue.Reader(), 64));
    EXPECT_EQ(queue.GetReadCount(), 64);
    EXPECT_EQ(queue.Pending(), 36u);
}

TEST(HidReport, DecodePendingWithNothingUseful) {
    HidReportDecoder decoder;
    ReportQueue queue;
    EXPECT_FALSE(decoder.DecodePending(queue.Reader(), 64));
    EXPECT_EQ(queue.GetReadCount(), 1);

    // Battery and truncated reports do not count as updates.
    queue.Push({0x17, 0x64});
    queue.Push({0x01, 0x5e, 0x01});
    EXPECT_FALSE(decoder.DecodePending(queue.Reader(), 64));
    ExpectEQ(decoder.GetSample().translation, Zero3f);
}

TEST(HidReport, DecodePendingPropagatesReadErrors) {
    HidReportDecoder decoder;
    EXPECT_THROW(decoder.DecodePending(
                         [](uint8_t *, size_t) -> int {
                             throw std::runtime_error("device unplugged");
                         },
                         64),
                 std::runtime_error);
}

}  // namespace tests
}  // namespace mapnav
