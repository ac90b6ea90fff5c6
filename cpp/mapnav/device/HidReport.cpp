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
#include <array>

#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace device {

namespace {

constexpr uint8_t kTranslationReportId = 1;
constexpr uint8_t kRotationReportId = 2;
constexpr uint8_t kButtonReportId = 3;

constexpr size_t kAxisReportLength = 7;
constexpr size_t kCombinedReportLength = 13;
constexpr size_t kMaxReportLength = 64;

Eigen::Vector3f DecodeVector(const uint8_t *data) {
    return Eigen::Vector3f(DecodeAxis(data[0], data[1]),
                           DecodeAxis(data[2], data[3]),
                           DecodeAxis(data[4], data[5]));
}

}  // namespace

float DecodeAxis(uint8_t low, uint8_t high) {
    int value = low | (high << 8);
    if (value >= 32768) {
        value -= 65536;
    }
    return static_cast<float>(value) / kAxisFullScale;
}

ReportType HidReportDecoder::Decode(const uint8_t *data, size_t length) {
    if (data == nullptr || length == 0) {
        return ReportType::Ignored;
    }

    switch (data[0]) {
        case kTranslationReportId:
            if (length < kAxisReportLength) {
                break;
            }
            sample_.translation = DecodeVector(data + 1);
            if (length >= kCombinedReportLength) {
                sample_.rotation = DecodeVector(data + 7);
                return ReportType::TranslationRotation;
            }
            return ReportType::Translation;
        case kRotationReportId:
            if (length < kAxisReportLength) {
                break;
            }
            sample_.rotation = DecodeVector(data + 1);
            return ReportType::Rotation;
        case kButtonReportId: {
            if (length < 2) {
                break;
            }
            uint32_t buttons = 0;
            size_t count = std::min<size_t>(length - 1, 4);
            for (size_t i = 0; i < count; ++i) {
                buttons |= static_cast<uint32_t>(data[i + 1]) << (8 * i);
            }
            sample_.buttons = buttons;
            return ReportType::Buttons;
        }
        default:
            break;
    }

    utility::LogDebug("Ignoring HID report {} of length {}.", data[0], length);
    return ReportType::Ignored;
}

bool HidReportDecoder::DecodePending(const ReportReader &read,
                                     int max_reports) {
    std::array<uint8_t, kMaxReportLength> report;
    bool updated = false;
    for (int i = 0; i < max_reports; ++i) {
        int res = read(report.data(), report.size());
        if (res <= 0) {
            break;
        }
        size_t length = std::min(static_cast<size_t>(res), report.size());
        if (Decode(report.data(), length) != ReportType::Ignored) {
            updated = true;
        }
    }
    return updated;
}

}  // namespace device
}  // namespace mapnav
