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

#include <cstddef>
#include <cstdint>
#include <functional>

#include "mapnav/device/RawSample.h"

namespace mapnav {
namespace device {

/// Divisor that maps a raw 16-bit axis value to roughly [-1, 1].
constexpr float kAxisFullScale = 350.0f;

enum class ReportType {
    Translation,          ///< id 1, 7 bytes
    TranslationRotation,  ///< id 1, 13 bytes (newer devices)
    Rotation,             ///< id 2
    Buttons,              ///< id 3
    Ignored,              ///< battery, short or unknown reports
};

/// Converts a little-endian signed 16-bit axis word to a normalized value.
float DecodeAxis(uint8_t low, uint8_t high);

/// Copies the next pending report into `buffer` and returns its length, or 0
/// when nothing is pending. Read errors are thrown, not returned.
using ReportReader = std::function<int(uint8_t *buffer, size_t size)>;

/// Decodes raw 3Dconnexion HID reports. The device sends translation,
/// rotation and button reports independently, so the decoder keeps the
/// latest value of each and GetSample() always returns all six axes.
class HidReportDecoder {
public:
    HidReportDecoder() = default;

    /// Updates the state from one report. Returns Ignored, and leaves the
    /// state untouched, for anything it does not understand.
    ReportType Decode(const uint8_t *data, size_t length);

    /// Decodes reports from `read` until it returns 0 or `max_reports` have
    /// been read. Returns true if at least one of them was not ignored.
    bool DecodePending(const ReportReader &read, int max_reports);

    const RawSample &GetSample() const { return sample_; }
    void Reset() { sample_ = RawSample(); }

private:
    RawSample sample_;
};

}  // namespace device
}  // namespace mapnav
