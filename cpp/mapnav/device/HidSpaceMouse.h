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

#include "mapnav/device/HidReport.h"
#include "mapnav/device/SpaceMouse.h"

struct hid_device_;

namespace mapnav {
namespace device {

/// Reads a SpaceMouse directly through hidapi. On Linux the hidraw node must
/// be readable by the user, which usually needs a udev rule.
class HidSpaceMouse : public SpaceMouse {
public:
    HidSpaceMouse();
    ~HidSpaceMouse() override;

    void Open() override;
    void Close() override;
    bool IsOpen() const override { return device_ != nullptr; }
    bool Poll(RawSample &sample) override;
    std::string GetDeviceName() const override { return device_name_; }
    DeviceBackend GetBackend() const override { return DeviceBackend::Hid; }

private:
    hid_device_ *device_ = nullptr;
    std::string device_name_;
    HidReportDecoder decoder_;
    bool hid_initialized_ = false;
};

}  // namespace device
}  // namespace mapnav
