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

#include "mapnav/device/HidSpaceMouse.h"

#include <hidapi.h>

#include <vector>

#include "mapnav/device/DeviceErrors.h"
#include "mapnav/device/DeviceIds.h"
#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace device {

namespace {

// Upper bound on reports drained per Poll(), so a flooding device cannot
// stall the UI thread.
constexpr int kMaxReportsPerPoll = 64;

// hidapi reports strings as wchar_t. Device names are ASCII in practice;
// anything else is replaced.
std::string Narrow(const wchar_t *str) {
    std::string out;
    if (str == nullptr) {
        return out;
    }
    for (; *str != L'\0'; ++str) {
        out.push_back(static_cast<unsigned long>(*str) < 0x80
                              ? static_cast<char>(*str)
                              : '?');
    }
    return out;
}

std::string HidErrorString(hid_device *device) {
    const wchar_t *err = hid_error(device);
    return err == nullptr ? std::string("unknown error") : Narrow(err);
}

std::vector<DeviceDescriptor> EnumerateSpaceMice() {
    std::vector<DeviceDescriptor> candidates;
    hid_device_info *devices = hid_enumerate(0, 0);
    for (hid_device_info *cur = devices; cur != nullptr; cur = cur->next) {
        DeviceDescriptor descriptor;
        descriptor.vendor_id = cur->vendor_id;
        descriptor.product_id = cur->product_id;
        descriptor.manufacturer = Narrow(cur->manufacturer_string);
        descriptor.product = Narrow(cur->product_string);
        descriptor.path = cur->path != nullptr ? cur->path : "";
        if (IsSpaceMouse(descriptor)) {
            candidates.push_back(descriptor);
        }
    }
    hid_free_enumeration(devices);
    return candidates;
}

}  // namespace

HidSpaceMouse::HidSpaceMouse() {}

HidSpaceMouse::~HidSpaceMouse() {
    Close();
    if (hid_initialized_) {
        hid_exit();
    }
}

void HidSpaceMouse::Open() {
    if (device_ != nullptr) {
        return;
    }
    if (!hid_initialized_) {
        if (hid_init() != 0) {
            throw DeviceNotFoundError("Failed to initialize hidapi.");
        }
        hid_initialized_ = true;
    }

    std::vector<DeviceDescriptor> candidates = EnumerateSpaceMice();
    if (candidates.empty()) {
        throw DeviceNotFoundError(
                "No SpaceMouse device found. Make sure it's plugged in.");
    }

    int opened = OpenFirstCandidate(
            candidates, [this](const DeviceDescriptor &candidate) {
                hid_device *device =
                        candidate.path.empty()
                                ? hid_open(candidate.vendor_id,
                                           candidate.product_id, nullptr)
                                : hid_open_path(candidate.path.c_str());
                if (device == nullptr) {
                    utility::LogWarning(
                            "SpaceMouse {} cannot be opened. You may need to "
                            "update /etc/udev/rules.d",
                            DescribeDevice(candidate));
                    return false;
                }
                if (hid_set_nonblocking(device, 1) != 0) {
                    utility::LogWarning(
                            "Cannot switch {} to non-blocking reads: {}",
                            DescribeDevice(candidate), HidErrorString(device));
                    hid_close(device);
                    return false;
                }
                device_ = device;
                return true;
            });

    if (opened >= 0) {
        const DeviceDescriptor &candidate = candidates[static_cast<size_t>(opened)];
        device_name_ = candidate.manufacturer + "/" + candidate.product;
        decoder_.Reset();
        utility::LogInfo("Opened SpaceMouse {}", DescribeDevice(candidate));
        if (!candidate.path.empty()) {
            utility::LogDebug("Device path: {}", candidate.path);
        }
        return;
    }

    throw DeviceNotFoundError(fmt::format(
            "Found {} SpaceMouse device(s) but none could be opened.",
            candidates.size()));
}

void HidSpaceMouse::Close() {
    if (device_ == nullptr) {
        return;
    }
    hid_close(device_);
    device_ = nullptr;
    utility::LogInfo("Closed SpaceMouse {}", device_name_);
    device_name_.clear();
}

bool HidSpaceMouse::Poll(RawSample &sample) {
    if (device_ == nullptr) {
        throw DeviceIOError("SpaceMouse is not open.");
    }

    bool updated = decoder_.DecodePending(
            [this](uint8_t *buffer, size_t size) {
                int res = hid_read(device_, buffer, size);
                if (res < 0) {
                    throw DeviceIOError(
                            fmt::format("Failed to read from {}: {}",
                                        device_name_,
                                        HidErrorString(device_)));
                }
                return res;
            },
            kMaxReportsPerPoll);

    if (updated) {
        sample = decoder_.GetSample();
    }
    return updated;
}

}  // namespace device
}  // namespace mapnav
