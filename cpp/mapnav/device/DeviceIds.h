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

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace mapnav {
namespace device {

/// 3Dconnexion (newer devices).
constexpr uint16_t k3DconnexionVendorId = 0x256f;
/// Logitech, which sold the older 3Dconnexion devices.
constexpr uint16_t kLogitechVendorId = 0x046d;

const std::vector<uint16_t> &GetSpaceMouseVendorIds();
const std::vector<uint16_t> &GetSpaceMouseProductIds();

/// What HID enumeration tells about a device before it is opened.
struct DeviceDescriptor {
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    std::string manufacturer;
    std::string product;
    std::string path;
};

/// True for a 3Dconnexion manufacturer string, a product name containing
/// "space", or a known vendor/product id pair.
bool IsSpaceMouse(const DeviceDescriptor &descriptor);

/// "Manufacturer/Product (VID:PID)" for log messages.
std::string DescribeDevice(const DeviceDescriptor &descriptor);

/// Calls `try_open` on each candidate in order until one returns true.
/// Returns the index of that candidate, or -1 if every attempt failed.
int OpenFirstCandidate(
        const std::vector<DeviceDescriptor> &candidates,
        const std::function<bool(const DeviceDescriptor &)> &try_open);

}  // namespace device
}  // namespace mapnav
