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

#include "mapnav/device/DeviceIds.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

namespace mapnav {
namespace device {

namespace {

std::string ToLower(const std::string &str) {
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool Contains(const std::vector<uint16_t> &ids, uint16_t id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // namespace

const std::vector<uint16_t> &GetSpaceMouseVendorIds() {
    static const std::vector<uint16_t> vendor_ids = {k3DconnexionVendorId,
                                                     kLogitechVendorId};
    return vendor_ids;
}

// Both vendors reuse part of the same product id range, so a single list is
// matched against either vendor.
const std::vector<uint16_t> &GetSpaceMouseProductIds() {
    static const std::vector<uint16_t> product_ids = {
            // 3Dconnexion
            0xc62e, 0xc62f, 0xc631, 0xc632, 0xc633, 0xc635, 0xc636, 0xc640,
            // Logitech/3Dconnexion
            0xc603, 0xc605, 0xc606, 0xc621, 0xc623, 0xc625, 0xc626, 0xc627,
            0xc628, 0xc629, 0xc62b};
    return product_ids;
}

bool IsSpaceMouse(const DeviceDescriptor &descriptor) {
    if (ToLower(descriptor.manufacturer).find("3dconnex") !=
        std::string::npos) {
        return true;
    }
    if (ToLower(descriptor.product).find("space") != std::string::npos) {
        return true;
    }
    return Contains(GetSpaceMouseVendorIds(), descriptor.vendor_id) &&
           Contains(GetSpaceMouseProductIds(), descriptor.product_id);
}

std::string DescribeDevice(const DeviceDescriptor &descriptor) {
    return fmt::format(
            "{}/{} ({:04x}:{:04x})",
            descriptor.manufacturer.empty() ? "Unknown"
                                            : descriptor.manufacturer,
            descriptor.product.empty() ? "Unknown" : descriptor.product,
            descriptor.vendor_id, descriptor.product_id);
}

int OpenFirstCandidate(
        const std::vector<DeviceDescriptor> &candidates,
        const std::function<bool(const DeviceDescriptor &)> &try_open) {
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (try_open(candidates[i])) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace device
}  // namespace mapnav
