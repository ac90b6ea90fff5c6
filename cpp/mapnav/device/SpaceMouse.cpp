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

#include "mapnav/device/SpaceMouse.h"

#include "mapnav/device/HidSpaceMouse.h"
#include "mapnav/device/SpnavSpaceMouse.h"
#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace device {

const char *GetBackendName(DeviceBackend backend) {
    switch (backend) {
        case DeviceBackend::Hid:
            return "hid";
        case DeviceBackend::Spnav:
            return "spnav";
    }
    return "unknown";
}

bool ParseBackendName(const std::string &name, DeviceBackend &backend) {
    if (name == "hid") {
        backend = DeviceBackend::Hid;
        return true;
    }
    if (name == "spnav") {
        backend = DeviceBackend::Spnav;
        return true;
    }
    return false;
}

std::unique_ptr<SpaceMouse> CreateSpaceMouse(DeviceBackend backend) {
    switch (backend) {
        case DeviceBackend::Hid:
            return std::unique_ptr<SpaceMouse>(new HidSpaceMouse());
        case DeviceBackend::Spnav:
            return std::unique_ptr<SpaceMouse>(new SpnavSpaceMouse());
    }
    utility::LogError("Unsupported device backend {}.",
                      static_cast<int>(backend));
}

}  // namespace device
}  // namespace mapnav
