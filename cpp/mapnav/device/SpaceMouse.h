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

#include <memory>
#include <string>

#include "mapnav/device/RawSample.h"

namespace mapnav {
namespace device {

enum class DeviceBackend {
    /// Raw HID reports read through hidapi.
    Hid,
    /// Events from the spacenavd daemon read through libspnav.
    Spnav,
};

const char *GetBackendName(DeviceBackend backend);
/// Parses "hid" or "spnav". Returns false and leaves `backend` untouched for
/// anything else.
bool ParseBackendName(const std::string &name, DeviceBackend &backend);

/// A 3D mouse reader driven from a periodic timer on the UI thread. None of
/// the calls may block for more than a few milliseconds.
class SpaceMouse {
public:
    SpaceMouse() = default;
    virtual ~SpaceMouse() = default;

    SpaceMouse(const SpaceMouse &) = delete;
    SpaceMouse &operator=(const SpaceMouse &) = delete;

    /// Opens the first matching device.
    /// Throws DeviceNotFoundError if there is none.
    virtual void Open() = 0;
    /// Releases the device. Safe to call when nothing is open.
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;

    /// Reads every report queued since the last call without blocking.
    /// Returns true and fills `sample` with the latest state if at least one
    /// motion or button report arrived, false if nothing happened.
    /// Throws DeviceIOError if the device went away.
    virtual bool Poll(RawSample &sample) = 0;

    /// Manufacturer/product of the open device, empty when closed.
    virtual std::string GetDeviceName() const = 0;
    virtual DeviceBackend GetBackend() const = 0;
};

std::unique_ptr<SpaceMouse> CreateSpaceMouse(DeviceBackend backend);

}  // namespace device
}  // namespace mapnav
