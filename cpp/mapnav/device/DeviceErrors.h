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

#include <stdexcept>
#include <string>

namespace mapnav {
namespace device {

class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string &message)
        : std::runtime_error(message) {}
};

/// No SpaceMouse is connected, or none of the candidates could be opened.
/// Recoverable: the next poll tries again.
class DeviceNotFoundError : public DeviceError {
public:
    explicit DeviceNotFoundError(const std::string &message)
        : DeviceError(message) {}
};

/// The open handle became invalid, typically because the device was
/// unplugged. The reader must be closed and opened again.
class DeviceIOError : public DeviceError {
public:
    explicit DeviceIOError(const std::string &message)
        : DeviceError(message) {}
};

}  // namespace device
}  // namespace mapnav
