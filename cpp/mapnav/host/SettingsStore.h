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

#include <map>
#include <string>

namespace mapnav {
namespace host {

/// String-keyed key-value store that persists across sessions. Keys use
/// '/' to separate groups, as QSettings does.
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    virtual bool Contains(const std::string &key) const = 0;
    /// Returns an empty string when the key is absent.
    virtual std::string GetValue(const std::string &key) const = 0;
    virtual void SetValue(const std::string &key, const std::string &value) = 0;
    virtual void Remove(const std::string &key) = 0;
    /// Flushes pending writes to permanent storage.
    virtual void Sync() {}
};

class MemorySettingsStore : public SettingsStore {
public:
    MemorySettingsStore() = default;
    ~MemorySettingsStore() override = default;

    bool Contains(const std::string &key) const override;
    std::string GetValue(const std::string &key) const override;
    void SetValue(const std::string &key, const std::string &value) override;
    void Remove(const std::string &key) override;

    size_t Size() const { return values_.size(); }
    const std::map<std::string, std::string> &GetValues() const {
        return values_;
    }

private:
    std::map<std::string, std::string> values_;
};

}  // namespace host
}  // namespace mapnav
