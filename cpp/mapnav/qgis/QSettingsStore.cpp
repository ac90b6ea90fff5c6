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

#include "mapnav/qgis/QSettingsStore.h"

#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace qgis {

bool QSettingsStore::Contains(const std::string &key) const {
    return settings_.contains(QString::fromStdString(key));
}

std::string QSettingsStore::GetValue(const std::string &key) const {
    return settings_.value(QString::fromStdString(key)).toString().toStdString();
}

void QSettingsStore::SetValue(const std::string &key,
                              const std::string &value) {
    settings_.setValue(QString::fromStdString(key),
                       QString::fromStdString(value));
}

void QSettingsStore::Remove(const std::string &key) {
    settings_.remove(QString::fromStdString(key));
}

void QSettingsStore::Sync() {
    settings_.sync();
    if (settings_.status() != QSettings::NoError) {
        utility::LogWarning("Could not write settings to {}.",
                            settings_.fileName().toStdString());
    }
}

}  // namespace qgis
}  // namespace mapnav
