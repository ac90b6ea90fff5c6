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

// Entry points QGIS looks up when it loads the plugin library.

#include <qgis.h>
#include <qgisinterface.h>
#include <qgisplugin.h>

#include "mapnav/qgis/SpaceMousePlugin.h"

using mapnav::qgis::SpaceMousePlugin;

QGISEXTERN QgisPlugin *classFactory(QgisInterface *qgis_interface) {
    return new SpaceMousePlugin(qgis_interface);
}

QGISEXTERN const QString *name() { return &SpaceMousePlugin::kName; }

QGISEXTERN const QString *description() {
    return &SpaceMousePlugin::kDescription;
}

QGISEXTERN const QString *category() { return &SpaceMousePlugin::kCategory; }

QGISEXTERN int type() { return SpaceMousePlugin::kType; }

QGISEXTERN const QString *version() { return &SpaceMousePlugin::kVersion; }

QGISEXTERN const QString *icon() { return &SpaceMousePlugin::kIcon; }

QGISEXTERN void unload(QgisPlugin *plugin) { delete plugin; }
