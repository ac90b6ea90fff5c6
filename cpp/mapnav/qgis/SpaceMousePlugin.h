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

#include <QObject>
#include <QString>
#include <memory>
#include <string>

#include <qgis.h>
#include <qgisplugin.h>

#include "mapnav/navigation/NavigationController.h"
#include "mapnav/settings/NavigationSettings.h"

class QAction;
class QLabel;
class QTimer;
class QgisInterface;

namespace mapnav {
namespace qgis {

class QSettingsStore;
class QgisMapCanvas;

/// QGIS plugin that pans and zooms the main map canvas with a 3D mouse.
///
/// Everything runs on the GUI thread: a QTimer calls
/// NavigationController::Tick() every poll interval while navigation is
/// enabled.
class SpaceMousePlugin : public QObject, public QgisPlugin {
    Q_OBJECT

public:
    static const QString kName;
    static const QString kDescription;
    static const QString kCategory;
    static const QString kVersion;
    static const QString kIcon;
    static const QgisPlugin::PluginType kType = QgisPlugin::UI;

    explicit SpaceMousePlugin(QgisInterface *iface);
    ~SpaceMousePlugin() override;

    void initGui() override;
    void unload() override;

private slots:
    void SetNavigationEnabled(bool enabled);
    void ShowSettings();
    void Rescan();
    void OnTimeout();

private:
    void ApplySettings(const navigation::AxisConfig &config,
                       const settings::DeviceOptions &options);
    void OnStatusChanged(navigation::DeviceStatus status,
                         const std::string &message);
    void UpdateStatusLabel();
    void PushMessage(const QString &text,
                     Qgis::MessageLevel level,
                     int duration);

private:
    QgisInterface *iface_;
    std::unique_ptr<QSettingsStore> settings_store_;
    std::unique_ptr<QgisMapCanvas> canvas_;
    std::unique_ptr<navigation::NavigationController> controller_;
    settings::DeviceOptions device_options_;

    QTimer *timer_ = nullptr;
    QAction *enable_action_ = nullptr;
    QAction *settings_action_ = nullptr;
    QAction *rescan_action_ = nullptr;
    QLabel *status_label_ = nullptr;
    /// Set on enable until the first tick tells whether a device is there.
    bool report_missing_device_ = false;
};

}  // namespace qgis
}  // namespace mapnav
