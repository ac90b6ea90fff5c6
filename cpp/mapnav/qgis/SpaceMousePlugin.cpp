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

#include "mapnav/qgis/SpaceMousePlugin.h"

#include <QAction>
#include <QIcon>
#include <QLabel>
#include <QRegularExpression>
#include <QTimer>
#include <exception>

#include <qgisinterface.h>
#include <qgsmapcanvas.h>
#include <qgsmessagebar.h>
#include <qgsmessagelog.h>
#include <qgsstatusbar.h>

#include "mapnav/device/SpaceMouse.h"
#include "mapnav/qgis/QSettingsStore.h"
#include "mapnav/qgis/QgisMapCanvas.h"
#include "mapnav/qgis/SpaceMouseSettingsDialog.h"
#include "mapnav/utility/Logging.h"

namespace mapnav {
namespace qgis {

using navigation::DeviceStatus;

const QString SpaceMousePlugin::kName = QStringLiteral("SpaceMouse Navigation");
const QString SpaceMousePlugin::kDescription =
        QStringLiteral("Pan and zoom the map canvas with a 3Dconnexion "
                       "SpaceMouse");
const QString SpaceMousePlugin::kCategory = QStringLiteral("Plugins");
const QString SpaceMousePlugin::kVersion = QString::fromLatin1(MAPNAV_VERSION);
const QString SpaceMousePlugin::kIcon =
        QStringLiteral(":/mapnav/icons/spacemouse.svg");

namespace {

const QString kMenuName = QStringLiteral("&SpaceMouse Navigation");
const QString kLogTag = QStringLiteral("SpaceMouse");
const QString kMessageTitle = QStringLiteral("SpaceMouse");

// Drops the console color escapes the logger adds.
QString StripColor(const std::string &message) {
    QString text = QString::fromStdString(message);
    text.remove(QRegularExpression(QStringLiteral("\x1b\\[[0-9;]*m")));
    return text.trimmed();
}

void PrintToMessageLog(const std::string &message) {
    QString text = StripColor(message);
    Qgis::MessageLevel level = Qgis::MessageLevel::Info;
    if (text.startsWith(QStringLiteral("[MapNav WARNING]"))) {
        level = Qgis::MessageLevel::Warning;
    }
    QgsMessageLog::logMessage(text, kLogTag, level, false);
}

}  // namespace

SpaceMousePlugin::SpaceMousePlugin(QgisInterface *iface)
    : QgisPlugin(kName, kDescription, kCategory, kVersion, kType),
      iface_(iface) {}

SpaceMousePlugin::~SpaceMousePlugin() = default;

void SpaceMousePlugin::initGui() {
    utility::Logger::GetInstance().SetPrintFunction(PrintToMessageLog);

    settings_store_.reset(new QSettingsStore());
    canvas_.reset(new QgisMapCanvas(*iface_->mapCanvas()));
    navigation::AxisConfig config = settings::LoadAxisConfig(*settings_store_);
    device_options_ = settings::LoadDeviceOptions(*settings_store_);
    controller_.reset(new navigation::NavigationController(
            device::CreateSpaceMouse(device_options_.backend), *canvas_));
    controller_->SetAxisConfig(config);
    controller_->SetStatusCallback(
            [this](DeviceStatus status, const std::string &message) {
                OnStatusChanged(status, message);
            });

    timer_ = new QTimer(this);
    timer_->setInterval(device_options_.poll_interval_ms);
    connect(timer_, &QTimer::timeout, this, &SpaceMousePlugin::OnTimeout);

    QWidget *main_window = iface_->mainWindow();
    enable_action_ =
            new QAction(QIcon(kIcon), tr("Enable SpaceMouse"), main_window);
    enable_action_->setCheckable(true);
    enable_action_->setChecked(false);
    settings_action_ = new QAction(tr("SpaceMouse Settings"), main_window);
    rescan_action_ = new QAction(tr("Rescan SpaceMouse"), main_window);
    connect(enable_action_, &QAction::toggled, this,
            &SpaceMousePlugin::SetNavigationEnabled);
    connect(settings_action_, &QAction::triggered, this,
            &SpaceMousePlugin::ShowSettings);
    connect(rescan_action_, &QAction::triggered, this,
            &SpaceMousePlugin::Rescan);

    iface_->addToolBarIcon(enable_action_);
    iface_->addPluginToMenu(kMenuName, enable_action_);
    iface_->addPluginToMenu(kMenuName, settings_action_);
    iface_->addPluginToMenu(kMenuName, rescan_action_);

    status_label_ = new QLabel(main_window);
    iface_->statusBarIface()->addPermanentWidget(status_label_);
    UpdateStatusLabel();

    utility::LogDebug("SpaceMouse plugin {} loaded.", MAPNAV_VERSION);
}

void SpaceMousePlugin::unload() {
    if (timer_) {
        timer_->stop();
    }
    if (controller_) {
        controller_->Disable();
    }

    iface_->removePluginMenu(kMenuName, enable_action_);
    iface_->removePluginMenu(kMenuName, settings_action_);
    iface_->removePluginMenu(kMenuName, rescan_action_);
    iface_->removeToolBarIcon(enable_action_);
    iface_->statusBarIface()->removeWidget(status_label_);

    delete enable_action_;
    delete settings_action_;
    delete rescan_action_;
    delete status_label_;
    enable_action_ = nullptr;
    settings_action_ = nullptr;
    rescan_action_ = nullptr;
    status_label_ = nullptr;

    controller_.reset();
    canvas_.reset();
    settings_store_.reset();

    utility::Logger::GetInstance().ResetPrintFunction();
}

void SpaceMousePlugin::SetNavigationEnabled(bool enabled) {
    if (enabled == controller_->IsEnabled()) {
        return;
    }
    if (enabled) {
        report_missing_device_ = true;
        controller_->Enable();
        timer_->start(device_options_.poll_interval_ms);
        PushMessage(tr("SpaceMouse navigation enabled"),
                    Qgis::MessageLevel::Info, 3);
    } else {
        timer_->stop();
        controller_->Disable();
        report_missing_device_ = false;
        PushMessage(tr("SpaceMouse navigation disabled"),
                    Qgis::MessageLevel::Info, 3);
    }
    UpdateStatusLabel();
}

void SpaceMousePlugin::ShowSettings() {
    SpaceMouseSettingsDialog dialog(iface_->mainWindow());
    dialog.SetAxisConfig(controller_->GetAxisConfig());
    dialog.SetDeviceOptions(device_options_);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    navigation::AxisConfig config = dialog.GetAxisConfig();
    settings::DeviceOptions options = dialog.GetDeviceOptions();
    settings::SaveAxisConfig(*settings_store_, config);
    settings::SaveDeviceOptions(*settings_store_, options);
    ApplySettings(config, options);
    PushMessage(tr("Settings saved"), Qgis::MessageLevel::Info, 2);
}

void SpaceMousePlugin::Rescan() {
    report_missing_device_ = controller_->IsEnabled();
    controller_->Rescan();
    UpdateStatusLabel();
}

void SpaceMousePlugin::OnTimeout() {
    try {
        controller_->Tick();
    } catch (const std::exception &e) {
        PushMessage(StripColor(e.what()), Qgis::MessageLevel::Critical, 5);
        enable_action_->setChecked(false);
        return;
    }

    // The reason can change while the status stays NotConnected.
    QString message = QString::fromStdString(controller_->GetStatusMessage());
    if (status_label_ && status_label_->toolTip() != message) {
        UpdateStatusLabel();
    }

    if (report_missing_device_) {
        report_missing_device_ = false;
        if (controller_->GetStatus() == DeviceStatus::NotConnected) {
            PushMessage(message, Qgis::MessageLevel::Warning, 5);
        }
    }
}

void SpaceMousePlugin::ApplySettings(const navigation::AxisConfig &config,
                                     const settings::DeviceOptions &options) {
    controller_->SetAxisConfig(config);
    if (options.backend != device_options_.backend) {
        report_missing_device_ = controller_->IsEnabled();
        controller_->SetDevice(device::CreateSpaceMouse(options.backend));
    }
    if (options.poll_interval_ms != device_options_.poll_interval_ms) {
        timer_->setInterval(options.poll_interval_ms);
    }
    device_options_ = options;
}

void SpaceMousePlugin::OnStatusChanged(DeviceStatus status,
                                       const std::string &message) {
    UpdateStatusLabel();
    switch (status) {
        case DeviceStatus::Connected:
            PushMessage(QString::fromStdString(message),
                        Qgis::MessageLevel::Success, 3);
            break;
        case DeviceStatus::NotConnected:
            // Only a lost device is news; a missing one is reported once
            // after enabling.
            if (!report_missing_device_) {
                PushMessage(QString::fromStdString(message),
                            Qgis::MessageLevel::Warning, 5);
            }
            break;
        case DeviceStatus::Disabled:
            break;
    }
}

void SpaceMousePlugin::UpdateStatusLabel() {
    if (!status_label_) {
        return;
    }
    status_label_->setText(
            tr("SpaceMouse: %1")
                    .arg(QString::fromUtf8(navigation::GetDeviceStatusName(
                            controller_->GetStatus()))));
    status_label_->setToolTip(
            QString::fromStdString(controller_->GetStatusMessage()));
}

void SpaceMousePlugin::PushMessage(const QString &text,
                                   Qgis::MessageLevel level,
                                   int duration) {
    iface_->messageBar()->pushMessage(kMessageTitle, text, level, duration);
}

}  // namespace qgis
}  // namespace mapnav
