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

#include <QDialog>

#include "mapnav/navigation/AxisConfig.h"
#include "mapnav/settings/NavigationSettings.h"

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QSpinBox;

namespace mapnav {
namespace qgis {

/// Edits an AxisConfig and the DeviceOptions. Rotation inversions are not
/// shown and pass through unchanged.
class SpaceMouseSettingsDialog : public QDialog {
    Q_OBJECT

public:
    explicit SpaceMouseSettingsDialog(QWidget *parent = nullptr);

    void SetAxisConfig(const navigation::AxisConfig &config);
    navigation::AxisConfig GetAxisConfig() const;

    void SetDeviceOptions(const settings::DeviceOptions &options);
    settings::DeviceOptions GetDeviceOptions() const;

public slots:
    void ResetToDefaults();

private slots:
    void UpdateAxisExplanation();

private:
    void SetupUi();

private:
    navigation::AxisConfig config_;

    QCheckBox *invert_x_check_ = nullptr;
    QCheckBox *invert_y_check_ = nullptr;
    QCheckBox *invert_z_check_ = nullptr;
    QCheckBox *swap_yz_check_ = nullptr;
    QLabel *axis_explanation_ = nullptr;
    QDoubleSpinBox *pan_sensitivity_spin_ = nullptr;
    QDoubleSpinBox *zoom_sensitivity_spin_ = nullptr;
    QDoubleSpinBox *deadzone_spin_ = nullptr;
    QComboBox *backend_combo_ = nullptr;
    QSpinBox *poll_interval_spin_ = nullptr;
};

}  // namespace qgis
}  // namespace mapnav
