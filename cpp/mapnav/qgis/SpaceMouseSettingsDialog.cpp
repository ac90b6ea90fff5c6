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

#include "mapnav/qgis/SpaceMouseSettingsDialog.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QLabel>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

namespace mapnav {
namespace qgis {

using device::Axis;
using device::DeviceBackend;
using navigation::AxisConfig;
using settings::DeviceOptions;

namespace {

QDoubleSpinBox *CreateSpinBox(double min,
                              double max,
                              double step,
                              int decimals,
                              QWidget *parent) {
    QDoubleSpinBox *spin = new QDoubleSpinBox(parent);
    spin->setRange(min, max);
    spin->setSingleStep(step);
    spin->setDecimals(decimals);
    return spin;
}

}  // namespace

SpaceMouseSettingsDialog::SpaceMouseSettingsDialog(QWidget *parent)
    : QDialog(parent) {
    setWindowTitle(tr("SpaceMouse Settings"));
    setMinimumWidth(400);
    SetupUi();
    SetAxisConfig(AxisConfig());
    SetDeviceOptions(DeviceOptions());
}

void SpaceMouseSettingsDialog::SetupUi() {
    QVBoxLayout *layout = new QVBoxLayout(this);

    QGroupBox *axis_group = new QGroupBox(tr("Axis Configuration"), this);
    QVBoxLayout *axis_layout = new QVBoxLayout(axis_group);
    invert_x_check_ =
            new QCheckBox(tr("Invert Left/Right (X axis)"), axis_group);
    invert_y_check_ =
            new QCheckBox(tr("Invert Forward/Back (Y axis)"), axis_group);
    invert_z_check_ = new QCheckBox(tr("Invert Up/Down (Z axis)"), axis_group);
    swap_yz_check_ = new QCheckBox(
            tr("Swap Y/Z axes (Forward/Back and Up/Down)"), axis_group);
    axis_explanation_ = new QLabel(axis_group);
    axis_explanation_->setWordWrap(true);
    axis_explanation_->setStyleSheet(
            QStringLiteral("QLabel { color: gray; font-size: 9pt; }"));
    axis_layout->addWidget(invert_x_check_);
    axis_layout->addWidget(invert_y_check_);
    axis_layout->addWidget(invert_z_check_);
    axis_layout->addSpacing(8);
    axis_layout->addWidget(swap_yz_check_);
    axis_layout->addWidget(axis_explanation_);
    layout->addWidget(axis_group);

    QGroupBox *sensitivity_group = new QGroupBox(tr("Sensitivity"), this);
    QFormLayout *sensitivity_layout = new QFormLayout(sensitivity_group);
    pan_sensitivity_spin_ = CreateSpinBox(AxisConfig::kMinSensitivity,
                                          AxisConfig::kMaxSensitivity, 0.001,
                                          3, sensitivity_group);
    zoom_sensitivity_spin_ = CreateSpinBox(AxisConfig::kMinSensitivity,
                                           AxisConfig::kMaxSensitivity, 0.001,
                                           3, sensitivity_group);
    deadzone_spin_ = CreateSpinBox(0.0, AxisConfig::kMaxDeadzone, 0.01, 2,
                                   sensitivity_group);
    sensitivity_layout->addRow(tr("Pan Sensitivity:"), pan_sensitivity_spin_);
    sensitivity_layout->addRow(tr("Zoom Sensitivity:"),
                               zoom_sensitivity_spin_);
    sensitivity_layout->addRow(tr("Deadzone:"), deadzone_spin_);
    layout->addWidget(sensitivity_group);

    QGroupBox *device_group = new QGroupBox(tr("Device"), this);
    QFormLayout *device_layout = new QFormLayout(device_group);
    backend_combo_ = new QComboBox(device_group);
    backend_combo_->addItem(tr("USB HID (direct)"),
                            static_cast<int>(DeviceBackend::Hid));
    backend_combo_->addItem(tr("spacenavd daemon"),
                            static_cast<int>(DeviceBackend::Spnav));
    poll_interval_spin_ = new QSpinBox(device_group);
    poll_interval_spin_->setRange(DeviceOptions::kMinPollIntervalMs,
                                  DeviceOptions::kMaxPollIntervalMs);
    poll_interval_spin_->setSuffix(tr(" ms"));
    device_layout->addRow(tr("Backend:"), backend_combo_);
    device_layout->addRow(tr("Poll Interval:"), poll_interval_spin_);
    layout->addWidget(device_group);

    QDialogButtonBox *button_box = new QDialogButtonBox(
            QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    QPushButton *reset_button = button_box->addButton(
            tr("Reset to Defaults"), QDialogButtonBox::ResetRole);
    layout->addWidget(button_box);

    connect(swap_yz_check_, &QCheckBox::toggled, this,
            &SpaceMouseSettingsDialog::UpdateAxisExplanation);
    connect(reset_button, &QPushButton::clicked, this,
            &SpaceMouseSettingsDialog::ResetToDefaults);
    connect(button_box, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(button_box, &QDialogButtonBox::rejected, this, &QDialog::reject);
}

void SpaceMouseSettingsDialog::SetAxisConfig(const AxisConfig &config) {
    config_ = config;
    invert_x_check_->setChecked(config.IsInverted(Axis::TX));
    invert_y_check_->setChecked(config.IsInverted(Axis::TY));
    invert_z_check_->setChecked(config.IsInverted(Axis::TZ));
    swap_yz_check_->setChecked(config.swap_yz);
    pan_sensitivity_spin_->setValue(config.pan_sensitivity);
    zoom_sensitivity_spin_->setValue(config.zoom_sensitivity);
    deadzone_spin_->setValue(config.deadzone);
    UpdateAxisExplanation();
}

AxisConfig SpaceMouseSettingsDialog::GetAxisConfig() const {
    AxisConfig config = config_;
    config.SetInverted(Axis::TX, invert_x_check_->isChecked());
    config.SetInverted(Axis::TY, invert_y_check_->isChecked());
    config.SetInverted(Axis::TZ, invert_z_check_->isChecked());
    config.swap_yz = swap_yz_check_->isChecked();
    config.pan_sensitivity = pan_sensitivity_spin_->value();
    config.zoom_sensitivity = zoom_sensitivity_spin_->value();
    config.deadzone = deadzone_spin_->value();
    return config;
}

void SpaceMouseSettingsDialog::SetDeviceOptions(const DeviceOptions &options) {
    int index = backend_combo_->findData(static_cast<int>(options.backend));
    backend_combo_->setCurrentIndex(index < 0 ? 0 : index);
    poll_interval_spin_->setValue(options.poll_interval_ms);
}

DeviceOptions SpaceMouseSettingsDialog::GetDeviceOptions() const {
    DeviceOptions options;
    options.backend =
            static_cast<DeviceBackend>(backend_combo_->currentData().toInt());
    options.poll_interval_ms = poll_interval_spin_->value();
    return options;
}

void SpaceMouseSettingsDialog::ResetToDefaults() {
    SetAxisConfig(AxisConfig());
    SetDeviceOptions(DeviceOptions());
}

void SpaceMouseSettingsDialog::UpdateAxisExplanation() {
    if (swap_yz_check_->isChecked()) {
        axis_explanation_->setText(
                tr("Up/Down: pan map up/down\nForward/Back: zoom in/out"));
    } else {
        axis_explanation_->setText(
                tr("Forward/Back: pan map up/down\nUp/Down: zoom in/out"));
    }
}

}  // namespace qgis
}  // namespace mapnav
