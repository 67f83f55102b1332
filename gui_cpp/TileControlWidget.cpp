#include "TileControlWidget.hpp"

#include "flat_tune/catalog/flat_library.hpp"

#include <QHBoxLayout>
#include <QIntValidator>
#include <QLabel>
#include <QSignalBlocker>
#include <QVBoxLayout>
#include <algorithm>
#include <cmath>

namespace flat_tune::gui {

void hook_slider_and_input(QSlider *slider, QLineEdit *input) {
    input->setValidator(new QIntValidator(slider->minimum(), slider->maximum(), input));
    QObject::connect(slider, &QSlider::valueChanged, input, [input](int value) {
        input->setText(QString::number(value));
    });
    QObject::connect(input, &QLineEdit::editingFinished, slider, [slider, input]() {
        bool ok = false;
        int value = input->text().toInt(&ok);
        if (!ok) {
            input->setText(QString::number(slider->value()));
            return;
        }
        slider->setValue(std::clamp(value, slider->minimum(), slider->maximum()));
    });
}

TileControlWidget::TileControlWidget(const GridKey &key, int offset_limit,
                                     const std::vector<std::string> &flat_keys, QWidget *parent)
    : QGroupBox(parent), key_(key) {
    setTitle(QString("%1,%2")
                 .arg(static_cast<long>(std::lround(key.x_um)))
                 .arg(static_cast<long>(std::lround(key.y_um))));
    setToolTip(QString::fromStdString(grid_key_name(key)));

    auto *layout = new QVBoxLayout(this);

    auto *y_layout = new QHBoxLayout();
    y_layout->addWidget(new QLabel("Y:"));
    offset_input_ = new QLineEdit("0");
    offset_input_->setMaximumWidth(60);
    y_layout->addWidget(offset_input_);
    offset_slider_ = new QSlider(Qt::Horizontal);
    offset_slider_->setMinimum(-offset_limit);
    offset_slider_->setMaximum(offset_limit);
    offset_slider_->setValue(0);
    y_layout->addWidget(offset_slider_, 1);
    layout->addLayout(y_layout);
    hook_slider_and_input(offset_slider_, offset_input_);

    flat_chooser_ = new QComboBox();
    for (const auto &flat : flat_keys) {
        flat_chooser_->addItem(
            QString::fromStdString(catalog::FlatFieldLibrary::display_name(flat)),
            QString::fromStdString(flat));
    }
    layout->addWidget(flat_chooser_);

    connect(offset_slider_, &QSlider::valueChanged, this, [this](int value) {
        emit offset_changed(key_, value);
    });
    connect(flat_chooser_, qOverload<int>(&QComboBox::currentIndexChanged), this, [this](int index) {
        if (index < 0) return;
        emit flat_changed(key_, flat_chooser_->itemData(index).toString());
    });
}

void TileControlWidget::set_offset(int offset) {
    QSignalBlocker block(offset_slider_);
    offset_slider_->setValue(offset);
    offset_input_->setText(QString::number(offset_slider_->value()));
}

void TileControlWidget::set_flat(const std::string &flat_key) {
    int index = flat_chooser_->findData(QString::fromStdString(flat_key));
    if (index < 0) return;
    QSignalBlocker block(flat_chooser_);
    flat_chooser_->setCurrentIndex(index);
}

}
