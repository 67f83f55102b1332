#pragma once

#include <QComboBox>
#include <QGroupBox>
#include <QLineEdit>
#include <QSlider>
#include <QString>
#include <string>
#include <vector>

#include "flat_tune/core/types.hpp"

namespace flat_tune::gui {

// Keeps a slider and a line edit showing the same integer. Typed values are
// clamped to the slider range.
void hook_slider_and_input(QSlider *slider, QLineEdit *input);

// Offset and flat-field controls of one grid position.
class TileControlWidget : public QGroupBox {
    Q_OBJECT

  public:
    TileControlWidget(const GridKey &key, int offset_limit,
                      const std::vector<std::string> &flat_keys, QWidget *parent = nullptr);

    const GridKey &key() const { return key_; }

    void set_offset(int offset);
    void set_flat(const std::string &flat_key);

  signals:
    void offset_changed(const flat_tune::GridKey &key, int offset);
    void flat_changed(const flat_tune::GridKey &key, const QString &flat_key);

  private:
    GridKey key_;
    QLineEdit *offset_input_ = nullptr;
    QSlider *offset_slider_ = nullptr;
    QComboBox *flat_chooser_ = nullptr;
};

}
