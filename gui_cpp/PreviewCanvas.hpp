#pragma once

#include <QImage>
#include <QWidget>
#include <vector>

#include "flat_tune/grid/coordinate_mapper.hpp"
#include "flat_tune/image/preview.hpp"

namespace flat_tune::gui {

// Shows the 8-bit composite scaled to the widget, with the tile boundaries
// drawn as red dashed lines.
class PreviewCanvas : public QWidget {
    Q_OBJECT

  public:
    explicit PreviewCanvas(QWidget *parent = nullptr);

    void set_preview(const image::PreviewImage &preview, const grid::GridLines &lines);
    void clear();

    QSize sizeHint() const override;

  protected:
    void paintEvent(QPaintEvent *event) override;

  private:
    QRect image_rect() const;

    QImage image_;
    std::vector<int> line_columns_;
    std::vector<int> line_rows_;
};

}
