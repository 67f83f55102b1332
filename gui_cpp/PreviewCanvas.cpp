#include "PreviewCanvas.hpp"

#include <QPainter>
#include <QPen>

namespace flat_tune::gui {

PreviewCanvas::PreviewCanvas(QWidget *parent) : QWidget(parent) {
    setMinimumSize(320, 240);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);
}

QSize PreviewCanvas::sizeHint() const {
    return QSize(800, 600);
}

void PreviewCanvas::set_preview(const image::PreviewImage &preview, const grid::GridLines &lines) {
    if (preview.rows == 0 || preview.cols == 0) {
        clear();
        return;
    }
    // QImage does not own the buffer; copy() detaches it.
    QImage view(preview.pixels.data(), preview.cols, preview.rows, preview.cols,
                QImage::Format_Grayscale8);
    image_ = view.copy();
    line_columns_ = lines.columns;
    line_rows_ = lines.rows;
    update();
}

void PreviewCanvas::clear() {
    image_ = QImage();
    line_columns_.clear();
    line_rows_.clear();
    update();
}

QRect PreviewCanvas::image_rect() const {
    if (image_.isNull()) return QRect();
    QSize scaled = image_.size().scaled(size(), Qt::KeepAspectRatio);
    int x = (width() - scaled.width()) / 2;
    int y = (height() - scaled.height()) / 2;
    return QRect(QPoint(x, y), scaled);
}

void PreviewCanvas::paintEvent(QPaintEvent *) {
    QPainter painter(this);
    painter.fillRect(rect(), Qt::black);
    if (image_.isNull()) {
        painter.setPen(Qt::gray);
        painter.drawText(rect(), Qt::AlignCenter, "No image");
        return;
    }

    const QRect target = image_rect();
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(target, image_);

    const double sx = static_cast<double>(target.width()) / image_.width();
    const double sy = static_cast<double>(target.height()) / image_.height();

    QPen pen(Qt::red);
    pen.setStyle(Qt::DashLine);
    pen.setWidth(1);
    painter.setPen(pen);
    for (int c : line_columns_) {
        int x = target.left() + static_cast<int>(c * sx);
        painter.drawLine(x, target.top(), x, target.bottom());
    }
    for (int r : line_rows_) {
        int y = target.top() + static_cast<int>(r * sy);
        painter.drawLine(target.left(), y, target.right(), y);
    }
}

}
