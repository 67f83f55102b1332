#include "MainWindow.hpp"

#include "flat_tune/grid/coordinate_mapper.hpp"
#include "flat_tune/image/preview.hpp"
#include "flat_tune/output/correction_writer.hpp"

#include <QFileDialog>
#include <QGridLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QScrollArea>
#include <QSignalBlocker>
#include <QSplitter>
#include <QStatusBar>
#include <QVBoxLayout>
#include <algorithm>
#include <iostream>

namespace flat_tune::gui {

MainWindow::MainWindow(std::unique_ptr<session::SessionState> session, core::EventEmitter *events,
                       QWidget *parent)
    : QMainWindow(parent), session_(std::move(session)), events_(events) {
    setWindowTitle("Pystripe illumination correction");
    resize(1400, 900);

    recompute_timer_ = new QTimer(this);
    recompute_timer_->setSingleShot(true);
    recompute_timer_->setInterval(session_->config().preview.debounce_ms);
    connect(recompute_timer_, &QTimer::timeout, this, &MainWindow::recompute);

    build_menus();
    build_ui();
    sync_controls();

    if (z_chooser_->count() > 0) {
        on_plane_changed(z_chooser_->currentIndex());
    }
}

void MainWindow::build_menus() {
    auto *file_menu = menuBar()->addMenu("&File");

    auto *save_action = file_menu->addAction("&Save");
    save_action->setShortcut(QKeySequence("Ctrl+S"));
    connect(save_action, &QAction::triggered, this, &MainWindow::file_save);

    file_menu->addSeparator();
    auto *load_state_action = file_menu->addAction("&Load tuning...");
    connect(load_state_action, &QAction::triggered, this, &MainWindow::file_load_state);
    auto *save_state_action = file_menu->addAction("Save &tuning as...");
    connect(save_state_action, &QAction::triggered, this, &MainWindow::file_save_state);

    file_menu->addSeparator();
    auto *quit_action = file_menu->addAction("&Quit");
    quit_action->setShortcut(QKeySequence("Ctrl+Q"));
    connect(quit_action, &QAction::triggered, this, &QWidget::close);
}

void MainWindow::build_ui() {
    const auto &cfg = session_->config();
    const auto &cat = session_->preview_catalog();

    auto *splitter = new QSplitter(Qt::Horizontal);
    setCentralWidget(splitter);

    auto *controls = new QWidget();
    auto *vbox = new QVBoxLayout(controls);
    splitter->addWidget(controls);

    // Z chooser and dark level
    auto *chooser_box = new QGroupBox("Z plane to display / Dark field value");
    auto *chooser_layout = new QHBoxLayout(chooser_box);
    vbox->addWidget(chooser_box);

    chooser_layout->addWidget(new QLabel("Z:"));
    z_chooser_ = new QComboBox();
    const auto names = cat.plane_names();
    for (size_t index : cat.preview_plane_indices(cfg.tuning.max_z_choices)) {
        QString label = index < names.size() ? QString::fromStdString(names[index])
                                             : QString::number(index);
        z_chooser_->addItem(label, QVariant::fromValue<qulonglong>(index));
    }
    chooser_layout->addWidget(z_chooser_);
    connect(z_chooser_, qOverload<int>(&QComboBox::currentIndexChanged), this,
            &MainWindow::on_plane_changed);

    chooser_layout->addWidget(new QLabel("Dark"));
    dark_input_ = new QLineEdit();
    dark_input_->setMaximumWidth(60);
    chooser_layout->addWidget(dark_input_);
    dark_slider_ = new QSlider(Qt::Horizontal);
    dark_slider_->setMinimum(0);
    dark_slider_->setMaximum(cfg.tuning.dark_max);
    chooser_layout->addWidget(dark_slider_, 1);
    hook_slider_and_input(dark_slider_, dark_input_);
    connect(dark_slider_, &QSlider::valueChanged, this, &MainWindow::on_dark_changed);

    // Per-tile offsets and flats
    auto *grid_box = new QGroupBox("Y offsets and flat files");
    auto *grid_box_layout = new QVBoxLayout(grid_box);
    auto *scroll = new QScrollArea();
    scroll->setWidgetResizable(true);
    scroll->setFrameShape(QFrame::NoFrame);
    scroll->setWidget(build_tile_grid());
    grid_box_layout->addWidget(scroll);
    vbox->addWidget(grid_box, 1);

    canvas_ = new PreviewCanvas();
    splitter->addWidget(canvas_);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 2);

    statusBar()->showMessage(QString("%1 tiles, %2 planes, %3 flats")
                                 .arg(cat.size())
                                 .arg(cat.plane_count())
                                 .arg(session_->library().size()));
}

QWidget *MainWindow::build_tile_grid() {
    const auto &cat = session_->preview_catalog();
    const auto keys = cat.keys();
    const auto xs = grid::distinct_x(keys);
    const auto ys = grid::distinct_y(keys);
    const auto flats = session_->library().keys();
    const int limit = session_->config().tuning.offset_limit;

    auto *container = new QWidget();
    auto *grid = new QGridLayout(container);
    for (const auto &key : keys) {
        int xi = static_cast<int>(std::lower_bound(xs.begin(), xs.end(), key.x_um) - xs.begin());
        int yi = static_cast<int>(std::lower_bound(ys.begin(), ys.end(), key.y_um) - ys.begin());

        auto *tile = new TileControlWidget(key, limit, flats);
        grid->addWidget(tile, yi, xi);
        tile_controls_[key] = tile;

        connect(tile, &TileControlWidget::offset_changed, this, &MainWindow::on_offset_changed);
        connect(tile, &TileControlWidget::flat_changed, this, &MainWindow::on_flat_changed);
    }
    return container;
}

void MainWindow::sync_controls() {
    {
        QSignalBlocker block(dark_slider_);
        dark_slider_->setValue(session_->dark_level());
        dark_input_->setText(QString::number(session_->dark_level()));
    }

    for (const auto &[key, state] : session_->tiles()) {
        auto it = tile_controls_.find(key);
        if (it == tile_controls_.end()) continue;
        it->second->set_offset(state.offset);
        if (state.flat_key) it->second->set_flat(*state.flat_key);
    }

    if (auto plane = session_->plane_index()) {
        int item = z_chooser_->findData(QVariant::fromValue<qulonglong>(*plane));
        if (item >= 0) {
            QSignalBlocker block(z_chooser_);
            z_chooser_->setCurrentIndex(item);
        }
    }
}

void MainWindow::schedule_recompute() {
    recompute_timer_->start();
}

void MainWindow::report_error(const QString &title, const FlatTuneError &e) {
    std::cerr << "[GUI] " << title.toStdString() << ": " << e.what() << std::endl;
    if (events_) {
        events_->error(error_kind_to_string(e.kind()), e.subject(), e.what());
    }
    QString message = QString::fromStdString(e.what());
    if (!e.subject().empty()) {
        message += QString(" [%1]").arg(QString::fromStdString(e.subject()));
    }
    statusBar()->showMessage(title + ": " + message);
}

void MainWindow::on_plane_changed(int index) {
    if (index < 0) return;
    const size_t plane = static_cast<size_t>(z_chooser_->itemData(index).toULongLong());
    try {
        session_->select_plane(plane);
    } catch (const FlatTuneError &e) {
        report_error("Load plane", e);
        return;
    }
    schedule_recompute();
}

void MainWindow::on_dark_changed(int value) {
    try {
        session_->set_dark_level(value);
    } catch (const FlatTuneError &e) {
        report_error("Dark level", e);
        return;
    }
    schedule_recompute();
}

void MainWindow::on_offset_changed(const GridKey &key, int offset) {
    try {
        session_->set_offset(key, offset);
    } catch (const FlatTuneError &e) {
        report_error("Offset", e);
        return;
    }
    schedule_recompute();
}

void MainWindow::on_flat_changed(const GridKey &key, const QString &flat_key) {
    try {
        session_->select_flat(key, flat_key.toStdString());
    } catch (const FlatTuneError &e) {
        report_error("Flat file", e);
        return;
    }
    schedule_recompute();
}

void MainWindow::recompute() {
    const uint64_t version = session_->version();
    if (has_display_ && version == displayed_version_) return;

    try {
        image::Composite composite = session_->compose();
        if (session_->version() != version) {
            // Superseded while composing; the newer state gets its own pass.
            schedule_recompute();
            return;
        }
        image::PreviewImage preview =
            image::render_preview(composite.image, session_->config().preview.percentile);
        canvas_->set_preview(preview, composite.grid_lines);
        displayed_version_ = version;
        has_display_ = true;
        statusBar()->showMessage(QString("Composite %1 x %2 from %3 tiles")
                                     .arg(composite.image.cols())
                                     .arg(composite.image.rows())
                                     .arg(composite.tiles));
    } catch (const FlatTuneError &e) {
        canvas_->clear();
        has_display_ = false;
        report_error("Preview", e);
    }
}

void MainWindow::file_save() {
    try {
        output::SaveReport report = output::save_session(*session_, events_);
        statusBar()->showMessage(QString("Saved %1 flats and %2 scripts")
                                     .arg(report.flats.size())
                                     .arg(report.scripts.size()));
    } catch (const FlatTuneError &e) {
        report_error("Save", e);
        QMessageBox::critical(this, "Save failed", QString::fromStdString(e.what()));
    }
}

void MainWindow::file_load_state() {
    QString path = QFileDialog::getOpenFileName(this, "Load tuning", QString(),
                                                "Tuning state (*.json)");
    if (path.isEmpty()) return;
    try {
        session_->load(path.toStdString());
    } catch (const FlatTuneError &e) {
        report_error("Load tuning", e);
        QMessageBox::critical(this, "Load tuning failed", QString::fromStdString(e.what()));
    }
    // A partially applied state is still the session's current state.
    sync_controls();
    schedule_recompute();
}

void MainWindow::file_save_state() {
    QString path = QFileDialog::getSaveFileName(this, "Save tuning", QString(),
                                                "Tuning state (*.json)");
    if (path.isEmpty()) return;
    try {
        session_->save(path.toStdString());
        statusBar()->showMessage("Saved tuning to " + path);
    } catch (const FlatTuneError &e) {
        report_error("Save tuning", e);
        QMessageBox::critical(this, "Save tuning failed", QString::fromStdString(e.what()));
    }
}

}
