#pragma once

#include <QComboBox>
#include <QLineEdit>
#include <QMainWindow>
#include <QSlider>
#include <QTimer>
#include <map>
#include <cstdint>
#include <memory>

#include "PreviewCanvas.hpp"
#include "TileControlWidget.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/events.hpp"
#include "flat_tune/session/session_state.hpp"

namespace flat_tune::gui {

class MainWindow : public QMainWindow {
    Q_OBJECT

  public:
    MainWindow(std::unique_ptr<session::SessionState> session, core::EventEmitter *events,
               QWidget *parent = nullptr);

  private slots:
    void on_plane_changed(int index);
    void on_dark_changed(int value);
    void on_offset_changed(const flat_tune::GridKey &key, int offset);
    void on_flat_changed(const flat_tune::GridKey &key, const QString &flat_key);
    void recompute();
    void file_save();
    void file_load_state();
    void file_save_state();

  private:
    void build_ui();
    void build_menus();
    QWidget *build_tile_grid();
    void sync_controls();
    void schedule_recompute();
    void report_error(const QString &title, const FlatTuneError &e);

    std::unique_ptr<session::SessionState> session_;
    core::EventEmitter *events_;

    QComboBox *z_chooser_ = nullptr;
    QLineEdit *dark_input_ = nullptr;
    QSlider *dark_slider_ = nullptr;
    std::map<GridKey, TileControlWidget *> tile_controls_;
    PreviewCanvas *canvas_ = nullptr;

    QTimer *recompute_timer_ = nullptr;
    uint64_t displayed_version_ = 0;
    bool has_display_ = false;
};

}
