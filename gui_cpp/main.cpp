#include <QApplication>
#include <QMessageBox>
#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "MainWindow.hpp"
#include "flat_tune/config/command_line.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/events.hpp"
#include "flat_tune/session/session_state.hpp"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    app.setStyle("Fusion");

    CLI::App cli{"Pystripe illumination correction"};
    flat_tune::config::CommandLineOptions opts;
    flat_tune::config::add_common_options(cli, opts);
    CLI11_PARSE(cli, argc, argv);

    flat_tune::core::EventEmitter events(&std::cout);
    std::unique_ptr<flat_tune::session::SessionState> session;
    try {
        flat_tune::config::Config cfg = flat_tune::config::build_config(opts);
        session = std::make_unique<flat_tune::session::SessionState>(
            flat_tune::session::open_session(cfg, &events));
    } catch (const flat_tune::FlatTuneError &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        events.error(flat_tune::error_kind_to_string(e.kind()), e.subject(), e.what());
        QMessageBox::critical(nullptr, "flat_tune", QString::fromStdString(e.what()));
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        events.error("GENERIC", "", e.what());
        QMessageBox::critical(nullptr, "flat_tune", QString::fromStdString(e.what()));
        return 1;
    }

    flat_tune::gui::MainWindow win(std::move(session), &events);
    win.show();

    return app.exec();
}
