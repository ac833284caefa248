#include "kes_application.hpp"
#include "kes_configuration.hpp"
#include "kes_curses_terminal.hpp"
#include "kes_logger.hpp"
#include "kes_welcome_view.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <clocale>
#include <cstdio>
#include <memory>

int main(int argc, char *argv[]) {
    std::setlocale(LC_ALL, "");

    auto config = findConfiguration(argc, argv);
    if (!setupLogger(config)) {
        fmt::print(stderr, "Continuing without a log file\n");
    }
    spdlog::info("Starting {} with configuration {}{}", KES_HOST_APPLICATION_NAME,
                 config.iniPathname, config.isNewInstall() ? " (defaults)" : "");

    auto application = std::make_shared<KestrelApplication>();
    application->initialize(std::make_unique<KestrelWelcomeView>(config.iniPathname));

    KestrelCursesTerminal terminal(config.showCursor, config.escapeDelayMs);
    auto ec = application->run(terminal, terminal);

    int exitCode = 0;
    if (ec) {
        fmt::print(stderr, "{}: {}\n", KES_HOST_APPLICATION_NAME, ec.message());
        exitCode = 1;
    }
    if (config.isNewInstall() && !config.save()) {
        fmt::print(stderr, "Unable to write configuration to {}\n", config.iniPathname);
    }

    spdlog::shutdown();
    return exitCode;
}
