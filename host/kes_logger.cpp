#include "kes_logger.hpp"
#include "kes_configuration.hpp"

#include "fmt/format.h"
#include "spdlog/common.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cstdio>
#include <memory>
#include <vector>

bool setupLogger(const KestrelConfiguration &config) {
    static spdlog::level::level_enum levels[] = {spdlog::level::debug, spdlog::level::info,
                                                 spdlog::level::warn, spdlog::level::err};

    auto logLevel = levels[std::clamp(config.logLevel, KES_LOG_LEVEL_DEBUG, KES_LOG_LEVEL_ERROR)];

    std::shared_ptr<spdlog::sinks::sink> sink;
    bool fileOk = true;
    try {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logPathname, true);
    } catch (const spdlog::spdlog_ex &ex) {
        fmt::print(stderr, "Unable to open log file {} ({}), logging to stderr\n",
                   config.logPathname, ex.what());
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        //  only errors reach the terminal while curses owns it
        logLevel = std::max(logLevel, spdlog::level::err);
        fileOk = false;
    }
    sink->set_level(logLevel);

    auto mainLogger = std::make_shared<spdlog::logger>("kestrel", sink);
    spdlog::set_default_logger(mainLogger);
    spdlog::set_level(logLevel);
    spdlog::flush_on(spdlog::level::err);
    if (fileOk) {
        spdlog::info("Log file at {}", config.logPathname);
    }
    return fileOk;
}
