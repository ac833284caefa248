#include "kes_configuration.hpp"

#include "fmt/format.h"
#include "ini.h"
#include "spdlog/spdlog.h"

#include <charconv>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <utility>

namespace {

bool parseInt(const char *value, int &out) {
    const char *end = value + std::strlen(value);
    auto result = std::from_chars(value, end, out, 10);
    return result.ec == std::errc{} && result.ptr == end;
}

} // namespace

KestrelConfiguration findConfiguration(int argc, char *argv[]) {
    std::filesystem::path configPath;
    if (argc > 1 && argv[1] && argv[1][0] != '\0') {
        configPath = argv[1];
    } else {
        std::error_code errc{};
        configPath = std::filesystem::current_path(errc) / KES_HOST_CONFIG_FILENAME;
        if (errc) {
            configPath = KES_HOST_CONFIG_FILENAME;
        }
    }
    return KestrelConfiguration(configPath.string());
}

KestrelConfiguration::KestrelConfiguration()
    : logPathname(KES_HOST_LOG_FILENAME), logLevel(KES_LOG_LEVEL_INFO), showCursor(false),
      escapeDelayMs(25), isNew(true), isDirty(true) {}

KestrelConfiguration::KestrelConfiguration(std::string pathname) : KestrelConfiguration() {
    iniPathname = std::move(pathname);
    int parseResult = ini_parse(iniPathname.c_str(), &KestrelConfiguration::handler, this);
    if (parseResult < 0) {
        //  missing or unreadable file, stay with defaults
        return;
    }
    isNew = false;
    isDirty = false;
    if (parseResult > 0) {
        fmt::print(stderr, "{}: first invalid setting at line {}\n", iniPathname, parseResult);
    }
}

bool KestrelConfiguration::save() {
    if (!isDirty)
        return true;

    FILE *fp = fopen(iniPathname.c_str(), "w");
    if (fp == NULL) {
        spdlog::error("KestrelConfiguration: failed to write {}", iniPathname);
        return false;
    }
    fmt::print(fp,
               "[host]\n"
               "logger={}\n"
               "logfile={}\n"
               "\n",
               logLevel, logPathname);
    fmt::print(fp,
               "[terminal]\n"
               "cursor={}\n"
               "escdelay={}\n",
               showCursor ? 1 : 0, escapeDelayMs);
    if (fclose(fp) == EOF) {
        spdlog::error("KestrelConfiguration: failed to finish writing {}", iniPathname);
        return false;
    }

    spdlog::info("Configuration saved to {}", iniPathname);

    isNew = false;
    isDirty = false;

    return true;
}

void KestrelConfiguration::setDirty() { isDirty = true; }

int KestrelConfiguration::handler(void *user, const char *section, const char *name,
                                  const char *value) {
    auto *config = reinterpret_cast<KestrelConfiguration *>(user);
    int valueInt = 0;
    if (strncmp(section, "host", 16) == 0) {
        if (strncmp(name, "logger", 16) == 0) {
            if (!parseInt(value, valueInt) || valueInt < KES_LOG_LEVEL_DEBUG ||
                valueInt > KES_LOG_LEVEL_ERROR) {
                fmt::print(stderr, "Invalid log level {}={}\n", name, value);
                return 0;
            }
            config->logLevel = valueInt;
        } else if (strncmp(name, "logfile", 16) == 0) {
            config->logPathname = value;
        }
    } else if (strncmp(section, "terminal", 16) == 0) {
        if (strncmp(name, "cursor", 16) == 0) {
            if (!parseInt(value, valueInt)) {
                fmt::print(stderr, "Invalid cursor setting {}={}\n", name, value);
                return 0;
            }
            config->showCursor = valueInt > 0;
        } else if (strncmp(name, "escdelay", 16) == 0) {
            if (!parseInt(value, valueInt) || valueInt < 0) {
                fmt::print(stderr, "Invalid escape delay {}={}\n", name, value);
                return 0;
            }
            config->escapeDelayMs = valueInt;
        }
    }

    return 1;
}
