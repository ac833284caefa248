#ifndef KES_HOST_LOGGER_HPP
#define KES_HOST_LOGGER_HPP

struct KestrelConfiguration;

//  Installs the default spdlog logger.  Output goes to the configured log file,
//  since the terminal is owned by curses while the application runs.  Returns
//  false if the log file could not be opened.  Logging then goes to stderr, at
//  error level or above only.
bool setupLogger(const KestrelConfiguration &config);

#endif
