#ifndef KES_HOST_CONFIGURATION_HPP
#define KES_HOST_CONFIGURATION_HPP

#include <string>

#define KES_HOST_APPLICATION_NAME "Kestrel"
#define KES_HOST_CONFIG_FILENAME  "kestrel.ini"
#define KES_HOST_LOG_FILENAME     "kestrel.log"

#define KES_LOG_LEVEL_DEBUG 0
#define KES_LOG_LEVEL_INFO  1
#define KES_LOG_LEVEL_WARN  2
#define KES_LOG_LEVEL_ERROR 3

struct KestrelConfiguration {
    std::string iniPathname;
    std::string logPathname;
    int logLevel;
    bool showCursor;
    int escapeDelayMs;

    KestrelConfiguration();
    KestrelConfiguration(std::string pathname);

    //  true if the configuration file could not be opened (defaults are in use)
    bool isNewInstall() const { return isNew; }

    // clears the dirty flag
    bool save();
    // sets the dirty flag
    void setDirty();
    bool getDirty() const { return isDirty; }

  private:
    static int handler(void *user, const char *section, const char *name, const char *value);
    bool isNew;
    bool isDirty;
};

//  The first command line argument, if present, names the configuration file.
//  Otherwise kestrel.ini in the working directory is used.
KestrelConfiguration findConfiguration(int argc, char *argv[]);

#endif
