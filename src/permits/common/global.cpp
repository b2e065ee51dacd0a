#include <unistd.h>
#include "permits/common/config.hpp"
#include "permits/common/global.hpp"
#include "permits/common/log.hpp"

// Until someone redirects it, everything goes to stderr so stdout stays with the application
int g_output_fd = STDERR_FILENO;
bool g_quiet = false;
bool g_verbose = false;

void initialize_globals() {
    if (!Config::initialize()) {
        WARN("Failed to initialize the configuration file, using defaults");
    }

    if (g_config.verbose) {
        enable_verbose();
    }

    if (g_config.quiet) {
        disable_logging();
    }

    VERBOSE("Configuration loaded from %s", g_config.path().c_str());
}
