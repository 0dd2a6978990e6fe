#pragma once
#include <string>

// Installs the stderr logger used by the engine and the CLI.
// level: trace|debug|info|warn|error|off. CK_LOG_LEVEL overrides it.
void init_logging(const std::string& level);

// Re-applies a level after startup (--verbose / --quiet).
void set_log_level(const std::string& level);
