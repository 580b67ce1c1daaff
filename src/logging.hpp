#pragma once

#include <string>

namespace emu::logging {

enum class Sink {
    File,    // Interactive mode: the terminal belongs to the renderer
    Stderr   // Headless commands
};

struct LoggingConfig {
    Sink sink = Sink::File;
    std::string level = "info";
    std::string file_path;  // Empty: default_log_path()
};

// Installs the default spdlog logger
void init(const LoggingConfig& config);

[[nodiscard]] std::string default_log_path();

} // namespace emu::logging
