#pragma once

#include "piot/logging.hpp"
#include "pipeline/pipeline.hpp"
#include <string>

namespace piot {
namespace config {

// Persistent settings (INI file)
struct Settings {
    // Save/load to file. An empty path means getDefaultPath().
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // $HOME/.config/piot/settings.ini, or settings.ini without $HOME
    static std::string getDefaultPath();

    // Station addresses (6 ASCII chars each)
    std::string source = protocol::DEFAULT_SOURCE;
    std::string destination = protocol::DEFAULT_DESTINATION;
    std::string actuator = protocol::DEFAULT_ACTUATOR;

    // Files
    std::string rows_path = "input/data.csv";
    std::string frames_path = "input/frames.bin";

    // Algorithm
    size_t training_window = pipeline::DEFAULT_TRAINING_WINDOW;

    // Logging
    LogLevel log_level = LogLevel::INFO;

    pipeline::PipelineConfig toPipelineConfig() const;
};

// Parse a frame count: decimal digits only, no sign or whitespace
bool parseFrameCount(const std::string& text, size_t& count);

} // namespace config
} // namespace piot
