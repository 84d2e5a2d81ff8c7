#include "settings.hpp"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace piot {
namespace config {

bool parseFrameCount(const std::string& text, size_t& count) {
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    unsigned long long n = std::strtoull(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) {
        return false;
    }

    count = static_cast<size_t>(n);
    return true;
}

// Get default settings file path
std::string Settings::getDefaultPath() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/piot/settings.ini";
    }
    return "settings.ini";
}

// Helper to create the parent directory if it doesn't exist
static bool ensureParentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        LOG_WARN("CONFIG", "Cannot create %s: %s", parent.string().c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

// Save settings to INI file
bool Settings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    if (!ensureParentDirectory(filepath)) {
        return false;
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    file << "[Station]\n";
    file << "source=" << source << "\n";
    file << "destination=" << destination << "\n";
    file << "actuator=" << actuator << "\n";

    file << "\n[Files]\n";
    file << "rows=" << rows_path << "\n";
    file << "frames=" << frames_path << "\n";

    file << "\n[Algorithm]\n";
    file << "training_window=" << training_window << "\n";

    file << "\n[Logging]\n";
    file << "level=" << logLevelToString(log_level) << "\n";

    file.close();
    return !file.fail();
}

// Load settings from INI file
bool Settings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        // Station
        if (key == "source") {
            source = value;
        } else if (key == "destination") {
            destination = value;
        } else if (key == "actuator") {
            actuator = value;
        }
        // Files
        else if (key == "rows") {
            rows_path = value;
        } else if (key == "frames") {
            frames_path = value;
        }
        // Algorithm
        else if (key == "training_window") {
            if (!parseFrameCount(value, training_window)) {
                LOG_WARN("CONFIG", "Ignoring training_window=%s", value.c_str());
            }
        }
        // Logging
        else if (key == "level") {
            if (!parseLogLevel(value, log_level)) {
                LOG_WARN("CONFIG", "Ignoring unknown log level '%s'", value.c_str());
            }
        }
    }

    return true;
}

pipeline::PipelineConfig Settings::toPipelineConfig() const {
    pipeline::PipelineConfig cfg;
    cfg.source = source;
    cfg.destination = destination;
    cfg.actuator = actuator;
    cfg.training_window = training_window;
    return cfg;
}

} // namespace config
} // namespace piot
