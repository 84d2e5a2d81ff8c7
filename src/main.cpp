#include "piot/logging.hpp"
#include "config/settings.hpp"
#include "pipeline/pipeline.hpp"
#include "protocol/frame_stream.hpp"

#include <iostream>
#include <cstring>
#include <string>

using namespace piot;

void printUsage(const char* prog) {
    std::cerr << "piot - Power-aware IoT frame filter\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  encode [rows] [frames]  Encode timestamp,temperature,humidity rows to a frame file\n";
    std::cerr << "  run [frames]            Train on the first day and classify a frame file\n";
    std::cerr << "  simulate [rows] [frames] encode then run\n";
    std::cerr << "  dump [frames]           Print every frame of a frame file\n";
    std::cerr << "  config                  Write current settings to the settings file\n";
    std::cerr << "  info                    Show frame layout and settings\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c <file>       Settings file (default: " << config::Settings::getDefaultPath() << ")\n";
    std::cerr << "  -w <n>          Training window in frames (default: 24)\n";
    std::cerr << "  -s <addr>       Source address (6 chars)\n";
    std::cerr << "  -d <addr>       Destination address (6 chars)\n";
    std::cerr << "  -e              Print essential frames\n";
    std::cerr << "  -g              Print signal frames\n";
    std::cerr << "  -x <file>       Export plot data (kind,date,time,value) to CSV\n";
    std::cerr << "  -v              Debug logging\n";
    std::cerr << "  -q              Errors only\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " encode input/data.csv input/frames.bin\n";
    std::cerr << "  " << prog << " run input/frames.bin -e\n";
    std::cerr << "  " << prog << " simulate -x plot.csv\n";
    std::cerr << "\n";
}

void printInfo(const config::Settings& settings, const std::string& settings_path) {
    std::cout << "=== piot ===\n\n";

    std::cout << "Frame layout:\n";
    std::cout << "  Header:         " << protocol::SensorFrame::HEADER_SIZE << " bytes (src 6, dst 6, seq 4)\n";
    std::cout << "  Sensor payload: " << protocol::SensorFrame::PAYLOAD_SIZE << " bytes\n";
    std::cout << "  Signal payload: " << protocol::SignalFrame::PAYLOAD_SIZE << " bytes\n";
    std::cout << "  Checksum:       " << protocol::CHECKSUM_SIZE << " bytes (MD5 of payload)\n";
    std::cout << "  Sensor frame:   " << protocol::SensorFrame::SIZE << " bytes\n";
    std::cout << "  Signal frame:   " << protocol::SignalFrame::SIZE << " bytes\n";
    std::cout << "\n";

    std::cout << "Settings (" << settings_path << "):\n";
    std::cout << "  Source:          " << settings.source << "\n";
    std::cout << "  Destination:     " << settings.destination << "\n";
    std::cout << "  Actuator:        " << settings.actuator << "\n";
    std::cout << "  Rows file:       " << settings.rows_path << "\n";
    std::cout << "  Frames file:     " << settings.frames_path << "\n";
    std::cout << "  Training window: " << settings.training_window << " frames\n";
    std::cout << "  Log level:       " << logLevelToString(settings.log_level) << "\n";
}

int reportError(const char* what, const Status& status) {
    LOG_ERROR("MAIN", "%s failed: %s: %s", what, errorKindToString(status.error), status.detail.c_str());
    std::cerr << "Error: " << status.detail << "\n";
    return 1;
}

int runEncode(const pipeline::PipelineDriver& driver, const std::string& rows, const std::string& frames) {
    auto written = driver.encodeRowsFile(rows, frames);
    if (!written) {
        return reportError("encode", written.status());
    }
    std::cout << "Encoded " << *written << " frames to " << frames << "\n";
    return 0;
}

int printResult(const pipeline::PipelineResult& result, bool print_essentials, bool print_signals,
                const char* export_path) {
    if (export_path) {
        Status status = pipeline::exportPlotTriples(result, export_path);
        if (!status) {
            return reportError("export", status);
        }
    }

    std::cout << "Essential Frame Count: " << result.essentials.size() << "\n";
    std::cout << "   Signal Frame Count: " << result.signals.size() << "\n";

    if (print_essentials) {
        std::cout << pipeline::framesToString(result.essentials, "Essential Frame");
    }
    if (print_signals) {
        std::cout << pipeline::framesToString(result.signals, "Signal Frame");
    }
    return 0;
}

int runDump(const std::string& frames) {
    auto reader = protocol::FrameStreamReader<protocol::SensorData>::fromFile(frames);
    while (auto frame = reader.next()) {
        std::cout << protocol::frameToString(*frame);
    }
    if (reader.failed()) {
        return reportError("dump", reader.status());
    }
    std::cout << reader.framesRead() << " frames\n";
    return 0;
}

int main(int argc, char* argv[]) {
    const char* settings_file = nullptr;
    const char* window_arg = nullptr;
    const char* source_arg = nullptr;
    const char* destination_arg = nullptr;
    const char* export_path = nullptr;
    const char* command = nullptr;
    const char* arg1 = nullptr;
    const char* arg2 = nullptr;
    bool print_essentials = false;
    bool print_signals = false;
    bool verbose = false;
    bool quiet = false;

    // Options can appear before or after the command
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            settings_file = argv[++i];
        } else if (strcmp(argv[i], "-w") == 0 && i + 1 < argc) {
            window_arg = argv[++i];
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            source_arg = argv[++i];
        } else if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            destination_arg = argv[++i];
        } else if (strcmp(argv[i], "-x") == 0 && i + 1 < argc) {
            export_path = argv[++i];
        } else if (strcmp(argv[i], "-e") == 0) {
            print_essentials = true;
        } else if (strcmp(argv[i], "-g") == 0) {
            print_signals = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-q") == 0) {
            quiet = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            // Non-option arguments: command, then up to two paths
            if (!command) {
                command = argv[i];
            } else if (!arg1) {
                arg1 = argv[i];
            } else if (!arg2) {
                arg2 = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!command) {
        printUsage(argv[0]);
        return 1;
    }

    // Settings file first, then command-line overrides
    config::Settings settings;
    std::string settings_path = settings_file ? settings_file : config::Settings::getDefaultPath();
    if (!settings.load(settings_path) && settings_file) {
        std::cerr << "Error: Cannot read settings file: " << settings_path << "\n";
        return 1;
    }

    if (window_arg) {
        if (!config::parseFrameCount(window_arg, settings.training_window)) {
            std::cerr << "Error: -w needs a frame count, got '" << window_arg << "'\n";
            return 1;
        }
    }
    if (source_arg) settings.source = source_arg;
    if (destination_arg) settings.destination = destination_arg;

    setLogLevel(settings.log_level);
    if (verbose) setLogLevel(LogLevel::DEBUG);
    if (quiet) setLogLevel(LogLevel::ERROR);

    pipeline::PipelineDriver driver(settings.toPipelineConfig());

    if (strcmp(command, "info") == 0) {
        printInfo(settings, settings_path);
        return 0;
    } else if (strcmp(command, "config") == 0) {
        if (!settings.save(settings_path)) {
            std::cerr << "Error: Cannot write settings file: " << settings_path << "\n";
            return 1;
        }
        std::cout << "Settings written to " << settings_path << "\n";
        return 0;
    } else if (strcmp(command, "encode") == 0) {
        return runEncode(driver, arg1 ? arg1 : settings.rows_path, arg2 ? arg2 : settings.frames_path);
    } else if (strcmp(command, "run") == 0) {
        auto result = driver.run(arg1 ? arg1 : settings.frames_path);
        if (!result) {
            return reportError("run", result.status());
        }
        return printResult(*result, print_essentials, print_signals, export_path);
    } else if (strcmp(command, "simulate") == 0) {
        auto result = driver.simulate(arg1 ? arg1 : settings.rows_path, arg2 ? arg2 : settings.frames_path);
        if (!result) {
            return reportError("simulate", result.status());
        }
        return printResult(*result, print_essentials, print_signals, export_path);
    } else if (strcmp(command, "dump") == 0) {
        return runDump(arg1 ? arg1 : settings.frames_path);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }
}
