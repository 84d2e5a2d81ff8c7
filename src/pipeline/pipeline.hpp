#pragma once

#include "piot/types.hpp"
#include "algo/classifier.hpp"
#include "protocol/frame.hpp"
#include <string>
#include <vector>

namespace piot {
namespace pipeline {

using protocol::SensorData;
using protocol::SensorFrame;
using protocol::SignalFrame;

// One day of hourly samples
constexpr size_t DEFAULT_TRAINING_WINDOW = 24;

struct PipelineConfig {
    std::string source = protocol::DEFAULT_SOURCE;            // Sensor address
    std::string destination = protocol::DEFAULT_DESTINATION;  // Network layer address
    std::string actuator = protocol::DEFAULT_ACTUATOR;        // Signal frame destination
    size_t training_window = DEFAULT_TRAINING_WINDOW;
};

struct PipelineResult {
    std::vector<SensorFrame> frames;        // Every decoded frame, in order
    std::vector<SensorFrame> essentials;    // Frames matching a rule
    std::vector<SignalFrame> signals;       // Commands derived from essentials
    algo::Statistics trained;               // After training
    algo::Statistics final_stats;           // After the last frame

    // Essential frames as a share of all frames (0 for an empty run)
    double essentialPercentage() const;
};

/**
 * PipelineDriver
 *
 * Simulates the network layer over a frame file:
 *   1. encodeRows(): readings -> frame file (sequence numbers from 1)
 *   2. loadFrames(): frame file -> frames, all-or-nothing
 *   3. classify(): train on the first `training_window` frames, then
 *      classify every frame (training frames included) in order
 */
class PipelineDriver {
public:
    explicit PipelineDriver(PipelineConfig config = {}) : config_(std::move(config)) {}

    const PipelineConfig& config() const { return config_; }

    // INVALID_ADDRESS unless source, destination and actuator are all valid
    Status validate() const;

    // Write one sensor frame per reading. Returns the number written.
    Result<size_t> encodeRows(const std::vector<SensorData>& rows, const std::string& frame_path) const;

    // Read a row file and encode it
    Result<size_t> encodeRowsFile(const std::string& rows_path, const std::string& frame_path) const;

    // Decode a frame file
    Result<std::vector<SensorFrame>> loadFrames(const std::string& frame_path) const;

    // Train and classify an in-memory frame sequence
    Result<PipelineResult> classify(std::vector<SensorFrame> frames) const;

    // loadFrames() + classify()
    Result<PipelineResult> run(const std::string& frame_path) const;

    // encodeRowsFile() + run()
    Result<PipelineResult> simulate(const std::string& rows_path, const std::string& frame_path) const;

private:
    PipelineConfig config_;
};

// Plot data: CSV "kind,date,time,value" with sensor, essential and signal
// rows. `value` is the signal name for signal rows, empty otherwise.
Status exportPlotTriples(const PipelineResult& result, const std::string& path);

// Multi-line listing, "<label>: <n>" followed by each frame
std::string framesToString(const std::vector<SensorFrame>& frames, const std::string& label);
std::string framesToString(const std::vector<SignalFrame>& frames, const std::string& label);

} // namespace pipeline
} // namespace piot
