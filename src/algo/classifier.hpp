#pragma once

#include "piot/types.hpp"
#include "protocol/frame.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace piot {
namespace algo {

using protocol::SensorData;
using protocol::SensorFrame;
using protocol::Signal;
using protocol::SignalFrame;

// Outcome of classifying one reading: temperature band (H/L/M) then
// humidity band (H/L/M), relative to the running statistics.
enum class FrameFlag : uint8_t {
    HTHH = 1,
    HTLH = 2,
    LTLH = 3,
    LTHH = 4,
    MTMH = 5,
    HTMH = 6,
    LTMH = 7,
    MTLH = 8,
    MTHH = 9,
};

const char* frameFlagToString(FrameFlag flag);

// Half-width of the "mid" band, in the reading's own unit (°C or %)
constexpr double MID_BAND_TOLERANCE = 1.5;

// Running low/high/mid statistics for temperature and humidity
struct Statistics {
    double lt = 0.0;    // low  temperature
    double ht = 0.0;    // high temperature
    double mt = 0.0;    // mid  temperature
    double lh = 0.0;    // low  humidity
    double hh = 0.0;    // high humidity
    double mh = 0.0;    // mid  humidity

    // Mid values are the midpoint of low and high
    static Statistics fromBounds(double lt, double ht, double lh, double hh);

    bool operator==(const Statistics&) const = default;
};

std::string statisticsToString(const Statistics& stats);

// Seed statistics from the min/max of a training window.
// Fails with EMPTY_TRAINING_WINDOW if the window is empty.
Result<Statistics> train(std::span<const SensorData> window);
Result<Statistics> train(std::span<const SensorFrame> window);

// Apply the nine rules in priority order against `stats`; first match wins
std::optional<FrameFlag> evaluate(const Statistics& stats, double temperature, double humidity);

// Fold one reading into the statistics: widen low/high, and move each mid
// halfway toward the reading
Statistics update(const Statistics& stats, double temperature, double humidity);

struct Classification {
    std::optional<FrameFlag> flag;  // nullopt = non-essential
    Statistics next;                // statistics after this reading
};

// Decide with the statistics as they were before this reading, then update
Classification classify(const Statistics& stats, const SensorData& reading);

// Actuator command for a flag; nullopt where no command is issued
std::optional<Signal> toggle(FrameFlag flag);

// Signal frame for an essential sensor frame: carries the reading's
// timestamp and sequence number, addressed to the actuator.
// Fails with INVALID_ADDRESS if either address is not 6 ASCII bytes.
Result<SignalFrame> makeSignalFrame(const SensorFrame& frame, Signal signal,
                                    const std::string& source = protocol::DEFAULT_SOURCE,
                                    const std::string& actuator = protocol::DEFAULT_ACTUATOR);

/**
 * Classifier
 *
 * Owns one Statistics value and applies classify() to frames in arrival
 * order. Results depend on the order frames are fed in.
 */
class Classifier {
public:
    explicit Classifier(const Statistics& initial) : stats_(initial) {}

    // Train on a window of frames
    static Result<Classifier> fromTraining(std::span<const SensorFrame> window);

    // Classify and update. Returns the flag for this frame, if essential.
    std::optional<FrameFlag> classify(const SensorFrame& frame);

    const Statistics& statistics() const { return stats_; }
    size_t framesSeen() const { return frames_seen_; }

private:
    Statistics stats_;
    size_t frames_seen_ = 0;
};

} // namespace algo
} // namespace piot
