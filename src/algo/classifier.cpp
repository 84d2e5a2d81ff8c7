#include "classifier.hpp"
#include "piot/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace piot {
namespace algo {

const char* frameFlagToString(FrameFlag flag) {
    switch (flag) {
        case FrameFlag::HTHH: return "HTHH";
        case FrameFlag::HTLH: return "HTLH";
        case FrameFlag::LTLH: return "LTLH";
        case FrameFlag::LTHH: return "LTHH";
        case FrameFlag::MTMH: return "MTMH";
        case FrameFlag::HTMH: return "HTMH";
        case FrameFlag::LTMH: return "LTMH";
        case FrameFlag::MTLH: return "MTLH";
        case FrameFlag::MTHH: return "MTHH";
        default:              return "UNKNOWN";
    }
}

Statistics Statistics::fromBounds(double lt, double ht, double lh, double hh) {
    Statistics s;
    s.lt = lt;
    s.ht = ht;
    s.mt = (ht + lt) / 2;
    s.lh = lh;
    s.hh = hh;
    s.mh = (hh + lh) / 2;
    return s;
}

std::string statisticsToString(const Statistics& stats) {
    char buf[160];
    snprintf(buf, sizeof(buf), "lt: %f  ht: %f mt: %f\nlh: %f  hh: %f mh: %f",
             stats.lt, stats.ht, stats.mt, stats.lh, stats.hh, stats.mh);
    return buf;
}

Result<Statistics> train(std::span<const SensorData> window) {
    if (window.empty()) {
        return Result<Statistics>::fail(ErrorKind::EMPTY_TRAINING_WINDOW,
                                        "training window has no frames");
    }

    double lt = window[0].temperature;
    double ht = window[0].temperature;
    double lh = window[0].humidity;
    double hh = window[0].humidity;
    for (const auto& reading : window) {
        lt = std::min(lt, reading.temperature);
        ht = std::max(ht, reading.temperature);
        lh = std::min(lh, reading.humidity);
        hh = std::max(hh, reading.humidity);
    }

    Statistics stats = Statistics::fromBounds(lt, ht, lh, hh);
    LOG_ALGO(DEBUG, "Trained on %zu readings: lt=%.2f ht=%.2f mt=%.2f lh=%.2f hh=%.2f mh=%.2f",
             window.size(), stats.lt, stats.ht, stats.mt, stats.lh, stats.hh, stats.mh);
    return Result<Statistics>::ok(stats);
}

Result<Statistics> train(std::span<const SensorFrame> window) {
    std::vector<SensorData> readings;
    readings.reserve(window.size());
    for (const auto& frame : window) {
        readings.push_back(frame.data);
    }
    return train(std::span<const SensorData>(readings));
}

std::optional<FrameFlag> evaluate(const Statistics& s, double temp, double humi) {
    const bool temp_high = temp >= s.ht;
    const bool temp_low  = temp <= s.lt;
    const bool temp_mid  = std::abs(temp - s.mt) <= MID_BAND_TOLERANCE;
    const bool humi_high = humi >= s.hh;
    const bool humi_low  = humi <= s.lh;
    const bool humi_mid  = std::abs(humi - s.mh) <= MID_BAND_TOLERANCE;

    // Bands overlap; the order below is the tie-break
    if (temp_high && humi_high) return FrameFlag::HTHH;
    if (temp_low  && humi_low)  return FrameFlag::LTLH;
    if (temp_high && humi_low)  return FrameFlag::HTLH;
    if (temp_low  && humi_high) return FrameFlag::LTHH;
    if (temp_high && humi_mid)  return FrameFlag::HTMH;
    if (temp_low  && humi_mid)  return FrameFlag::LTMH;
    if (temp_mid  && humi_low)  return FrameFlag::MTLH;
    if (temp_mid  && humi_high) return FrameFlag::MTHH;
    if (temp_mid  && humi_mid)  return FrameFlag::MTMH;
    return std::nullopt;
}

Statistics update(const Statistics& stats, double temp, double humi) {
    Statistics next = stats;

    if (temp < next.lt) next.lt = temp;
    if (temp > next.ht) next.ht = temp;
    next.mt = (next.mt + temp) / 2;

    if (humi < next.lh) next.lh = humi;
    if (humi > next.hh) next.hh = humi;
    next.mh = (next.mh + humi) / 2;

    return next;
}

Classification classify(const Statistics& stats, const SensorData& reading) {
    Classification result;
    result.flag = evaluate(stats, reading.temperature, reading.humidity);
    result.next = update(stats, reading.temperature, reading.humidity);
    return result;
}

std::optional<Signal> toggle(FrameFlag flag) {
    switch (flag) {
        case FrameFlag::HTHH: return Signal::LOW;
        case FrameFlag::LTLH: return Signal::HIGH;
        case FrameFlag::HTLH: return Signal::HIGH;
        case FrameFlag::HTMH: return Signal::LOW;
        case FrameFlag::LTMH: return Signal::LOW;
        case FrameFlag::MTLH: return Signal::HIGH;
        case FrameFlag::LTHH:
        case FrameFlag::MTHH:
        case FrameFlag::MTMH:
        default:
            return std::nullopt;
    }
}

Result<SignalFrame> makeSignalFrame(const SensorFrame& frame, Signal signal,
                                    const std::string& source, const std::string& actuator) {
    if (!protocol::isValidAddress(source) || !protocol::isValidAddress(actuator)) {
        return Result<SignalFrame>::fail(ErrorKind::INVALID_ADDRESS,
            "signal frame addresses '" + source + "' -> '" + actuator + "' are not 6 ASCII bytes");
    }

    protocol::SignalData data;
    data.timestamp = frame.data.timestamp;
    data.type = signal;
    return SignalFrame::make(data, frame.sequence, source, actuator);
}

// === Classifier ===

Result<Classifier> Classifier::fromTraining(std::span<const SensorFrame> window) {
    auto stats = train(window);
    if (!stats) {
        return Result<Classifier>::from(stats);
    }
    return Result<Classifier>::ok(Classifier(*stats));
}

std::optional<FrameFlag> Classifier::classify(const SensorFrame& frame) {
    Classification result = algo::classify(stats_, frame.data);
    stats_ = result.next;
    frames_seen_++;

    LOG_ALGO(TRACE, "Frame %llu: T=%.2f H=%.2f -> %s",
             static_cast<unsigned long long>(frame.sequence),
             frame.data.temperature, frame.data.humidity,
             result.flag ? frameFlagToString(*result.flag) : "-");
    return result.flag;
}

} // namespace algo
} // namespace piot
