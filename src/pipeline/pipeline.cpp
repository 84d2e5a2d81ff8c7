#include "pipeline.hpp"
#include "rows.hpp"
#include "protocol/frame_stream.hpp"
#include "piot/logging.hpp"
#include <algorithm>
#include <fstream>
#include <span>
#include <utility>

namespace piot {
namespace pipeline {

double PipelineResult::essentialPercentage() const {
    if (frames.empty()) return 0.0;
    return static_cast<double>(essentials.size()) * 100.0 / static_cast<double>(frames.size());
}

Status PipelineDriver::validate() const {
    const std::pair<const char*, const std::string*> addresses[] = {
        {"source", &config_.source},
        {"destination", &config_.destination},
        {"actuator", &config_.actuator},
    };
    for (const auto& [name, address] : addresses) {
        if (!protocol::isValidAddress(*address)) {
            LOG_PIPE(ERROR, "Invalid %s address '%s'", name, address->c_str());
            return Status::fail(ErrorKind::INVALID_ADDRESS,
                std::string(name) + " address '" + *address + "' is not 6 ASCII bytes");
        }
    }
    return Status::ok();
}

Result<size_t> PipelineDriver::encodeRows(const std::vector<SensorData>& rows,
                                          const std::string& frame_path) const {
    Status status = validate();
    if (!status) {
        return Result<size_t>::from(status);
    }

    protocol::FrameFileWriter<SensorData> writer(frame_path);
    status = writer.open();
    if (!status) {
        return Result<size_t>::from(status);
    }

    for (size_t i = 0; i < rows.size(); i++) {
        auto frame = SensorFrame::make(rows[i], i + 1, config_.source, config_.destination);
        if (!frame) {
            return Result<size_t>::from(frame);
        }
        status = writer.write(*frame);
        if (!status) {
            LOG_PIPE(ERROR, "Encoding row %zu: %s", i + 1, status.detail.c_str());
            return Result<size_t>::from(status);
        }
    }

    status = writer.close();
    if (!status) {
        return Result<size_t>::from(status);
    }

    LOG_PIPE(INFO, "Encoded %zu frames (%zu bytes) to %s",
             writer.framesWritten(), writer.framesWritten() * SensorFrame::SIZE, frame_path.c_str());
    return Result<size_t>::ok(writer.framesWritten());
}

Result<size_t> PipelineDriver::encodeRowsFile(const std::string& rows_path,
                                              const std::string& frame_path) const {
    auto rows = readRows(rows_path);
    if (!rows) {
        return Result<size_t>::from(rows);
    }
    return encodeRows(*rows, frame_path);
}

Result<std::vector<SensorFrame>> PipelineDriver::loadFrames(const std::string& frame_path) const {
    auto frames = protocol::readFrameFile<SensorData>(frame_path);
    if (frames) {
        LOG_PIPE(INFO, "Decoded %zu frames from %s", frames->size(), frame_path.c_str());
    }
    return frames;
}

Result<PipelineResult> PipelineDriver::classify(std::vector<SensorFrame> frames) const {
    Status status = validate();
    if (!status) {
        return Result<PipelineResult>::from(status);
    }

    PipelineResult result;
    result.frames = std::move(frames);

    size_t window = std::min(config_.training_window, result.frames.size());
    std::span<const SensorFrame> sample(result.frames.data(), window);

    auto classifier = algo::Classifier::fromTraining(sample);
    if (!classifier) {
        LOG_PIPE(ERROR, "Training failed: %s", classifier.detail.c_str());
        return Result<PipelineResult>::from(classifier);
    }
    result.trained = classifier->statistics();
    LOG_PIPE(DEBUG, "Trained on %zu frames\n%s", window,
             algo::statisticsToString(result.trained).c_str());

    for (const auto& frame : result.frames) {
        auto flag = classifier->classify(frame);
        if (!flag) continue;

        result.essentials.push_back(frame);

        auto signal = algo::toggle(*flag);
        if (!signal) continue;

        auto signal_frame = algo::makeSignalFrame(frame, *signal, config_.source, config_.actuator);
        if (!signal_frame) {
            return Result<PipelineResult>::from(signal_frame);
        }
        result.signals.push_back(std::move(*signal_frame));
    }

    result.final_stats = classifier->statistics();
    LOG_PIPE(INFO, "Classified %zu frames: %zu essential (%.2f%%), %zu signals",
             result.frames.size(), result.essentials.size(),
             result.essentialPercentage(), result.signals.size());

    return Result<PipelineResult>::ok(std::move(result));
}

Result<PipelineResult> PipelineDriver::run(const std::string& frame_path) const {
    Status status = validate();
    if (!status) {
        return Result<PipelineResult>::from(status);
    }

    auto frames = loadFrames(frame_path);
    if (!frames) {
        return Result<PipelineResult>::from(frames);
    }
    return classify(std::move(*frames));
}

Result<PipelineResult> PipelineDriver::simulate(const std::string& rows_path,
                                                const std::string& frame_path) const {
    auto written = encodeRowsFile(rows_path, frame_path);
    if (!written) {
        return Result<PipelineResult>::from(written);
    }
    return run(frame_path);
}

Status exportPlotTriples(const PipelineResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_PIPE(ERROR, "Cannot open %s for writing", path.c_str());
        return Status::fail(ErrorKind::IO_ERROR, "cannot open " + path + " for writing");
    }

    file << "kind,date,time,value\n";
    for (const auto& frame : result.frames) {
        file << "sensor," << protocol::formatDate(frame.data.timestamp) << ","
             << protocol::formatTime(frame.data.timestamp) << ",\n";
    }
    for (const auto& frame : result.essentials) {
        file << "essential," << protocol::formatDate(frame.data.timestamp) << ","
             << protocol::formatTime(frame.data.timestamp) << ",\n";
    }
    for (const auto& frame : result.signals) {
        file << "signal," << protocol::formatDate(frame.data.timestamp) << ","
             << protocol::formatTime(frame.data.timestamp) << ","
             << protocol::signalToString(frame.data.type) << "\n";
    }

    file.close();
    if (file.fail()) {
        return Status::fail(ErrorKind::IO_ERROR, "write failed on " + path);
    }

    LOG_PIPE(INFO, "Exported plot data to %s", path.c_str());
    return Status::ok();
}

namespace {

template <typename FrameList>
std::string listFrames(const FrameList& frames, const std::string& label) {
    std::string out;
    for (size_t i = 0; i < frames.size(); i++) {
        out += label + ": " + std::to_string(i + 1) + "\n";
        out += protocol::frameToString(frames[i]);
    }
    return out;
}

} // anonymous namespace

std::string framesToString(const std::vector<SensorFrame>& frames, const std::string& label) {
    return listFrames(frames, label);
}

std::string framesToString(const std::vector<SignalFrame>& frames, const std::string& label) {
    return listFrames(frames, label);
}

} // namespace pipeline
} // namespace piot
