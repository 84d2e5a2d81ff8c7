#pragma once

#include "frame.hpp"
#include "piot/logging.hpp"
#include <fstream>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace piot {
namespace protocol {

/**
 * FrameStreamReader
 *
 * Decodes a flat concatenation of fixed-size frames, one frame at a time,
 * validating each checksum as it goes.
 *
 * The first error (truncated tail, bad payload, checksum mismatch, I/O)
 * is terminal: next() returns nullopt from then on and error() reports
 * it. A clean end of stream is exhausted() with no error.
 *
 * rewind() re-opens the source and restarts from the first frame.
 */
template <typename Payload>
class FrameStreamReader {
public:
    using FrameType = Frame<Payload>;
    using SourceFactory = std::function<std::unique_ptr<std::istream>()>;

    FrameStreamReader(SourceFactory open_source, std::string name)
        : open_source_(std::move(open_source)), name_(std::move(name)) {}

    static FrameStreamReader fromFile(const std::string& path) {
        return FrameStreamReader([path]() -> std::unique_ptr<std::istream> {
            return std::make_unique<std::ifstream>(path, std::ios::binary);
        }, path);
    }

    static FrameStreamReader fromBytes(Bytes bytes) {
        return FrameStreamReader([bytes]() -> std::unique_ptr<std::istream> {
            return std::make_unique<std::istringstream>(
                std::string(bytes.begin(), bytes.end()), std::ios::binary);
        }, "<memory>");
    }

    // Decode the next frame. Returns nullopt at end of stream or on error.
    std::optional<FrameType> next() {
        if (!opened_) {
            open();
        }
        if (failed()) {
            return std::nullopt;
        }

        uint64_t remaining = total_bytes_ - consumed_;
        if (remaining == 0) {
            return std::nullopt;
        }
        if (remaining < FrameType::SIZE) {
            setError(ErrorKind::TRUNCATED_STREAM,
                     std::to_string(remaining) + " trailing bytes after frame " +
                     std::to_string(frames_read_) + " in " + name_);
            return std::nullopt;
        }

        Bytes buffer(FrameType::SIZE);
        stream_->read(reinterpret_cast<char*>(buffer.data()), FrameType::SIZE);
        if (static_cast<size_t>(stream_->gcount()) != FrameType::SIZE) {
            setError(ErrorKind::IO_ERROR, "short read from " + name_);
            return std::nullopt;
        }
        consumed_ += FrameType::SIZE;

        auto frame = FrameType::decode(buffer);
        if (!frame) {
            setError(frame.error, frame.detail + " (record " +
                     std::to_string(frames_read_ + 1) + " of " + name_ + ")");
            return std::nullopt;
        }

        frames_read_++;
        LOG_STREAM(TRACE, "Read frame %llu", static_cast<unsigned long long>(frame->sequence));
        return std::move(*frame);
    }

    // Re-open the source and start over
    void rewind() {
        stream_.reset();
        opened_ = false;
        total_bytes_ = 0;
        consumed_ = 0;
        frames_read_ = 0;
        error_ = ErrorKind::NONE;
        error_detail_.clear();
    }

    // Decode every remaining frame, or fail with the first error
    Result<std::vector<FrameType>> readAll() {
        std::vector<FrameType> frames;
        while (auto frame = next()) {
            frames.push_back(std::move(*frame));
        }
        if (failed()) {
            return Result<std::vector<FrameType>>::fail(error_, error_detail_);
        }
        return Result<std::vector<FrameType>>::ok(std::move(frames));
    }

    bool failed() const { return error_ != ErrorKind::NONE; }
    bool exhausted() const { return opened_ && !failed() && consumed_ == total_bytes_; }
    ErrorKind error() const { return error_; }
    const std::string& errorDetail() const { return error_detail_; }
    Status status() const { return failed() ? Status::fail(error_, error_detail_) : Status::ok(); }

    size_t framesRead() const { return frames_read_; }
    uint64_t totalBytes() const { return total_bytes_; }

private:
    void open() {
        opened_ = true;
        stream_ = open_source_();
        if (!stream_ || !stream_->good()) {
            setError(ErrorKind::IO_ERROR, "cannot open " + name_);
            return;
        }

        stream_->seekg(0, std::ios::end);
        auto size = stream_->tellg();
        stream_->seekg(0, std::ios::beg);
        if (size < 0 || !stream_->good()) {
            setError(ErrorKind::IO_ERROR, "cannot determine size of " + name_);
            return;
        }

        total_bytes_ = static_cast<uint64_t>(size);
        LOG_STREAM(DEBUG, "Opened %s: %llu bytes, %llu whole frames of %zu bytes",
                   name_.c_str(),
                   static_cast<unsigned long long>(total_bytes_),
                   static_cast<unsigned long long>(total_bytes_ / FrameType::SIZE),
                   FrameType::SIZE);
    }

    void setError(ErrorKind kind, std::string detail) {
        error_ = kind;
        error_detail_ = std::move(detail);
        LOG_STREAM(ERROR, "%s: %s", errorKindToString(kind), error_detail_.c_str());
    }

    SourceFactory open_source_;
    std::string name_;
    std::unique_ptr<std::istream> stream_;
    bool opened_ = false;
    uint64_t total_bytes_ = 0;
    uint64_t consumed_ = 0;
    size_t frames_read_ = 0;
    ErrorKind error_ = ErrorKind::NONE;
    std::string error_detail_;
};

/**
 * FrameFileWriter
 *
 * Appends encoded frames to a flat frame file. The file is truncated on
 * open() and closed by close() or the destructor.
 */
template <typename Payload>
class FrameFileWriter {
public:
    explicit FrameFileWriter(std::string path) : path_(std::move(path)) {}

    Status open() {
        file_.open(path_, std::ios::binary | std::ios::trunc);
        if (!file_.is_open()) {
            LOG_STREAM(ERROR, "Cannot open %s for writing", path_.c_str());
            return Status::fail(ErrorKind::IO_ERROR, "cannot open " + path_ + " for writing");
        }
        frames_written_ = 0;
        return Status::ok();
    }

    Status write(const Frame<Payload>& frame) {
        if (!file_.is_open()) {
            return Status::fail(ErrorKind::IO_ERROR, path_ + " is not open");
        }

        auto bytes = frame.encode();
        if (!bytes) {
            return bytes.status();
        }

        file_.write(reinterpret_cast<const char*>(bytes->data()),
                    static_cast<std::streamsize>(bytes->size()));
        if (!file_.good()) {
            return Status::fail(ErrorKind::IO_ERROR, "write failed on " + path_);
        }

        frames_written_++;
        return Status::ok();
    }

    Status close() {
        if (!file_.is_open()) {
            return Status::ok();
        }
        file_.close();
        if (file_.fail()) {
            return Status::fail(ErrorKind::IO_ERROR, "close failed on " + path_);
        }
        LOG_STREAM(DEBUG, "Wrote %zu frames to %s", frames_written_, path_.c_str());
        return Status::ok();
    }

    size_t framesWritten() const { return frames_written_; }

private:
    std::string path_;
    std::ofstream file_;
    size_t frames_written_ = 0;
};

// Write a whole frame sequence to `path`
template <typename Payload>
Status writeFrameFile(const std::string& path, const std::vector<Frame<Payload>>& frames) {
    FrameFileWriter<Payload> writer(path);
    Status status = writer.open();
    if (!status) return status;

    for (const auto& frame : frames) {
        status = writer.write(frame);
        if (!status) return status;
    }
    return writer.close();
}

// Read a whole frame file, all-or-nothing
template <typename Payload>
Result<std::vector<Frame<Payload>>> readFrameFile(const std::string& path) {
    return FrameStreamReader<Payload>::fromFile(path).readAll();
}

} // namespace protocol
} // namespace piot
