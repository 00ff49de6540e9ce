#pragma once

#include <array>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wavchunk {

/**
 * @brief Represents a single log record.
 */
struct LogEntry {
    enum class Level {
        Info,
        Warning,
        Error
    };

    Level level = Level::Info;
    std::string tag;                 // Category, e.g. "Export", "WavFile"
    std::string message;
    std::optional<double> value;     // Numeric payload for events
};

/**
 * @brief Fixed-capacity ring buffer that overwrites the oldest item when full.
 */
template<typename T, size_t Size>
class RingBuffer {
public:
    static_assert((Size & (Size - 1)) == 0, "Size must be a power of 2");

    void push(const T& item) {
        buffer_[head_] = item;
        head_ = (head_ + 1) & mask;
        if (count_ < Size) {
            ++count_;
        }
    }

    /**
     * @brief Items in insertion order, oldest first.
     */
    std::vector<T> snapshot() const {
        std::vector<T> items;
        items.reserve(count_);
        const size_t start = (head_ + Size - count_) & mask;
        for (size_t i = 0; i < count_; ++i) {
            items.push_back(buffer_[(start + i) & mask]);
        }
        return items;
    }

    void clear() {
        head_ = 0;
        count_ = 0;
    }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

private:
    std::array<T, Size> buffer_{};
    static constexpr size_t mask = Size - 1;
    size_t head_ = 0;
    size_t count_ = 0;
};

/**
 * @brief Singleton logger shared by every file worker.
 *
 * Lines are written as "[Tag] message". Info goes to stdout, warnings and
 * errors to stderr. The last kHistorySize entries are kept for inspection.
 */
class ChunkLogger {
public:
    static constexpr size_t kHistorySize = 1024;

    static ChunkLogger& instance() {
        static ChunkLogger inst;
        return inst;
    }

    void info(std::string_view tag, std::string_view msg) {
        log(LogEntry::Level::Info, tag, msg, std::nullopt);
    }

    void warn(std::string_view tag, std::string_view msg) {
        log(LogEntry::Level::Warning, tag, msg, std::nullopt);
    }

    void error(std::string_view tag, std::string_view msg) {
        log(LogEntry::Level::Error, tag, msg, std::nullopt);
    }

    void log_event(std::string_view tag, std::string_view msg, double value) {
        log(LogEntry::Level::Info, tag, msg, value);
    }

    /**
     * @brief Suppress Info lines on the console. History is still recorded.
     */
    void set_quiet(bool quiet) {
        std::lock_guard<std::mutex> lock(mutex_);
        quiet_ = quiet;
    }

    bool quiet() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return quiet_;
    }

    std::vector<LogEntry> history() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return history_.snapshot();
    }

    void clear_history() {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.clear();
    }

private:
    ChunkLogger() = default;

    void log(LogEntry::Level level, std::string_view tag, std::string_view msg, std::optional<double> value) {
        LogEntry entry;
        entry.level = level;
        entry.tag = std::string(tag);
        entry.message = std::string(msg);
        entry.value = value;

        std::lock_guard<std::mutex> lock(mutex_);
        history_.push(entry);
        if (quiet_ && level == LogEntry::Level::Info) {
            return;
        }

        std::ostream& out = (level == LogEntry::Level::Info) ? std::cout : std::cerr;
        out << "[" << entry.tag << "] " << entry.message << std::endl;
    }

    mutable std::mutex mutex_;
    RingBuffer<LogEntry, kHistorySize> history_;
    bool quiet_ = false;
};

} // namespace wavchunk
