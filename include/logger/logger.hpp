#pragma once

#include "message/message.hpp"
#include "utils/digest.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

constexpr size_t LOGGER_CAPACITY = 1024; // must be power of 2

enum class LogType : uint8_t { GENERIC, MESSAGE_BUILT, SERIALIZATION_ERROR };

struct RawLogEvent {
    LogType type;
    std::chrono::steady_clock::time_point ts;
    char component[32];

    // Generic text, error detail
    char msg[256];

    // For built messages and errors
    MessageFormat format{MessageFormat::JSON};
    size_t size{0};
    char digest[65];

    // For errors
    statusCodes::SerializationStatus status{};
    char field[32];
};

// Single-producer async logger: callers push into a ring buffer, a background
// thread formats and appends to the file.
class Logger {
public:
    Logger(const std::string& filename, bool enabled)
        : enabled_(enabled), running_(true), head_(0), tail_(0) {
        if (enabled_) {
            out_.open(filename, std::ios::out | std::ios::app);
            if (!out_) {
                throw std::runtime_error("Logger: cannot open " + filename);
            }
            worker_ = std::thread([this] { run(); });
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger() {
        stop();
        if (worker_.joinable()) worker_.join();
    }

    bool enabled() const { return enabled_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    inline void log(const std::string& msg, const std::string& component) noexcept {
        if (!enabled_) return;
        RawLogEvent ev{};
        ev.type = LogType::GENERIC;
        ev.ts = std::chrono::steady_clock::now();
        std::strncpy(ev.component, component.c_str(), sizeof(ev.component) - 1);
        std::strncpy(ev.msg, msg.c_str(), sizeof(ev.msg) - 1);
        push(ev);
    }

    // Throws std::runtime_error if the digest cannot be computed.
    inline void log(const Message& message, const std::string& component = "BUILDER") {
        if (!enabled_) return;
        RawLogEvent ev{};
        ev.type = LogType::MESSAGE_BUILT;
        ev.ts = std::chrono::steady_clock::now();
        std::strncpy(ev.component, component.c_str(), sizeof(ev.component) - 1);
        ev.format = message.format();
        ev.size = message.size();
        std::string digest = utils::sha256Hex(message.span());
        std::strncpy(ev.digest, digest.c_str(), sizeof(ev.digest) - 1);
        push(ev);
    }

    inline void log(const SerializationError& error,
                    const std::string& component = "BUILDER") noexcept {
        if (!enabled_) return;
        RawLogEvent ev{};
        ev.type = LogType::SERIALIZATION_ERROR;
        ev.ts = std::chrono::steady_clock::now();
        std::strncpy(ev.component, component.c_str(), sizeof(ev.component) - 1);
        ev.format = error.format;
        ev.status = error.status;
        std::strncpy(ev.field, error.field.c_str(), sizeof(ev.field) - 1);
        std::strncpy(ev.msg, error.detail.c_str(), sizeof(ev.msg) - 1);
        push(ev);
    }

    void stop() noexcept { running_.store(false, std::memory_order_release); }

private:
    inline void push(const RawLogEvent& ev) noexcept {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next = (head + 1) & (LOGGER_CAPACITY - 1);
        if (next == tail_.load(std::memory_order_acquire)) {
            // Buffer full - drop event to stay non-blocking
            dropped_++;
            return;
        }
        buffer_[head] = ev;
        head_.store(next, std::memory_order_release);
    }

    inline bool pop(RawLogEvent& ev) noexcept {
        size_t tail = tail_.load(std::memory_order_relaxed);
        if (tail == head_.load(std::memory_order_acquire)) return false;
        ev = buffer_[tail];
        tail_.store((tail + 1) & (LOGGER_CAPACITY - 1), std::memory_order_release);
        return true;
    }

    void run() {
        RawLogEvent ev{};
        std::ostringstream oss;

        while (running_.load(std::memory_order_acquire) || tail_.load() != head_.load()) {
            bool any = false;
            while (pop(ev)) {
                any = true;
                oss.str("");
                oss.clear();

                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              ev.ts.time_since_epoch())
                              .count();

                oss << "[" << ms << "] [" << ev.component << "] ";

                switch (ev.type) {
                case LogType::GENERIC:
                    oss << ev.msg;
                    break;

                case LogType::MESSAGE_BUILT:
                    oss << "MessageBuilt: Format=" << ev.format << " Size=" << ev.size
                        << " SHA256=" << ev.digest;
                    break;

                case LogType::SERIALIZATION_ERROR:
                    oss << "SerializationError: Format=" << ev.format
                        << " Status=" << statusCodes::toStr(ev.status);
                    if (ev.field[0] != '\0') oss << " Field=" << ev.field;
                    oss << " Detail=" << ev.msg;
                    break;
                }

                oss << "\n";
                out_ << oss.str();
            }

            if (any)
                out_.flush();
            else
                std::this_thread::sleep_for(std::chrono::microseconds(100));
        }

        out_.flush();

        if (dropped_ > 0) {
            std::cerr << "[Logger] Dropped " << dropped_ << " events (buffer full)\n";
        }
    }

private:
    std::ofstream out_;
    const bool enabled_;
    std::atomic<bool> running_;
    std::atomic<size_t> dropped_{0};

    alignas(64) RawLogEvent buffer_[LOGGER_CAPACITY];
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;

    std::thread worker_;
};
