/**
 * @file logger.hpp
 * @brief Logging utilities for remotectl.
 *
 * Provides a singleton Logger with a replaceable sink, a minimum level and
 * logging macros for each level. The default sink writes to stderr with a
 * monotonic millisecond timestamp.
 */
#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <chrono>
#include <iostream>

namespace remotectl {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

    /**
     * @class Logger
     * @brief Singleton logger shared by every remotectl component.
     *
     * Thread-safe: the sink is always invoked under the logger mutex, so a
     * sink never sees two messages at once.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level. LogLevel::Off silences everything.
         */
        void setLevel(LogLevel lvl) {
            std::scoped_lock lk(m_);
            level_ = lvl;
        }

        LogLevel level() const {
            std::scoped_lock lk(m_);
            return level_;
        }

        /**
         * @brief Replace the sink. Passing an empty function restores the default.
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = s ? std::move(s) : defaultSink();
        }

        void log(LogLevel lvl, const std::string& msg) {
            std::scoped_lock lk(m_);
            if (lvl < level_ || lvl == LogLevel::Off) return;
            sink_(lvl, msg);
        }

        static const char* levelName(LogLevel l) {
            static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR","OFF" };
            return names[static_cast<int>(l)];
        }

    private:
        Logger() : sink_(defaultSink()) {}

        static Sink defaultSink() {
            return [](LogLevel l, const std::string& m) {
                using namespace std::chrono;
                static const auto start = steady_clock::now();
                auto ms = duration_cast<milliseconds>(steady_clock::now() - start).count();
                std::cerr << "[" << ms << "ms][" << levelName(l) << "] " << m << '\n';
            };
        }

        mutable std::mutex m_;
        LogLevel   level_{ LogLevel::Info };
        Sink       sink_;
    };

    /**
     * @brief Mask a secret for logging, keeping only its last character.
     *
     * "123456" becomes "*****6"; strings of one character or less are fully masked.
     */
    inline std::string maskSecret(std::string_view secret) {
        if (secret.size() <= 1) return std::string(secret.size(), '*');
        std::string out(secret.size() - 1, '*');
        out.push_back(secret.back());
        return out;
    }

#define LOG_TRACE(msg) ::remotectl::Logger::inst().log(::remotectl::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::remotectl::Logger::inst().log(::remotectl::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::remotectl::Logger::inst().log(::remotectl::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::remotectl::Logger::inst().log(::remotectl::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::remotectl::Logger::inst().log(::remotectl::LogLevel::Error, msg)
}
