// server/logger.hpp
// Colored console logging, shared by the listener and every session
#ifndef SERVER_LOGGER_HPP
#define SERVER_LOGGER_HPP

#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <string>
#include <mutex>

class Logger {
public:
    enum class Category {
        SERVER,
        HTTP,
        CONFIG,
        LISTENER,
        ERROR
    };

private:
    static inline std::mutex logMutex;
    static inline std::ostream* out = &std::cout;
    static inline bool colors = true;

    // ANSI color codes for different categories
    static const char* getCategoryColor(Category cat) {
        switch (cat) {
            case Category::SERVER:   return "\033[1;36m"; // Cyan
            case Category::HTTP:     return "\033[1;35m"; // Magenta
            case Category::CONFIG:   return "\033[1;37m"; // White
            case Category::LISTENER: return "\033[1;32m"; // Green
            case Category::ERROR:    return "\033[1;31m"; // Red
            default:                 return "\033[0m";    // Reset
        }
    }

    static const char* getCategoryName(Category cat) {
        switch (cat) {
            case Category::SERVER:   return "Server";
            case Category::HTTP:     return "HTTP";
            case Category::CONFIG:   return "Config";
            case Category::LISTENER: return "Listener";
            case Category::ERROR:    return "Error";
            default:                 return "Unknown";
        }
    }

    static const char* RESET_COLOR() { return "\033[0m"; }

    static std::string getTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);

        std::tm tm_now;
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << std::setfill('0')
            << std::setw(2) << (tm_now.tm_mon + 1) << "."
            << std::setw(2) << tm_now.tm_mday << " "
            << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":"
            << std::setw(2) << tm_now.tm_sec;

        return oss.str();
    }

public:
    static void log(Category category, const std::string& message) {
        std::lock_guard<std::mutex> lock(logMutex);

        *out << getTimestamp() << " ";
        if (colors) {
            *out << getCategoryColor(category) << "[" << getCategoryName(category) << "]" << RESET_COLOR();
        } else {
            *out << "[" << getCategoryName(category) << "]";
        }
        *out << " " << message << std::endl;
    }

    // Writes a preformatted block verbatim, no timestamp or tag.
    // The whole block goes out under one lock so blocks never interleave.
    static void dump(const std::string& block) {
        std::lock_guard<std::mutex> lock(logMutex);
        *out << block << std::flush;
    }

    // Redirect output (tests capture into a stringstream)
    static void setStream(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(logMutex);
        out = &stream;
    }

    static void setColors(bool enabled) {
        std::lock_guard<std::mutex> lock(logMutex);
        colors = enabled;
    }

    // Convenience methods for each category
    static void server(const std::string& msg) { log(Category::SERVER, msg); }
    static void http(const std::string& msg) { log(Category::HTTP, msg); }
    static void config(const std::string& msg) { log(Category::CONFIG, msg); }
    static void listener(const std::string& msg) { log(Category::LISTENER, msg); }
    static void error(const std::string& msg) { log(Category::ERROR, msg); }
};

#endif // SERVER_LOGGER_HPP
