// include/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cctype> // For std::isprint
#include <iostream>

// Renders an encoded document id (or any byte string) with non-printable
// bytes as \xHH so separator bytes stay visible in logs.
inline std::string format_key_for_print(const std::string& key) {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c) << std::dec;
        }
    }
    return oss.str();
}

// --- Logging Macros ---

template<typename... Args>
void print_log_line(std::ostream& os, Args&&... args) {
    std::ostringstream line;
    (line << ... << std::forward<Args>(args));
    line << '\n';
    // One write per line keeps concurrent log lines from interleaving.
    os << line.str() << std::flush;
}

// #define KINDRED_DEBUG_LOG

#ifdef KINDRED_DEBUG_LOG
    #define LOG_DEBUG(level, ...) \
        do { print_log_line(std::cout, "[" #level "] ", __VA_ARGS__); } while(0)
#else
    #define LOG_DEBUG(level, ...) // No-op when not debugging
#endif

#define LOG_INFO(...) do { print_log_line(std::cout, "[INFO] ", __VA_ARGS__); } while(0)
#define LOG_WARN(...) do { print_log_line(std::cerr, "[WARN] ", __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { print_log_line(std::cerr, "[ERROR] ", __VA_ARGS__); } while(0)
#define LOG_FATAL(...) do { print_log_line(std::cerr, "[FATAL] ", __VA_ARGS__); } while(0)

#ifdef KINDRED_TRACE_LOG
    #define LOG_TRACE(...) do { print_log_line(std::cout, "[TRACE] ", __VA_ARGS__); } while(0)
#else
    #define LOG_TRACE(...)
#endif
