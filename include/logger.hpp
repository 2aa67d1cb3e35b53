#pragma once
#include <cstddef>
#include <ctime>
#include <iostream>
#include <string>

inline constexpr std::size_t LOG_FUNC_COL_WIDTH = 18;
inline constexpr char FILLER = '.';

inline bool DEBUG_ENABLED = false;

// local time: "MM-DD HH:MM:SS"
inline std::string getTime() {
    std::time_t t = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

inline std::string pad_func_name(const char* func, std::size_t width = LOG_FUNC_COL_WIDTH, char filler = FILLER) {
    std::string s(func ? func : "");
    if (s.size() < width) {
        s.append(width - s.size(), filler);
    } else if (s.size() > width) {
        s.resize(width);
    }
    return s;
}

// Format: [L::MM-DD HH:MM:SS::<func>] <message>
#define log_stream() (std::cerr << "[I::" << getTime() << "::" << pad_func_name(__func__) << "] ")
#define error_stream() (std::cerr << "[E::" << getTime() << "::" << pad_func_name(__func__) << "] ")
#define warning_stream() (std::cerr << "[W::" << getTime() << "::" << pad_func_name(__func__) << "] ")

struct NullBuf : std::streambuf {
    int overflow(int c) override { return c; }
};

inline std::ostream& null_stream() {
    static NullBuf buf;
    static std::ostream ns(&buf);
    return ns;
}

// Format: [D::<FILE>:<LINE> <func>] <message>
#define debug_stream() (DEBUG_ENABLED ? (std::cerr << "[D::" << __FILE__ << ":" << __LINE__ << " " << pad_func_name(__func__) << "] ") : null_stream())

inline void set_debug(bool on) {
    DEBUG_ENABLED = on;
}
