#pragma once
#include <cstdint>
#include <sys/resource.h>
#include <sys/time.h>

// wall-clock seconds since the epoch
inline double realtime() {
    struct timeval tp;
    gettimeofday(&tp, nullptr);
    return tp.tv_sec + tp.tv_usec * 1e-6;
}

// user + system CPU seconds of this process
inline double cputime() {
    struct rusage r;
    getrusage(RUSAGE_SELF, &r);
    return r.ru_utime.tv_sec + r.ru_stime.tv_sec + 1e-6 * (r.ru_utime.tv_usec + r.ru_stime.tv_usec);
}

// peak resident set size in bytes (ru_maxrss is KiB on Linux)
inline int64_t peakrss() {
    struct rusage r;
    getrusage(RUSAGE_SELF, &r);
    return static_cast<int64_t>(r.ru_maxrss) * 1024;
}
