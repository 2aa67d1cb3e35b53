#pragma once
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

#include "errors.hpp"

namespace kio {

inline bool has_suffix(const std::string& s, const char* suf) {
    const size_t n = std::strlen(suf);
    return s.size() >= n && s.compare(s.size() - n, n, suf) == 0;
}

inline bool is_gz_path(const std::string& path) {
    return has_suffix(path, ".gz") || has_suffix(path, ".GZ");
}

// Buffered line reader over gzread(); zlib passes uncompressed files through
// unchanged, so plain and gzip input share one path. Counts lines for diagnostics.
class LineReader {
public:
    explicit LineReader(const std::string& path, unsigned bufsize = 1u << 16)
        : path_(path), fp_(gzopen(path.c_str(), "rb"), gzclose), buf_(bufsize)
    {
        if (!fp_) throw scafbreak::IoError("cannot open file: " + path);
    }

    const std::string& path() const { return path_; }
    uint64_t line_no() const { return line_no_; }

    // Next line without '\n' (and a trailing '\r'); false once the file is exhausted.
    bool getline(std::string& out) {
        out.clear();
        bool got = false;
        while (true) {
            if (pos_ == len_ && !fill_()) break;
            got = true;
            const char* beg = buf_.data() + pos_;
            const size_t avail = len_ - pos_;
            const void* nl = std::memchr(beg, '\n', avail);
            if (nl) {
                const size_t n = static_cast<const char*>(nl) - beg;
                out.append(beg, n);
                pos_ += n + 1;
                break;
            }
            out.append(beg, avail);
            pos_ = len_;
        }
        if (!got) return false;
        if (!out.empty() && out.back() == '\r') out.pop_back();
        ++line_no_;
        return true;
    }

private:
    // false at EOF; IoError on a corrupt or truncated gzip stream
    bool fill_() {
        if (eof_) return false;
        const int n = gzread(fp_.get(), buf_.data(), static_cast<unsigned>(buf_.size()));
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(fp_.get(), &errnum);
            throw scafbreak::IoError(path_ + ": read failed (" + (msg ? msg : "zlib error") + ")");
        }
        pos_ = 0;
        len_ = static_cast<size_t>(n);
        if (n == 0) eof_ = true;
        return n > 0;
    }

    std::string path_;
    std::unique_ptr<gzFile_s, int(*)(gzFile)> fp_;
    std::vector<char> buf_;
    size_t pos_ = 0;
    size_t len_ = 0;
    bool eof_ = false;
    uint64_t line_no_ = 0;
};

// Split on '\t'; views point into `line`.
inline std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> f;
    size_t pos = 0;
    for (;;) {
        size_t tab = line.find('\t', pos);
        if (tab == std::string_view::npos) {
            f.push_back(line.substr(pos));
            break;
        }
        f.push_back(line.substr(pos, tab - pos));
        pos = tab + 1;
    }
    return f;
}

// Strict decimal parse (optional leading '-'); false on empty input, trailing
// garbage, or a magnitude above INT64_MAX.
inline bool parse_i64(std::string_view sv, int64_t& out) {
    if (sv.empty()) return false;
    bool neg = false;
    size_t i = 0;
    if (sv[0] == '-') { neg = true; i = 1; }
    if (i >= sv.size()) return false;
    int64_t x = 0;
    for (; i < sv.size(); ++i) {
        const char c = sv[i];
        if (c < '0' || c > '9') return false;
        const int64_t d = c - '0';
        if (x > (INT64_MAX - d) / 10) return false;
        x = x * 10 + d;
    }
    out = neg ? -x : x;
    return true;
}

} // namespace kio
