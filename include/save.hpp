#ifndef SAVE_HPP
#define SAVE_HPP

#include <fstream>
#include <memory>
#include <string>
#include <zlib.h>

/**
 * @brief Buffered text output to a plain file, a gzip file (".gz" suffix) or stdout
 *        (empty name or "-").
 *
 * Failures to open or write throw scafbreak::IoError. close() flushes and reports
 * write errors; the destructor flushes silently.
**/
class SAVE
{
private:
    std::string outputFileName_;

    bool is_gzip_{false};
    bool is_stdout_{false};

    std::ofstream fpO;
    std::unique_ptr<gzFile_s, int(*)(gzFile)> gzfpO_{nullptr, gzclose};

    std::string buffer_;
    size_t cache_size_{10 * 1024 * 1024};     // default 10 MB

    SAVE(const SAVE&) = delete;
    SAVE& operator=(const SAVE&) = delete;

    /* flush internal buffer to file; false on write error */
    bool flush_();
public:
    explicit SAVE(const std::string& outFileName, size_t cacheSize = 10 << 20);
    ~SAVE();

    const std::string& name() const { return outputFileName_; }

    void save(const std::string& outTxt);

    void close();
};

#endif
