#include "../include/save.hpp"
#include "../include/errors.hpp"
#include "../include/kio.hpp"

#include <iostream>

/*------------------------------------------------------------*/
/*                       constructor                         */
/*------------------------------------------------------------*/
SAVE::SAVE(const std::string& outFileName, size_t cacheSize)
    : outputFileName_(outFileName), cache_size_(cacheSize) {
    is_stdout_ = outputFileName_.empty() || outputFileName_ == "-";
    is_gzip_   = !is_stdout_ && kio::is_gz_path(outputFileName_);

    if (is_gzip_) {
        gzFile fp = gzopen(outputFileName_.c_str(), "wb");
        if (!fp) throw scafbreak::IoError(outputFileName_ + ": cannot open for writing");
        gzfpO_.reset(fp);
    } else if (!is_stdout_) {
        fpO.open(outputFileName_, std::ios::out | std::ios::binary);
        if (!fpO) throw scafbreak::IoError(outputFileName_ + ": cannot open for writing");
    }

    buffer_.reserve(cache_size_);
}

/*------------------------------------------------------------*/
/*                         destructor                         */
/*------------------------------------------------------------*/
SAVE::~SAVE() {
    flush_();
}

/*------------------------------------------------------------*/
/*                          flush                             */
/*------------------------------------------------------------*/
bool SAVE::flush_() {
    if (buffer_.empty()) return true;

    bool ok = true;
    if (is_gzip_) {
        if (gzfpO_) {
            const int n = gzwrite(gzfpO_.get(), buffer_.data(), static_cast<unsigned int>(buffer_.size()));
            ok = (n == static_cast<int>(buffer_.size()));
        }
    } else if (!is_stdout_) {
        fpO.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        ok = static_cast<bool>(fpO);
    } else {
        std::cout.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        ok = static_cast<bool>(std::cout);
    }
    buffer_.clear();
    return ok;
}

/*------------------------------------------------------------*/
/*                           save                             */
/*------------------------------------------------------------*/
void SAVE::save(const std::string& outTxt) {
    if (outTxt.empty()) return;

    buffer_.append(outTxt);

    if (buffer_.size() >= cache_size_ && !flush_()) {
        throw scafbreak::IoError(outputFileName_ + ": write failed");
    }
}

/*------------------------------------------------------------*/
/*                           close                            */
/*------------------------------------------------------------*/
void SAVE::close() {
    if (!flush_()) throw scafbreak::IoError(outputFileName_ + ": write failed");
    if (is_gzip_ && gzfpO_) {
        if (gzclose(gzfpO_.release()) != Z_OK) throw scafbreak::IoError(outputFileName_ + ": gzclose failed");
    } else if (!is_stdout_ && fpO.is_open()) {
        fpO.close();
        if (!fpO) throw scafbreak::IoError(outputFileName_ + ": close failed");
    } else if (is_stdout_) {
        std::cout.flush();
    }
}
