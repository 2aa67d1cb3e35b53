// g++ main.cpp src/*.cpp -o scafbreak -std=c++20 -O3 -lhts -lz

#include <iostream>
#include <string>
#include <iomanip>

#include "include/OptionParser.hpp"
#include "include/ProgramMetadata.hpp"
#include "include/logger.hpp"
#include "include/pipeline.hpp"
#include "include/sys.hpp"

static inline bool is_top_help_flag(const char* s) {
    return (std::string(s) == "-h" || std::string(s) == "--help");
}
static inline bool is_top_ver_flag(const char* s) {
    return (std::string(s) == "-v" || std::string(s) == "--version");
}

int main(int argc, char** argv) {
    if (argc < 2) { help(argv); return 1; }
    if (is_top_help_flag(argv[1])) { help(argv); return 0; }
    if (is_top_ver_flag(argv[1]))  { std::cerr << program::version << "\n"; return 0; }

    // Dispatch by subcommand
    const std::string sub = argv[1];

    // timing
    double realtime0 = realtime();

    try {
        if (sub == "process") {
            AppConfig cfg = main_process(argc, argv);
            log_stream() << "CMD: " << program::cmdline(argc, argv) << "\n";
            scafbreak::run_process(to_run_opts(cfg));
        } else if (sub == "contigs") {
            AppConfig cfg = main_contigs(argc, argv);
            scafbreak::run_contigs(to_run_opts(cfg));
        } else if (sub == "segment") {
            AppConfig cfg = main_segment(argc, argv);
            scafbreak::run_segment(to_run_opts(cfg));
        } else {
            error_stream() << "Unknown subcommand: " << sub << "\n";
            help(argv);
            return 1;
        }
    } catch (const std::exception& e) {
        error_stream() << e.what() << "\n";
        return 1;
    }

    log_stream()
        << "Real time: " << std::fixed << std::setprecision(3)
        << (realtime() - realtime0) << " sec; CPU: " << cputime()
        << " sec; Peak RSS: " << (peakrss() / 1024.0 / 1024.0 / 1024.0) << " GB\n";

    return 0;
}
