#include "../include/OptionParser.hpp"
#include "../include/ProgramMetadata.hpp"
#include "../include/logger.hpp"

#include <getopt.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <sstream>

static constexpr const char* DEFAULT_PREFIX_NAME = "bng_hybrid";

static std::string default_prefix() {
    return (std::filesystem::current_path() / DEFAULT_PREFIX_NAME).string();
}

// strict numeric option parsing; exits with a message on garbage
static double parse_double_opt(const char* name, const char* arg) {
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(arg, &end);
    if (end == arg || *end != '\0' || errno == ERANGE) {
        error_stream() << name << " expects a number, got '" << arg << "'\n";
        std::exit(1);
    }
    return v;
}

static int parse_int_opt(const char* name, const char* arg) {
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(arg, &end, 10);
    if (end == arg || *end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX) {
        error_stream() << name << " expects an integer, got '" << arg << "'\n";
        std::exit(1);
    }
    return static_cast<int>(v);
}

static void validate_and_print(AppConfig& cfg) {
    using std::left;
    using std::setw;

    auto die    = [&](const char* msg){ error_stream() << msg << "\n"; std::exit(1); };
    auto ensure = [&](bool ok, const char* msg){ if (!ok) die(msg); };
    auto onoff  = [](bool b){ return b ? "ON" : "OFF"; };

    const int KEYW = 25;

    auto kv = [&](const char* key, const auto& val) {
        std::ostringstream oss;
        oss << left << setw(KEYW) << key << ": " << val;
        log_stream() << oss.str() << "\n";
    };

    if (cfg.global.debug) set_debug(true);

    const char* mode =
        cfg.mode == ToolMode::process ? "process" :
        cfg.mode == ToolMode::contigs ? "contigs" :
        cfg.mode == ToolMode::segment ? "segment" : "unknown";

    kv("Version", program::version);
    kv("Mode", mode);
    kv("Debug", onoff(cfg.global.debug));

    switch (cfg.mode) {
        case ToolMode::process:
            ensure(!cfg.in.agpFile.empty(),   "-a/--agp is required");
            ensure(!cfg.in.fastaFile.empty(), "-f/--fasta is required");
            ensure(!cfg.in.bedFile.empty(),   "-b/--bed is required");
            ensure(!cfg.layout.scaffold_tag.empty(), "--scaffold_tag must not be empty");
            ensure(cfg.layout.min_conf >= 0.0 && cfg.layout.min_conf <= 1.0, "--min_conf must be in [0,1]");
            ensure(cfg.layout.wrap_width >= 0, "--wrap must be >= 0");
            if (cfg.out.prefix.empty()) cfg.out.prefix = default_prefix();
            kv("AGP input",          cfg.in.agpFile);
            kv("FASTA input",        cfg.in.fastaFile);
            kv("BED input",          cfg.in.bedFile);
            kv("Scaffold tag",       cfg.layout.scaffold_tag);
            kv("Minimum confidence", cfg.layout.min_conf);
            kv("Wrap",               cfg.layout.wrap_width);
            kv("FASTA cache",        onoff(cfg.layout.use_cache));
            kv("Output prefix",      cfg.out.prefix);
            break;

        case ToolMode::contigs:
            ensure(!cfg.in.agpFile.empty(), "-a/--agp is required");
            ensure(!cfg.in.bedFile.empty(), "-b/--bed is required");
            ensure(!cfg.layout.scaffold_tag.empty(), "--scaffold_tag must not be empty");
            if (cfg.out.prefix.empty()) cfg.out.prefix = default_prefix();
            kv("AGP input",     cfg.in.agpFile);
            kv("BED input",     cfg.in.bedFile);
            kv("Scaffold tag",  cfg.layout.scaffold_tag);
            kv("Output prefix", cfg.out.prefix);
            break;

        case ToolMode::segment:
            ensure(!cfg.in.fastaFile.empty(), "-f/--fasta is required");
            kv("FASTA input", cfg.in.fastaFile);
            kv("Output file", cfg.out.outFile.empty() ? "stdout" : cfg.out.outFile);
            break;
    }
}

scafbreak::RunOpts to_run_opts(const AppConfig& cfg) {
    scafbreak::RunOpts opt;
    opt.agp_file     = cfg.in.agpFile;
    opt.fasta_file   = cfg.in.fastaFile;
    opt.bed_file     = cfg.in.bedFile;
    opt.prefix       = cfg.out.prefix;
    opt.out_file     = cfg.out.outFile;
    opt.scaffold_tag = cfg.layout.scaffold_tag;
    opt.min_conf     = cfg.layout.min_conf;
    opt.wrap_width   = cfg.layout.wrap_width;
    opt.use_cache    = cfg.layout.use_cache;
    return opt;
}

void help(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " <subcommand> [options]\n\n"
        << program::description << "\n"
        << "Version: " << program::version << "\n"
        << "Date:    " << program::build_date << "\n"
        << "\n"
        << "Subcommands:\n"
        << "  process     annotate the scaffold layout, classify contig breaks and export FASTA\n"
        << "  contigs     classify contig breaks from AGP and BED only\n"
        << "  segment     split FASTA scaffolds into sequence and gap runs\n\n";
}

void help_process(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -a FILE -f FILE -b FILE [options]\n\n"
        << "Reconcile a hybrid scaffolding run: annotate every scaffold and sequence run with\n"
        << "chromosome, AGP order and contig coordinates, and attribute every contig break\n"
        << "to support, local, global or chimeric causes.\n\n"
        << "Input/Output:\n"
        << "  -a, --agp          FILE     hybrid scaffold AGP\n"
        << "  -f, --fasta        FILE     hybrid scaffold FASTA (plain or gz)\n"
        << "  -b, --bed          FILE     contig-to-reference alignments (BED6)\n"
        << "  -o, --prefix       STR      output prefix [$PWD/" << DEFAULT_PREFIX_NAME << "]\n\n"
        << "Layout options:\n"
        << "      --scaffold_tag STR      object names containing STR are scaffolds [" << LayoutOpts().scaffold_tag << "]\n"
        << "      --min_conf     FLOAT    relabel scaffolds below this confidence as chrUn [" << LayoutOpts().min_conf << "]\n"
        << "      --wrap         UINT     FASTA wrap width; 0 = no wrap [" << LayoutOpts().wrap_width << "]\n"
        << "      --no_fasta_cache        always parse the FASTA; do not read or write the cache\n\n"
        << "General Options:\n"
        << "      --debug                 debug logging\n"
        << "  -h, --help                  show this help\n\n";
}

AppConfig main_process(int argc, char** argv) {
    if (argc < 3) { help_process(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::process;

    const struct option long_opts[] = {
        {"agp",            required_argument, nullptr, 'a'},
        {"fasta",          required_argument, nullptr, 'f'},
        {"bed",            required_argument, nullptr, 'b'},
        {"prefix",         required_argument, nullptr, 'o'},
        {"scaffold_tag",   required_argument, nullptr, 1001},
        {"min_conf",       required_argument, nullptr, 1002},
        {"wrap",           required_argument, nullptr, 1003},
        {"no_fasta_cache", no_argument,       nullptr, 1004},
        {"debug",          no_argument,       nullptr, 1005},
        {"help",           no_argument,       nullptr, 'h'},
        {0,0,0,0}
    };
    const char* short_opts = "a:f:b:o:h";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, &idx)) != -1) {
        switch (c) {
            case 'a':  cfg.in.agpFile            = optarg; break;
            case 'f':  cfg.in.fastaFile          = optarg; break;
            case 'b':  cfg.in.bedFile            = optarg; break;
            case 'o':  cfg.out.prefix            = optarg; break;
            case 1001: cfg.layout.scaffold_tag   = optarg; break;
            case 1002: cfg.layout.min_conf       = parse_double_opt("--min_conf", optarg); break;
            case 1003: cfg.layout.wrap_width     = parse_int_opt("--wrap", optarg); break;
            case 1004: cfg.layout.use_cache      = false;  break;
            case 1005: cfg.global.debug          = true;   break;
            case 'h':  help_process(argv); std::exit(0);
            default:   help_process(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);
    return cfg;
}

void help_contigs(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -a FILE -b FILE [options]\n\n"
        << "Compute per-contig support and break causes; writes PREFIX.contig-stats.tsv\n\n"
        << "Input/Output:\n"
        << "  -a, --agp          FILE     hybrid scaffold AGP\n"
        << "  -b, --bed          FILE     contig-to-reference alignments (BED6)\n"
        << "  -o, --prefix       STR      output prefix [$PWD/" << DEFAULT_PREFIX_NAME << "]\n\n"
        << "Options:\n"
        << "      --scaffold_tag STR      object names containing STR are scaffolds [" << LayoutOpts().scaffold_tag << "]\n\n"
        << "General Options:\n"
        << "      --debug                 debug logging\n"
        << "  -h, --help                  show this help\n\n";
}

AppConfig main_contigs(int argc, char** argv) {
    if (argc < 3) { help_contigs(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::contigs;

    const struct option long_opts[] = {
        {"agp",          required_argument, nullptr, 'a'},
        {"bed",          required_argument, nullptr, 'b'},
        {"prefix",       required_argument, nullptr, 'o'},
        {"scaffold_tag", required_argument, nullptr, 1001},
        {"debug",        no_argument,       nullptr, 1005},
        {"help",         no_argument,       nullptr, 'h'},
        {0,0,0,0}
    };
    const char* short_opts = "a:b:o:h";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, &idx)) != -1) {
        switch (c) {
            case 'a':  cfg.in.agpFile          = optarg; break;
            case 'b':  cfg.in.bedFile          = optarg; break;
            case 'o':  cfg.out.prefix          = optarg; break;
            case 1001: cfg.layout.scaffold_tag = optarg; break;
            case 1005: cfg.global.debug        = true;   break;
            case 'h':  help_contigs(argv); std::exit(0);
            default:   help_contigs(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);
    return cfg;
}

void help_segment(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -f FILE [options]\n\n"
        << "Split every FASTA record into sequence and gap runs (N-runs and bridge motifs)\n\n"
        << "Input/Output:\n"
        << "  -f, --fasta        FILE     scaffold FASTA (plain or gz)\n"
        << "  -o, --output       FILE     output table [stdout]; .gz suffix compresses\n\n"
        << "General Options:\n"
        << "      --debug                 debug logging\n"
        << "  -h, --help                  show this help\n\n";
}

AppConfig main_segment(int argc, char** argv) {
    if (argc < 3) { help_segment(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::segment;

    const struct option long_opts[] = {
        {"fasta",  required_argument, nullptr, 'f'},
        {"output", required_argument, nullptr, 'o'},
        {"debug",  no_argument,       nullptr, 1005},
        {"help",   no_argument,       nullptr, 'h'},
        {0,0,0,0}
    };
    const char* short_opts = "f:o:h";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, &idx)) != -1) {
        switch (c) {
            case 'f':  cfg.in.fastaFile  = optarg; break;
            case 'o':  cfg.out.outFile   = optarg; break;
            case 1005: cfg.global.debug  = true;   break;
            case 'h':  help_segment(argv); std::exit(0);
            default:   help_segment(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);
    return cfg;
}
