#pragma once

#include <string>

#include "pipeline.hpp"

/* ===================== I/O option ===================== */
struct IOInOpts {
    std::string agpFile;             // hybrid scaffold AGP
    std::string fastaFile;           // hybrid scaffold FASTA (plain or gz)
    std::string bedFile;             // contig-to-reference alignments (BED6)
};

struct IOOutOpts {
    std::string prefix = "";         // output file prefix; $PWD/bng_hybrid when empty
    std::string outFile = "";        // segment table (segment subcommand); stdout when empty
};

/* ===================== Global ===================== */
struct GlobalOpts {
    bool debug = false;
};

/* ===================== Layout / export options ===================== */
struct LayoutOpts {
    std::string scaffold_tag = scafbreak::DEFAULT_SCAFFOLD_TAG;  // substring marking scaffold objects
    double min_conf   = 0.5;                                      // below this a scaffold goes to chrUn
    int    wrap_width = scafbreak::DEFAULT_WRAP_WIDTH;            // FASTA line width; 0 means no wrap
    bool   use_cache  = true;                                     // read/write the FASTA layout cache
};

/* ===================== Tool mode ===================== */
enum class ToolMode {
    process,    // full reconciliation and export
    contigs,    // contig support and break classification only
    segment     // FASTA segmentation only
};

/* ===================== Whole configuration ===================== */
struct AppConfig {
    ToolMode   mode = ToolMode::process;
    IOInOpts   in;
    IOOutOpts  out;
    GlobalOpts global;
    LayoutOpts layout;
};

// Settings handed to the pipeline.
scafbreak::RunOpts to_run_opts(const AppConfig& cfg);

void help(char** argv);

// reconcile FASTA, AGP and BED; write tables and per-chromosome FASTA
AppConfig main_process(int argc, char** argv);
void help_process(char** argv);

// contig break classification from AGP and BED
AppConfig main_contigs(int argc, char** argv);
void help_contigs(char** argv);

// split scaffolds into sequence and gap runs
AppConfig main_segment(int argc, char** argv);
void help_segment(char** argv);
