#pragma once
#include <string>

#include "layout_writer.hpp"

namespace scafbreak {

// Settings of one run, filled from the command line.
struct RunOpts {
    std::string agp_file;
    std::string fasta_file;
    std::string bed_file;
    std::string prefix;               // output prefix (process, contigs)
    std::string out_file;             // segment table (segment); empty = stdout

    std::string scaffold_tag{DEFAULT_SCAFFOLD_TAG};
    double      min_conf{0.5};
    int         wrap_width{DEFAULT_WRAP_WIDTH};
    bool        use_cache{true};
};

// Create the parent directory of an output prefix if needed.
void ensure_prefix_dir(const std::string& prefix);

/**
 * @brief Full reconciliation: load FASTA/AGP/BED, classify breaks, annotate and
 *        order the layout, then write both tables and the FASTA export.
 *
 * Nothing under the output prefix is written before every step succeeded, apart
 * from the FASTA cache; the export's sequence slices are checked before the
 * first table is written.
 */
void run_process(const RunOpts& opt);

// Support aggregation, chromosome assignment and break classification only.
void run_contigs(const RunOpts& opt);

// Segment a FASTA and write the unannotated layout.
void run_segment(const RunOpts& opt);

} // namespace scafbreak
