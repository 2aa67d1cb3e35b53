#pragma once
#include <string>
#include <vector>

#include "contig_support.hpp"
#include "fasta_layout.hpp"
#include "layout_types.hpp"
#include "save.hpp"

namespace scafbreak {

inline constexpr int DEFAULT_WRAP_WIDTH = 120;

// Output files derived from the output prefix.
struct OutputPaths {
    std::string layout;          // <prefix>.scaffold-layout.tsv
    std::string contigs;         // <prefix>.contig-stats.tsv
    std::string scaffolds_fa;    // <prefix>.scaffolds.wg.fasta
    std::string prefix;

    explicit OutputPaths(const std::string& p)
        : layout(p + ".scaffold-layout.tsv"), contigs(p + ".contig-stats.tsv"),
          scaffolds_fa(p + ".scaffolds.wg.fasta"), prefix(p) {}

    std::string contigs_fa(const std::string& chrom) const { return prefix + ".contigs." + chrom + ".fasta"; }
};

// Chromosome files that must exist after a run: chr1..chr22, chrXY, chrUn.
std::vector<std::string> expected_chrom_files();

// Annotated layout, one row per scaffold/run, with header.
void write_layout_table(const Layout& layout, const std::string& path);

// Unannotated layout as produced by the segmenter.
void write_segment_table(const Layout& layout, const std::string& path);

void write_contig_table(const std::vector<ContigStats>& contigs, const std::string& path);

// ">header\n", sequence wrapped at `wrap` (0 = single line), then an empty line.
void write_fasta_record(SAVE& out, const std::string& header, const std::string& seq, int wrap);

// Every scaffold row must have a stored sequence of its length and every
// sequence run must lie inside it; MismatchError (LookupError if missing) otherwise.
void check_fasta_export(const Layout& layout, const FastaScaffolds& fasta);

/**
 * @brief Export scaffolds and their sequence runs grouped by chromosome.
 *
 * Scaffolds go to the whole-genome file with header name@chrom@scf:0-len; every
 * sequence run goes to the file of its scaffold's chromosome with header
 * scaffold@chrom@order@frw|rev@contig@ctg:start-end. Expected chromosome files
 * that received nothing get a placeholder record.
 */
void dump_fasta_sequences(const Layout& layout, const FastaScaffolds& fasta, const OutputPaths& paths, int wrap);

} // namespace scafbreak
