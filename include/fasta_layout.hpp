#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "layout_types.hpp"

namespace scafbreak {

// Segmented FASTA plus the raw scaffold sequences.
struct FastaScaffolds {
    Layout layout;                                         // scaffold row, then its runs
    std::vector<std::string> names;                        // scaffolds in file order
    std::unordered_map<std::string, std::string> seqs;     // scaffold -> bases

    const std::string& sequence(const std::string& scaffold) const;
};

// Read a (gzipped) FASTA and segment every record; gap coordinates back-filled.
FastaScaffolds parse_fasta_scaffolds(const std::string& fasta_path);

// Cache files derived from an output prefix.
struct FastaCachePaths {
    std::string layout;   // <prefix>.cache.layout.tsv.gz
    std::string seqs;     // <prefix>.cache.seqs.fa.gz

    explicit FastaCachePaths(const std::string& prefix)
        : layout(prefix + ".cache.layout.tsv.gz"), seqs(prefix + ".cache.seqs.fa.gz") {}
};

void write_fasta_cache(const FastaScaffolds& fs, const FastaCachePaths& paths);
FastaScaffolds read_fasta_cache(const FastaCachePaths& paths);

// Read both cache files if present, otherwise parse the FASTA and write them.
// Without caching the FASTA is always parsed and nothing is written.
FastaScaffolds load_fasta_scaffolds(const std::string& fasta_path, const std::string& prefix, bool use_cache);

} // namespace scafbreak
