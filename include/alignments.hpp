#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scafbreak {

// One contig-to-reference alignment (BED6: chrom start end contig mapq strand).
struct Alignment {
    std::string chrom;      // "chr1_KI270706v1_random" -> "chr1"
    int64_t     start{0};
    int64_t     end{0};
    std::string contig;
    int64_t     mapq{0};
    char        strand{'+'};
    int64_t     length{0};  // end - start
    std::string cluster;    // contig prefix before the first '_'
};

// (chromosome, mapq) -> summed aligned length
using ChromMapq   = std::pair<std::string, int64_t>;
using EvidenceMap = std::map<ChromMapq, int64_t>;

struct ClusterCoverage {
    std::string chrom;
    std::string cluster;
    int64_t     mapq{0};
    int64_t     length{0};
};

struct AlignmentTable {
    std::vector<Alignment> records;
    std::unordered_map<std::string, EvidenceMap> by_contig;
    std::vector<ClusterCoverage> cluster_coverage;   // descending by length

    // evidence of one contig; nullptr when the contig has no alignment
    const EvidenceMap* evidence_of(const std::string& contig) const;
};

// Text before the first '_' (whole string when there is none).
std::string_view prefix_before_underscore(std::string_view s);

Alignment parse_bed_line(std::string_view line, uint64_t line_no = 0);

// Aggregate per contig and per (chrom, cluster, mapq).
AlignmentTable make_alignment_table(std::vector<Alignment> records);

// Parse a headerless BED6 file.
AlignmentTable parse_contig_alignments(const std::string& bed_path);

} // namespace scafbreak
