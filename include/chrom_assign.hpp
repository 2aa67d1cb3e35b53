#pragma once
#include <map>
#include <string>

#include "alignments.hpp"
#include "contig_support.hpp"

namespace scafbreak {

inline constexpr const char* NO_EVIDENCE_CHROM = "random";
inline constexpr const char* UNPLACED_CHROM    = "chrUn";
inline constexpr const char* SEX_CHROM         = "chrXY";

struct ChromAssignment {
    std::string chrom{NO_EVIDENCE_CHROM};
    double      confidence{0.0};     // weighted share of the best chromosome, 3 decimals
};

using ScaffoldChroms = std::map<std::string, ChromAssignment>;

// chrX and chrY count as one chromosome.
std::string merge_sex_chrom(const std::string& chrom);

/**
 * @brief Pick the chromosome with the largest MAPQ-weighted aligned length.
 *
 * chrUn and MAPQ 0 entries are ignored. Ties go to the lexicographically smaller
 * label. Without eligible evidence the result is NO_EVIDENCE_CHROM with confidence 0.
 */
ChromAssignment assign_chromosome(const EvidenceMap& evidence);

// Union the evidence of every contig placement per scaffold and assign each scaffold.
// Every scaffold listed in the adjacency receives an entry.
ScaffoldChroms alignments_per_scaffold(const ContigToScaffolds& contig_to_scaffold, const AlignmentTable& alignments);

// Assignment of a scaffold; LookupError naming `context` when missing.
const ChromAssignment& lookup_assignment(const ScaffoldChroms& chroms, const std::string& scaffold, const std::string& context);

} // namespace scafbreak
