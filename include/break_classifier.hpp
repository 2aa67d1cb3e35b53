#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "chrom_assign.hpp"
#include "contig_support.hpp"

namespace scafbreak {

// One placement of a contig fragment: the scaffold and the scaffold's chromosome.
struct Placement {
    std::string scaffold;
    std::string chrom;
};

struct PairScanResult {
    int64_t global{0};
    int64_t chimeric{0};
    int64_t remaining{0};
};

/**
 * @brief Score each unordered pair of placements on different scaffolds once.
 *
 * Equal chromosomes add a global break, different ones a chimeric break; each scored
 * pair consumes one unit of `budget`. Scanning stops as soon as the budget is used
 * up, so a contig scattered over many chromosomes is not counted beyond its breaks.
 */
PairScanResult scan_placement_pairs(const std::vector<Placement>& placements, int64_t budget);

// Fill the four cause columns of one contig. `scaffolds` are the contig's placements
// in AGP order (empty for contigs never scaffolded).
void classify_contig(ContigStats& contig, const std::vector<std::string>& scaffolds, const ScaffoldChroms& chroms);

// Throw AccountingError listing every contig whose causes do not sum to its breaks.
void check_break_accounting(const std::vector<ContigStats>& contigs);

// Classify all contigs, check the accounting invariant, then order by
// (supported, unsupported) descending.
void classify_contig_breaks(std::vector<ContigStats>& contigs, const ContigToScaffolds& contig_to_scaffold, const ScaffoldChroms& chroms);

} // namespace scafbreak
