#pragma once
#include "chrom_assign.hpp"
#include "layout_types.hpp"

namespace scafbreak {

// Copy each scaffold's chromosome and confidence onto its scaffold row and runs.
// LookupError when a scaffold has no assignment.
void assign_chrom_to_scaffolds(Layout& layout, const ScaffoldChroms& chroms);

// Rows whose confidence is below `min_conf` are relabelled UNPLACED_CHROM.
// Returns the number of scaffolds relabelled.
size_t relabel_low_confidence(Layout& layout, double min_conf);

} // namespace scafbreak
