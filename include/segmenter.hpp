#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "layout_types.hpp"

namespace scafbreak {

// Restriction site written into optical-map bridges (Nt.BspQI/DLE-1 style gaps).
inline constexpr std::string_view BRIDGE_MOTIF = "CTTAAG";

/**
 * @brief Split one scaffold sequence into alternating sequence and gap runs.
 *
 * Maximal [ACGT] runs (case-insensitive) become sequence segments. N-runs and
 * 6-base runs reading exactly BRIDGE_MOTIF accumulate into the open gap; the motif
 * also increments the gap's cut-site count. A gap is emitted when the next
 * sequence run starts, or at the end of the scaffold. Gap start/end are left at -1
 * for fill_gap_coordinates().
 *
 * @param seq       scaffold bases
 * @param scaffold  scaffold name, stored as the parent object of every run
 *
 * @return runs in document order, index starting at 1
 */
std::vector<Segment> characterize_scaffold_sequence(std::string_view seq, const std::string& scaffold);

// Scaffold-level row spanning [0, |seq|) with the composition of the whole sequence.
Segment make_scaffold_row(std::string_view seq, const std::string& scaffold, int64_t record_no);

// Scaffold row followed by its runs.
std::vector<Segment> segment_scaffold(std::string_view seq, const std::string& scaffold, int64_t record_no);

// Back-fill gap coordinates from the bounding sequence runs: start from the previous
// run's end (0 at scaffold start), end from the next run's start (scaffold length at
// scaffold end).
void fill_gap_coordinates(Layout& layout);

} // namespace scafbreak
