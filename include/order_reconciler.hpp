#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "agp.hpp"
#include "contig_name.hpp"
#include "layout_types.hpp"

namespace scafbreak {

// Placement of one FASTA segment relative to the AGP.
struct SegmentOrder {
    OrderNumber order{OrderNumber::unplaced()};
    std::string name{"gap"};
    int64_t     ctg_start{-1};          // 0-based, half-open in contig coordinates
    int64_t     ctg_end{-1};
    Orientation orientation{Orientation::none};
};

/**
 * @brief AGP component cut into several FASTA fragments by assembler-inserted gaps.
 *
 * idle --open()--> active --extend()--> active ...
 * open() starts at the AGP record whose object start equals the first fragment's
 * start; extend() advances the intra-contig cursor by the physical gap between the
 * previous fragment and the next one. Fragments get order numbers part.1, part.2, ...
 */
class SplitState {
public:
    bool active() const { return active_; }

    SegmentOrder open(const AgpRecord& rec, const Segment& fragment);
    SegmentOrder extend(const Segment& fragment);   // SplitStateError when idle

    int64_t part_number() const { return part_number_; }
    int64_t cursor() const      { return cursor_; }
    int64_t last_end() const    { return last_end_; }

private:
    bool        active_{false};
    int64_t     part_number_{0};
    std::string contig_;
    Orientation orientation_{Orientation::none};
    int64_t     cursor_{0};      // contig coordinate after the last fragment
    int64_t     last_end_{0};    // scaffold coordinate after the last fragment
    int64_t     counter_{0};
};

// Segment and AGP record counts agree: pair them positionally and verify type/length.
std::vector<SegmentOrder> extract_compatible_agp_order(
    const std::vector<const Segment*>& fasta,
    const std::vector<const AgpRecord*>& agp);

// Counts differ: match by (object start, length), mark assembler-only gaps as
// unplaced and resolve the remaining sequence fragments through SplitState.
std::vector<SegmentOrder> extract_incompatible_agp_order(
    const std::vector<const Segment*>& fasta,
    const std::vector<const AgpRecord*>& agp);

// Reconcile every scaffold of the layout and write order, name, contig window and
// orientation into its rows. Scaffold rows get order 0.0.
void assign_agp_order_numbers(Layout& layout, const AgpLayout& agp);

} // namespace scafbreak
