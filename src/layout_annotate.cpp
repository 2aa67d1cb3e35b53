#include "../include/layout_annotate.hpp"
#include "../include/logger.hpp"

namespace scafbreak {

void assign_chrom_to_scaffolds(Layout& layout, const ScaffoldChroms& chroms) {
    for (auto& s : layout) {
        const ChromAssignment& a = lookup_assignment(chroms, s.scaffold(), "layout row " + to_string(s));
        s.chrom      = a.chrom;
        s.confidence = a.confidence;
    }
}

size_t relabel_low_confidence(Layout& layout, double min_conf) {
    size_t n = 0;
    for (auto& s : layout) {
        if (s.confidence >= min_conf) continue;
        s.chrom = UNPLACED_CHROM;
        if (s.is_scaffold()) ++n;
    }
    log_stream() << n << " scaffolds below confidence " << min_conf << " moved to " << UNPLACED_CHROM << "\n";
    return n;
}

} // namespace scafbreak
