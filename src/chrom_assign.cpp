#include "../include/chrom_assign.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <cmath>

namespace scafbreak {

std::string merge_sex_chrom(const std::string& chrom) {
    if (chrom == "chrX" || chrom == "chrY") return SEX_CHROM;
    return chrom;
}

ChromAssignment assign_chromosome(const EvidenceMap& evidence) {
    std::map<std::string, int64_t> weighted;
    for (const auto& kv : evidence) {
        const std::string& chrom = kv.first.first;
        const int64_t mapq = kv.first.second;
        if (chrom == UNPLACED_CHROM || mapq <= 0) continue;
        weighted[merge_sex_chrom(chrom)] += kv.second * mapq;
    }

    int64_t total = 0;
    const std::pair<const std::string, int64_t>* best = nullptr;
    for (const auto& kv : weighted) {
        total += kv.second;
        if (!best || kv.second > best->second) best = &kv;   // map order: first label wins ties
    }

    ChromAssignment a;
    if (!best || total <= 0 || best->second <= 0) return a;

    a.chrom = best->first;
    a.confidence = std::round(static_cast<double>(best->second) / static_cast<double>(total) * 1000.0) / 1000.0;
    return a;
}

ScaffoldChroms alignments_per_scaffold(const ContigToScaffolds& contig_to_scaffold, const AlignmentTable& alignments) {
    std::map<std::string, EvidenceMap> per_scaffold;

    for (const auto& kv : contig_to_scaffold) {
        const EvidenceMap* ev = alignments.evidence_of(kv.first);
        for (const auto& scaffold : kv.second) {
            EvidenceMap& acc = per_scaffold[scaffold];
            if (!ev) continue;
            for (const auto& e : *ev) acc[e.first] += e.second;
        }
    }

    ScaffoldChroms out;
    size_t unassigned = 0;
    for (const auto& kv : per_scaffold) {
        ChromAssignment a = assign_chromosome(kv.second);
        if (a.chrom == NO_EVIDENCE_CHROM) ++unassigned;
        debug_stream() << kv.first << " -> " << a.chrom << " (" << a.confidence << ")\n";
        out.emplace(kv.first, std::move(a));
    }

    log_stream() << "Assigned " << out.size() - unassigned << " of " << out.size() << " scaffolds to a chromosome\n";
    return out;
}

const ChromAssignment& lookup_assignment(const ScaffoldChroms& chroms, const std::string& scaffold, const std::string& context) {
    auto it = chroms.find(scaffold);
    if (it == chroms.end()) {
        throw LookupError("no chromosome assignment for scaffold " + scaffold + " (" + context + ")");
    }
    return it->second;
}

} // namespace scafbreak
