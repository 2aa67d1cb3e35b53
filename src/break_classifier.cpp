#include "../include/break_classifier.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace scafbreak {

PairScanResult scan_placement_pairs(const std::vector<Placement>& placements, int64_t budget) {
    PairScanResult res;
    res.remaining = budget;

    std::set<std::pair<std::string, std::string>> scored;
    for (size_t i = 0; i < placements.size(); ++i) {
        for (size_t j = i + 1; j < placements.size(); ++j) {
            if (res.remaining <= 0) return res;

            const Placement& a = placements[i];
            const Placement& b = placements[j];
            if (a.scaffold == b.scaffold) continue;   // local, counted by the caller

            auto key = (a.scaffold < b.scaffold) ? std::make_pair(a.scaffold, b.scaffold)
                                                 : std::make_pair(b.scaffold, a.scaffold);
            if (!scored.insert(std::move(key)).second) continue;

            if (a.chrom == b.chrom) ++res.global;
            else                    ++res.chimeric;
            --res.remaining;
        }
    }
    return res;
}

void classify_contig(ContigStats& c, const std::vector<std::string>& scaffolds, const ScaffoldChroms& chroms) {
    c.local_breaks = c.global_breaks = c.chimeric_breaks = 0;
    c.support_breaks = (c.supported > 0 && c.unsupported > 0) ? 1 : 0;

    if (c.breaks <= 0 || c.breaks == c.support_breaks) return;

    if (scaffolds.size() == 1) {
        // misassembly inside the only scaffold
        c.local_breaks = c.breaks - c.support_breaks;
        return;
    }

    std::map<std::string, int64_t> per_scaffold;
    for (const auto& s : scaffolds) ++per_scaffold[s];
    for (const auto& kv : per_scaffold) {
        if (kv.second >= 2) c.local_breaks += kv.second - 1;
    }
    if (per_scaffold.size() < 2) return;

    std::vector<Placement> placements;
    placements.reserve(scaffolds.size());
    for (const auto& s : scaffolds) {
        placements.push_back(Placement{s, lookup_assignment(chroms, s, "placement of contig " + c.name).chrom});
    }

    const PairScanResult r = scan_placement_pairs(placements, c.breaks - c.support_breaks - c.local_breaks);
    c.global_breaks   = r.global;
    c.chimeric_breaks = r.chimeric;
    if (r.remaining != 0) {
        debug_stream() << c.name << ": " << r.remaining << " breaks left after pair scan\n";
    }
}

void check_break_accounting(const std::vector<ContigStats>& contigs) {
    std::string bad;
    size_t n_bad = 0;
    for (const auto& c : contigs) {
        if (c.classified() == c.breaks) continue;
        ++n_bad;
        bad += "\n  " + c.to_string();
    }
    if (n_bad > 0) {
        throw AccountingError("unaccounted contig breaks in " + std::to_string(n_bad) + " contig(s):" + bad);
    }
}

void classify_contig_breaks(std::vector<ContigStats>& contigs, const ContigToScaffolds& contig_to_scaffold, const ScaffoldChroms& chroms) {
    static const std::vector<std::string> none;

    int64_t totals[5] = {0, 0, 0, 0, 0};
    for (auto& c : contigs) {
        auto it = contig_to_scaffold.find(c.name);
        classify_contig(c, it == contig_to_scaffold.end() ? none : it->second, chroms);
        totals[0] += c.breaks;
        totals[1] += c.local_breaks;
        totals[2] += c.global_breaks;
        totals[3] += c.chimeric_breaks;
        totals[4] += c.support_breaks;
    }

    check_break_accounting(contigs);

    std::stable_sort(contigs.begin(), contigs.end(), [](const ContigStats& a, const ContigStats& b) {
        if (a.supported != b.supported) return a.supported > b.supported;
        return a.unsupported > b.unsupported;
    });

    log_stream() << "Contig breaks: " << totals[0] << " (local " << totals[1] << ", global " << totals[2]
                 << ", chimeric " << totals[3] << ", support " << totals[4] << ")\n";
}

} // namespace scafbreak
