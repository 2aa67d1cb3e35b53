#include "../include/contig_support.hpp"
#include "../include/contig_name.hpp"
#include "../include/logger.hpp"

#include <algorithm>

namespace scafbreak {

std::string ContigStats::to_string() const {
    return name
        + " supported=" + std::to_string(supported)
        + " unsupported=" + std::to_string(unsupported)
        + " breaks=" + std::to_string(breaks)
        + " local=" + std::to_string(local_breaks)
        + " global=" + std::to_string(global_breaks)
        + " chimeric=" + std::to_string(chimeric_breaks)
        + " support=" + std::to_string(support_breaks);
}

const ContigStats* ContigSupport::find(const std::string& contig) const {
    auto it = std::lower_bound(contigs.begin(), contigs.end(), contig,
                               [](const ContigStats& c, const std::string& n) { return c.name < n; });
    return (it != contigs.end() && it->name == contig) ? &*it : nullptr;
}

ContigSupport compute_contig_support(const AgpLayout& agp, const std::string& scaffold_tag) {
    ContigSupport cs;

    std::map<std::string, ContigStats> stats;
    std::map<std::string, int64_t> occurrences;

    for (const auto& r : agp.records) {
        if (r.is_gap()) continue;

        const ContigName cn = parse_contig_name(r.component_id);
        ContigStats& st = stats[cn.base];
        st.name = cn.base;
        ++occurrences[cn.base];

        if (!is_scaffold_object(r.object, scaffold_tag)) {
            // left outside any scaffold; several such fragments of one contig
            // are a representation artifact, tallied for the correction below
            if (cn.is_subseq()) ++cs.unsupported_broken[cn.base];
            st.unsupported += r.length();
        } else {
            cs.contig_to_scaffold[cn.base].push_back(r.object);
            cs.scaffold_to_contig[r.object].push_back(cn.base);
            st.supported += r.length();
        }
    }

    for (auto& kv : stats) {
        ContigStats& st = kv.second;
        st.breaks = occurrences[kv.first] - 1;
        if (st.supported == 0) st.breaks = 0;
    }

    for (const auto& kv : cs.unsupported_broken) {
        if (kv.second < 2) continue;
        ContigStats& st = stats[kv.first];
        const int64_t dup = kv.second - 1;
        if (st.breaks > 0 && st.breaks - dup >= 0) {
            st.breaks -= dup;
        } else if (st.breaks > 0) {
            debug_stream() << "keeping " << st.breaks << " breaks of " << st.name
                           << ": " << kv.second << " unsupported fragments would make it negative\n";
        }
    }

    cs.contigs.reserve(stats.size());
    for (auto& kv : stats) cs.contigs.push_back(std::move(kv.second));

    log_stream() << "Support computed for " << cs.contigs.size() << " contigs in "
                 << cs.scaffold_to_contig.size() << " scaffolds\n";
    return cs;
}

} // namespace scafbreak
