#include "../include/alignments.hpp"
#include "../include/errors.hpp"
#include "../include/kio.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <tuple>

namespace scafbreak {

const EvidenceMap* AlignmentTable::evidence_of(const std::string& contig) const {
    auto it = by_contig.find(contig);
    return (it == by_contig.end()) ? nullptr : &it->second;
}

std::string_view prefix_before_underscore(std::string_view s) {
    const size_t p = s.find('_');
    return (p == std::string_view::npos) ? s : s.substr(0, p);
}

Alignment parse_bed_line(std::string_view line, uint64_t line_no) {
    auto f = kio::split_tabs(line);
    if (f.size() < 6) {
        throw IoError("BED line " + std::to_string(line_no) + ": expected 6 columns, got " + std::to_string(f.size()));
    }

    auto num = [&](std::string_view sv, const char* what) {
        int64_t v = 0;
        if (!kio::parse_i64(sv, v)) {
            throw IoError("BED line " + std::to_string(line_no) + ": " + what + " is not an integer: '" + std::string(sv) + "'");
        }
        return v;
    };

    Alignment a;
    a.chrom   = std::string(prefix_before_underscore(f[0]));
    a.start   = num(f[1], "start");
    a.end     = num(f[2], "end");
    a.contig  = std::string(f[3]);
    a.mapq    = num(f[4], "mapq");
    a.strand  = f[5].empty() ? '.' : f[5][0];
    a.length  = a.end - a.start;
    a.cluster = std::string(prefix_before_underscore(a.contig));
    if (a.length < 0) {
        throw IoError("BED line " + std::to_string(line_no) + ": end before start");
    }
    return a;
}

AlignmentTable make_alignment_table(std::vector<Alignment> records) {
    AlignmentTable t;
    t.records = std::move(records);

    std::map<std::tuple<std::string, std::string, int64_t>, int64_t> cov;
    for (const auto& a : t.records) {
        t.by_contig[a.contig][ChromMapq{a.chrom, a.mapq}] += a.length;
        cov[std::make_tuple(a.chrom, a.cluster, a.mapq)] += a.length;
    }

    t.cluster_coverage.reserve(cov.size());
    for (const auto& kv : cov) {
        t.cluster_coverage.push_back(ClusterCoverage{
            std::get<0>(kv.first), std::get<1>(kv.first), std::get<2>(kv.first), kv.second});
    }
    // map order already sorts keys; stable sort keeps it for equal lengths
    std::stable_sort(t.cluster_coverage.begin(), t.cluster_coverage.end(),
                     [](const ClusterCoverage& a, const ClusterCoverage& b) { return a.length > b.length; });
    return t;
}

AlignmentTable parse_contig_alignments(const std::string& bed_path) {
    kio::LineReader lr(bed_path);
    std::vector<Alignment> records;
    std::string line;
    while (lr.getline(line)) {
        if (line.empty()) continue;
        records.push_back(parse_bed_line(line, lr.line_no()));
    }

    AlignmentTable t = make_alignment_table(std::move(records));
    log_stream() << "Loaded " << t.records.size() << " alignments of " << t.by_contig.size() << " contigs\n";
    for (size_t i = 0; i < t.cluster_coverage.size() && i < 5; ++i) {
        const auto& c = t.cluster_coverage[i];
        debug_stream() << "cluster coverage " << c.chrom << " / " << c.cluster << " / MAPQ " << c.mapq << ": " << c.length << " bp\n";
    }
    return t;
}

} // namespace scafbreak
