#include "../include/segmenter.hpp"

#include <cctype>

namespace scafbreak {

namespace {

enum class RunType { acgt, n, other };

inline RunType run_type(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'A': case 'C': case 'G': case 'T': return RunType::acgt;
        case 'N':                               return RunType::n;
        default:                                return RunType::other;
    }
}

inline bool is_bridge_motif(std::string_view run) {
    if (run.size() != BRIDGE_MOTIF.size()) return false;
    for (size_t i = 0; i < run.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(run[i])) != BRIDGE_MOTIF[i]) return false;
    }
    return true;
}

Segment make_gap(const std::string& scaffold, int64_t index, int64_t length, int64_t cuts) {
    Segment g;
    g.object    = scaffold;
    g.kind      = SegmentKind::gap;
    g.name      = "gap";
    g.index     = index;
    g.start     = -1;
    g.end       = -1;
    g.length    = length;
    g.cut_sites = cuts;
    g.counts    = BaseCounts::undefined();
    return g;
}

} // namespace

std::vector<Segment> characterize_scaffold_sequence(std::string_view seq, const std::string& scaffold) {
    std::vector<Segment> runs;

    int64_t order    = 0;
    int64_t gap_size = 0;
    int64_t cuts     = 0;

    const size_t n = seq.size();
    size_t i = 0;
    while (i < n) {
        const RunType t = run_type(seq[i]);
        if (t == RunType::other) { ++i; continue; }

        size_t j = i + 1;
        while (j < n && run_type(seq[j]) == t) ++j;
        const std::string_view run = seq.substr(i, j - i);
        const int64_t start = static_cast<int64_t>(i);
        const int64_t end   = static_cast<int64_t>(j);
        i = j;

        if (t == RunType::acgt && is_bridge_motif(run)) {
            gap_size += end - start;
            ++cuts;
            continue;
        }
        if (t == RunType::n) {
            gap_size += end - start;
            continue;
        }

        // genomic sequence closes the open gap
        if (gap_size > 0) {
            runs.push_back(make_gap(scaffold, ++order, gap_size, cuts));
            gap_size = 0;
            cuts = 0;
        }

        Segment s;
        s.object = scaffold;
        s.kind   = SegmentKind::sequence;
        s.name   = "sequence";
        s.index  = ++order;
        s.start  = start;
        s.end    = end;
        s.length = end - start;
        for (char c : run) s.counts.add(c);
        runs.push_back(std::move(s));
    }

    // trailing N-run without closing sequence
    if (gap_size > 0) {
        runs.push_back(make_gap(scaffold, ++order, gap_size, cuts));
    }
    return runs;
}

Segment make_scaffold_row(std::string_view seq, const std::string& scaffold, int64_t record_no) {
    Segment s;
    s.object = std::string(SCAFFOLD_OBJECT);
    s.kind   = SegmentKind::scaffold;
    s.name   = scaffold;
    s.index  = record_no;
    s.start  = 0;
    s.end    = static_cast<int64_t>(seq.size());
    s.length = s.end;
    for (char c : seq) s.counts.add(c);
    return s;
}

std::vector<Segment> segment_scaffold(std::string_view seq, const std::string& scaffold, int64_t record_no) {
    std::vector<Segment> rows;
    rows.push_back(make_scaffold_row(seq, scaffold, record_no));
    auto runs = characterize_scaffold_sequence(seq, scaffold);
    rows.insert(rows.end(), std::make_move_iterator(runs.begin()), std::make_move_iterator(runs.end()));
    return rows;
}

void fill_gap_coordinates(Layout& layout) {
    int64_t scaffold_len = 0;
    for (size_t i = 0; i < layout.size(); ++i) {
        Segment& s = layout[i];
        if (s.is_scaffold()) { scaffold_len = s.length; continue; }
        if (!s.is_gap()) continue;

        const Segment* prev = (i > 0) ? &layout[i - 1] : nullptr;
        const Segment* next = (i + 1 < layout.size()) ? &layout[i + 1] : nullptr;

        s.start = (prev && !prev->is_scaffold()) ? prev->end : 0;
        s.end   = (next && next->is_sequence() && next->object == s.object) ? next->start : scaffold_len;
    }
}

} // namespace scafbreak
