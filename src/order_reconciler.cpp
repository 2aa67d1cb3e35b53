#include "../include/order_reconciler.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"

#include <unordered_map>

namespace scafbreak {

namespace {

std::string pair_desc(const Segment& s, const AgpRecord& r) {
    return to_string(s) + " / AGP line " + std::to_string(r.line_no) + ": " + r.to_string();
}

// Contig window of a sequence segment placed by `rec`; the window must have the
// segment's length.
SegmentOrder placed_sequence(const Segment& seg, const AgpRecord& rec) {
    const ContigName cn = parse_contig_name(rec.component_id);

    SegmentOrder o;
    o.order       = OrderNumber{rec.part_number, 0};
    o.name        = cn.base;
    o.orientation = parse_orientation(rec.orientation);
    if (cn.is_subseq()) {
        o.ctg_start = cn.range->start;
        o.ctg_end   = cn.range->end;
        if (o.ctg_end - o.ctg_start != seg.length) {
            throw MismatchError("Sub-sequence length mismatch: " + pair_desc(seg, rec));
        }
    } else {
        o.ctg_start = 0;
        o.ctg_end   = seg.length;
    }
    return o;
}

SegmentOrder placed_gap(const AgpRecord& rec) {
    SegmentOrder o;
    o.order = OrderNumber{rec.part_number, 0};
    return o;
}

} // namespace

SegmentOrder SplitState::open(const AgpRecord& rec, const Segment& fragment) {
    if (rec.is_gap()) {
        throw MismatchError("Split starts at a gap record: " + pair_desc(fragment, rec));
    }
    const ContigName cn = parse_contig_name(rec.component_id);

    active_      = true;
    part_number_ = rec.part_number;
    contig_      = cn.base;
    orientation_ = parse_orientation(rec.orientation);
    counter_     = 1;

    SegmentOrder o;
    o.order       = OrderNumber{part_number_, counter_};
    o.name        = contig_;
    o.orientation = orientation_;
    o.ctg_start   = cn.is_subseq() ? cn.range->start : 0;
    o.ctg_end     = o.ctg_start + fragment.length;

    cursor_   = o.ctg_end;
    last_end_ = fragment.end;
    return o;
}

SegmentOrder SplitState::extend(const Segment& fragment) {
    if (!active_) {
        throw SplitStateError("not in split mode, but no AGP record starts at " + to_string(fragment));
    }
    ++counter_;
    cursor_ += fragment.start - last_end_;

    SegmentOrder o;
    o.order       = OrderNumber{part_number_, counter_};
    o.name        = contig_;
    o.orientation = orientation_;
    o.ctg_start   = cursor_;
    o.ctg_end     = cursor_ + fragment.length;

    cursor_   = o.ctg_end;
    last_end_ = fragment.end;
    return o;
}

std::vector<SegmentOrder> extract_compatible_agp_order(
    const std::vector<const Segment*>& fasta,
    const std::vector<const AgpRecord*>& agp)
{
    std::vector<SegmentOrder> out;
    out.reserve(fasta.size());

    for (size_t i = 0; i < fasta.size() && i < agp.size(); ++i) {
        const Segment& seg = *fasta[i];
        const AgpRecord& rec = *agp[i];

        if (seg.is_gap() && !rec.is_gap()) throw MismatchError("Gap mismatch: " + pair_desc(seg, rec));
        if (seg.is_sequence() && rec.is_gap()) throw MismatchError("Contig mismatch: " + pair_desc(seg, rec));

        if (seg.is_sequence()) {
            if (rec.length() != seg.length) throw MismatchError("Seq. length mismatch: " + pair_desc(seg, rec));
            out.push_back(placed_sequence(seg, rec));
        } else {
            if (rec.gap_length != seg.length) throw MismatchError("Gap length mismatch: " + pair_desc(seg, rec));
            out.push_back(placed_gap(rec));
        }
    }
    return out;
}

std::vector<SegmentOrder> extract_incompatible_agp_order(
    const std::vector<const Segment*>& fasta,
    const std::vector<const AgpRecord*>& agp)
{
    std::unordered_map<int64_t, std::vector<const AgpRecord*>> by_start;
    for (const AgpRecord* r : agp) by_start[r->object_start].push_back(r);

    auto starting_at = [&](const Segment& seg) -> const std::vector<const AgpRecord*>& {
        static const std::vector<const AgpRecord*> none;
        auto it = by_start.find(seg.start + 1);   // AGP is 1-based
        return (it == by_start.end()) ? none : it->second;
    };

    std::vector<SegmentOrder> out(fasta.size());
    std::vector<size_t> unmatched;

    // exact (start, length) matches; the remaining gaps were inserted by the assembler
    for (size_t i = 0; i < fasta.size(); ++i) {
        const Segment& seg = *fasta[i];
        const AgpRecord* match = nullptr;
        for (const AgpRecord* r : starting_at(seg)) {
            if (r->is_gap() == seg.is_gap() && r->length() == seg.length) { match = r; break; }
        }

        if (!match) {
            if (seg.is_gap()) {
                debug_stream() << "assembler gap without AGP record: " << to_string(seg) << "\n";
                out[i] = SegmentOrder{};
            } else {
                unmatched.push_back(i);
            }
            continue;
        }
        out[i] = seg.is_gap() ? placed_gap(*match) : placed_sequence(seg, *match);
    }

    SplitState split;
    for (size_t i : unmatched) {
        const Segment& seg = *fasta[i];
        const auto& recs = starting_at(seg);
        if (recs.size() > 1) {
            throw MismatchError("Multi-start for unmatched sequence: " + to_string(seg));
        }
        out[i] = recs.empty() ? split.extend(seg) : split.open(*recs.front(), seg);
    }
    return out;
}

void assign_agp_order_numbers(Layout& layout, const AgpLayout& agp) {
    std::unordered_map<std::string, std::vector<size_t>> rows_of;
    std::vector<size_t> scaffold_rows;
    for (size_t i = 0; i < layout.size(); ++i) {
        if (layout[i].is_scaffold()) scaffold_rows.push_back(i);
        else                         rows_of[layout[i].object].push_back(i);
    }

    size_t n_incompatible = 0;
    for (size_t si : scaffold_rows) {
        Segment& scaffold = layout[si];
        scaffold.order       = OrderNumber{0, 0};
        scaffold.orientation = Orientation::none;
        scaffold.ctg_start   = -1;
        scaffold.ctg_end     = -1;

        const auto& idx = rows_of[scaffold.name];
        const auto records = agp.records_of(scaffold.name);
        if (records.empty()) {
            throw LookupError("scaffold " + scaffold.name + " has no AGP records");
        }

        std::vector<const Segment*> fasta;
        fasta.reserve(idx.size());
        for (size_t i : idx) fasta.push_back(&layout[i]);

        std::vector<SegmentOrder> orders;
        if (fasta.size() == records.size()) {
            orders = extract_compatible_agp_order(fasta, records);
        } else {
            ++n_incompatible;
            debug_stream() << scaffold.name << ": " << fasta.size() << " FASTA segments vs "
                           << records.size() << " AGP records\n";
            orders = extract_incompatible_agp_order(fasta, records);
        }

        for (size_t k = 0; k < idx.size(); ++k) {
            Segment& s = layout[idx[k]];
            SegmentOrder& o = orders[k];
            s.order       = o.order;
            s.name        = std::move(o.name);
            s.ctg_start   = o.ctg_start;
            s.ctg_end     = o.ctg_end;
            s.orientation = o.orientation;
        }
    }

    log_stream() << "Reconciled AGP order of " << scaffold_rows.size() << " scaffolds ("
                 << n_incompatible << " with assembler-inserted gaps)\n";
}

} // namespace scafbreak
