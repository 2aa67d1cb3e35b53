#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace scafbreak {

// Object name used for scaffold-level layout rows.
inline constexpr std::string_view SCAFFOLD_OBJECT = "scaffold";

enum class SegmentKind : uint8_t { scaffold, sequence, gap };

inline const char* kind_name(SegmentKind k) {
    switch (k) {
        case SegmentKind::scaffold: return "self";
        case SegmentKind::sequence: return "sequence";
        case SegmentKind::gap:      return "gap";
    }
    return "?";
}

// Per-base counts in the column order A C G T a c g t N n.
// Gap rows carry -1 in every slot.
struct BaseCounts {
    static constexpr const char* ALPHABET = "ACGTacgtNn";
    std::array<int64_t, 10> n{};

    static BaseCounts undefined() {
        BaseCounts c;
        c.n.fill(-1);
        return c;
    }

    void add(char base) {
        switch (base) {
            case 'A': ++n[0]; break; case 'C': ++n[1]; break;
            case 'G': ++n[2]; break; case 'T': ++n[3]; break;
            case 'a': ++n[4]; break; case 'c': ++n[5]; break;
            case 'g': ++n[6]; break; case 't': ++n[7]; break;
            case 'N': ++n[8]; break; case 'n': ++n[9]; break;
            default: break;
        }
    }

    bool operator==(const BaseCounts& o) const { return n == o.n; }
};

// Two-level order key "major.minor": AGP component index and sub-split counter.
struct OrderNumber {
    int64_t major{0};
    int64_t minor{0};

    static OrderNumber unplaced() { return OrderNumber{-1, 0}; }
    bool is_unplaced() const      { return major < 0; }

    bool operator==(const OrderNumber& o) const { return major == o.major && minor == o.minor; }
    bool operator!=(const OrderNumber& o) const { return !(*this == o); }
    bool operator<(const OrderNumber& o) const {
        if (major != o.major) return major < o.major;
        return minor < o.minor;
    }

    std::string str() const { return std::to_string(major) + "." + std::to_string(minor); }
};

// +1 forward, -1 reverse, 0 gap or unknown
enum class Orientation : int8_t { reverse = -1, none = 0, forward = 1 };

inline Orientation parse_orientation(std::string_view s) {
    if (s == "+") return Orientation::forward;
    if (s == "-") return Orientation::reverse;
    return Orientation::none;
}

// One row of the FASTA layout: a whole scaffold, or a sequence/gap run inside one.
struct Segment {
    std::string object;           // parent scaffold; SCAFFOLD_OBJECT for scaffold rows
    SegmentKind kind{SegmentKind::sequence};
    std::string name;             // scaffold name (scaffold rows) or resolved contig
    int64_t     index{0};         // 1-based run index; FASTA record number for scaffold rows
    int64_t     start{0};         // 0-based, half-open in scaffold coordinates
    int64_t     end{0};
    int64_t     length{0};
    int64_t     cut_sites{-1};    // restriction motifs inside a gap, -1 otherwise
    BaseCounts  counts;

    // filled by annotation and order reconciliation
    OrderNumber order;
    Orientation orientation{Orientation::none};
    std::string chrom;
    double      confidence{0.0};
    int64_t     ctg_start{-1};
    int64_t     ctg_end{-1};

    bool is_scaffold() const { return kind == SegmentKind::scaffold; }
    bool is_gap() const      { return kind == SegmentKind::gap; }
    bool is_sequence() const { return kind == SegmentKind::sequence; }

    // scaffold this row belongs to
    const std::string& scaffold() const { return is_scaffold() ? name : object; }
};

using Layout = std::vector<Segment>;

// one-line description for diagnostics
inline std::string to_string(const Segment& s) {
    return s.object + " " + kind_name(s.kind) + " #" + std::to_string(s.index)
        + " [" + std::to_string(s.start) + "," + std::to_string(s.end) + ") len=" + std::to_string(s.length);
}

} // namespace scafbreak
