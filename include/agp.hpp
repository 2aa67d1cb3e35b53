#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace scafbreak {

// One AGP line. Only the two component types written by the hybrid scaffolder
// are accepted: W (sequence placement) and N (gap of known length).
struct AgpRecord {
    std::string object;
    int64_t     object_start{0};      // 1-based, inclusive
    int64_t     object_end{0};
    int64_t     part_number{0};
    char        type{'W'};

    // W: component_id, component_start, component_end, orientation
    std::string component_id;
    int64_t     component_start{0};
    int64_t     component_end{0};
    std::string orientation;

    // N: gap_length, gap_type, linkage, linkage_evidence
    int64_t     gap_length{0};
    std::string gap_type;
    std::string linkage;
    std::string linkage_evidence;

    uint64_t    line_no{0};

    bool is_gap() const { return type == 'N'; }
    int64_t length() const { return is_gap() ? gap_length : component_end - component_start + 1; }

    // tab-separated line for diagnostics
    std::string to_string() const;
};

struct AgpLayout {
    std::vector<AgpRecord> records;                                  // file order
    std::unordered_map<std::string, std::vector<size_t>> by_object;  // object -> record indices

    // records of one object in component order; empty when unknown
    std::vector<const AgpRecord*> records_of(const std::string& object) const;
};

// Parse and validate one non-comment AGP line. Throws SchemaError on an unexpected
// component type or column shape, IoError on a wrong column count.
AgpRecord parse_agp_line(std::string_view line, uint64_t line_no = 0);

// Parse a whole AGP file; '#' lines and blank lines are skipped. The file is fully
// validated before anything is returned.
AgpLayout parse_agp_layout(const std::string& agp_path);

// Build a layout from already-parsed records (keeps record order).
AgpLayout make_agp_layout(std::vector<AgpRecord> records);

} // namespace scafbreak
