#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "kio.hpp"

namespace scafbreak {

// Contig identifiers written by the hybrid scaffolder. A contig cut into pieces
// appears as "<base>_subseq_<start>:<end>" with 1-based inclusive coordinates.
//   cluster10_contig_270_subseq_79637:120374 -> base cluster10_contig_270, [79636,120374)
struct ContigName {
    struct Range { int64_t start{0}, end{0}; };   // 0-based, half-open

    std::string          base;
    std::optional<Range> range;

    bool    is_subseq() const { return range.has_value(); }
    int64_t length() const    { return range ? range->end - range->start : 0; }
};

inline constexpr std::string_view SUBSEQ_TAG = "_subseq_";

// Parse a raw component name. Names without the sub-sequence tag are returned
// unchanged with no range; a tag followed by anything but "<uint>:<uint>" with
// 1 <= start <= end is rejected.
inline ContigName parse_contig_name(std::string_view raw) {
    ContigName cn;
    const size_t pos = raw.find(SUBSEQ_TAG);
    if (pos == std::string_view::npos) {
        cn.base.assign(raw);
        return cn;
    }

    cn.base.assign(raw.substr(0, pos));
    std::string_view coords = raw.substr(pos + SUBSEQ_TAG.size());
    const size_t colon = coords.find(':');
    int64_t s = 0, e = 0;
    if (colon == std::string_view::npos
        || !kio::parse_i64(coords.substr(0, colon), s)
        || !kio::parse_i64(coords.substr(colon + 1), e)
        || s < 1 || e < s) {
        throw SchemaError("malformed sub-sequence name: " + std::string(raw));
    }
    cn.range = ContigName::Range{s - 1, e};
    return cn;
}

// Convenience when only the base identifier matters.
inline std::string contig_base_name(std::string_view raw) {
    return parse_contig_name(raw).base;
}

} // namespace scafbreak
