#include "../include/agp.hpp"
#include "../include/errors.hpp"
#include "../include/kio.hpp"
#include "../include/logger.hpp"

#include <algorithm>
#include <regex>

namespace scafbreak {

namespace {

// Column shapes per component type (columns 6-9 are type dependent).
struct AgpPatterns {
    std::regex number{"[0-9]+"};
    std::regex orientation{"[+\\-?0]|na"};
    std::regex gap_type{"scaffold"};
    std::regex linkage{"yes"};
};

const AgpPatterns& patterns() {
    static const AgpPatterns p;
    return p;
}

int64_t to_int(std::string_view sv, const char* column, uint64_t line_no) {
    int64_t v = 0;
    if (!kio::parse_i64(sv, v)) {
        throw SchemaError("AGP line " + std::to_string(line_no) + ": column " + column
                          + " is not an integer: '" + std::string(sv) + "'");
    }
    return v;
}

void require(const std::regex& rx, std::string_view sv, const char* what, uint64_t line_no) {
    if (!std::regex_match(sv.begin(), sv.end(), rx)) {
        throw SchemaError("AGP line " + std::to_string(line_no) + ": unexpected " + what
                          + " '" + std::string(sv) + "'");
    }
}

} // namespace

std::string AgpRecord::to_string() const {
    std::string s = object + '\t' + std::to_string(object_start) + '\t' + std::to_string(object_end)
                  + '\t' + std::to_string(part_number) + '\t' + type + '\t';
    if (is_gap()) {
        s += std::to_string(gap_length) + '\t' + gap_type + '\t' + linkage + '\t' + linkage_evidence;
    } else {
        s += component_id + '\t' + std::to_string(component_start) + '\t' + std::to_string(component_end) + '\t' + orientation;
    }
    return s;
}

std::vector<const AgpRecord*> AgpLayout::records_of(const std::string& object) const {
    std::vector<const AgpRecord*> out;
    auto it = by_object.find(object);
    if (it == by_object.end()) return out;
    out.reserve(it->second.size());
    for (size_t i : it->second) out.push_back(&records[i]);
    return out;
}

AgpRecord parse_agp_line(std::string_view line, uint64_t line_no) {
    auto f = kio::split_tabs(line);
    if (f.size() < 9) {
        throw IoError("AGP line " + std::to_string(line_no) + ": expected 9 columns, got " + std::to_string(f.size()));
    }

    const auto& P = patterns();
    AgpRecord r;
    r.line_no      = line_no;
    r.object       = std::string(f[0]);
    r.object_start = to_int(f[1], "object_beg", line_no);
    r.object_end   = to_int(f[2], "object_end", line_no);
    r.part_number  = to_int(f[3], "part_number", line_no);

    if (f[4] == "W") {
        r.type = 'W';
        require(P.number, f[6], "component start", line_no);
        require(P.number, f[7], "component end", line_no);
        require(P.orientation, f[8], "orientation", line_no);
        r.component_id    = std::string(f[5]);
        r.component_start = to_int(f[6], "component_beg", line_no);
        r.component_end   = to_int(f[7], "component_end", line_no);
        r.orientation     = std::string(f[8]);
        if (r.component_end < r.component_start) {
            throw SchemaError("AGP line " + std::to_string(line_no) + ": component end before start");
        }
    } else if (f[4] == "N") {
        r.type = 'N';
        require(P.number, f[5], "gap length", line_no);
        require(P.gap_type, f[6], "gap type", line_no);
        require(P.linkage, f[7], "linkage", line_no);
        r.gap_length       = to_int(f[5], "gap_length", line_no);
        r.gap_type         = std::string(f[6]);
        r.linkage          = std::string(f[7]);
        r.linkage_evidence = std::string(f[8]);
    } else {
        throw SchemaError("AGP line " + std::to_string(line_no) + ": unexpected component type '"
                          + std::string(f[4]) + "' (expected W or N)");
    }
    return r;
}

AgpLayout make_agp_layout(std::vector<AgpRecord> records) {
    AgpLayout agp;
    agp.records = std::move(records);
    for (size_t i = 0; i < agp.records.size(); ++i) {
        agp.by_object[agp.records[i].object].push_back(i);
    }
    for (auto& kv : agp.by_object) {
        std::stable_sort(kv.second.begin(), kv.second.end(), [&](size_t a, size_t b) {
            return agp.records[a].part_number < agp.records[b].part_number;
        });
    }
    return agp;
}

AgpLayout parse_agp_layout(const std::string& agp_path) {
    kio::LineReader lr(agp_path);
    std::vector<AgpRecord> records;
    std::string line;
    while (lr.getline(line)) {
        if (line.empty() || line[0] == '#') continue;
        records.push_back(parse_agp_line(line, lr.line_no()));
    }

    AgpLayout agp = make_agp_layout(std::move(records));
    log_stream() << "Loaded " << agp.records.size() << " AGP records for " << agp.by_object.size() << " objects\n";
    return agp;
}

} // namespace scafbreak
