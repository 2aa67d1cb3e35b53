#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "agp.hpp"

namespace scafbreak {

inline constexpr const char* DEFAULT_SCAFFOLD_TAG = "Super-Scaffold";

// Per original contig: bases placed inside scaffolds, bases left outside, and the
// observed break count with its classification.
struct ContigStats {
    std::string name;
    int64_t supported{0};
    int64_t unsupported{0};
    int64_t breaks{0};            // AGP occurrences - 1, after corrections

    int64_t local_breaks{0};      // same scaffold
    int64_t global_breaks{0};     // other scaffold, same chromosome
    int64_t chimeric_breaks{0};   // other chromosome
    int64_t support_breaks{0};    // partly outside scaffolds

    int64_t classified() const { return local_breaks + global_breaks + chimeric_breaks + support_breaks; }
    std::string to_string() const;
};

// Placements in AGP order; a contig split inside one scaffold lists it repeatedly.
using ContigToScaffolds = std::map<std::string, std::vector<std::string>>;
using ScaffoldToContigs = std::map<std::string, std::vector<std::string>>;

struct ContigSupport {
    std::vector<ContigStats> contigs;                    // sorted by contig name
    ContigToScaffolds contig_to_scaffold;
    ScaffoldToContigs scaffold_to_contig;
    std::map<std::string, int64_t> unsupported_broken;   // sub-sequence fragments outside scaffolds

    const ContigStats* find(const std::string& contig) const;
};

// Object names carrying the tag are scaffolds; everything else is an unscaffolded contig.
inline bool is_scaffold_object(const std::string& object, const std::string& tag) {
    return object.find(tag) != std::string::npos;
}

/**
 * @brief Sum supported / unsupported bases per contig and count raw breaks.
 *
 * Raw breaks are the number of AGP occurrences of a contig minus one. Contigs without
 * supported bases get zero breaks. For contigs with k >= 2 unsupported sub-sequence
 * fragments, k - 1 is subtracted when the count is positive and stays non-negative.
 */
ContigSupport compute_contig_support(const AgpLayout& agp, const std::string& scaffold_tag = DEFAULT_SCAFFOLD_TAG);

} // namespace scafbreak
