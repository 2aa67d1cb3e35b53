#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "chrom_assign.hpp"
#include "errors.hpp"
#include "test_utils.h"

using namespace scafbreak;
using scafbreak_test::throws;

void test_weighted_choice() {
    std::cout << "Testing MAPQ-weighted chromosome choice..." << std::endl;

    EvidenceMap ev;
    ev[{"chr1", 60}] = 1000;    // 60000
    ev[{"chr2", 10}] = 3000;    // 30000
    ev[{"chr2", 60}] = 100;     //  6000

    ChromAssignment a = assign_chromosome(ev);
    assert(a.chrom == "chr1");
    assert(std::fabs(a.confidence - 0.625) < 1e-9);    // 60000 / 96000

    std::cout << "  Weighted choice tests passed!" << std::endl;
}

void test_sex_chromosomes_merge() {
    std::cout << "Testing chrX/chrY merge..." << std::endl;

    assert(merge_sex_chrom("chrX") == "chrXY");
    assert(merge_sex_chrom("chrY") == "chrXY");
    assert(merge_sex_chrom("chrX1") == "chrX1");

    EvidenceMap ev;
    ev[{"chrX", 60}] = 400;
    ev[{"chrY", 60}] = 400;
    ev[{"chr7", 60}] = 700;

    ChromAssignment a = assign_chromosome(ev);
    assert(a.chrom == "chrXY");
    assert(std::fabs(a.confidence - 0.533) < 1e-9);    // 800 / 1500, 3 decimals

    std::cout << "  Sex chromosome tests passed!" << std::endl;
}

void test_ignored_evidence() {
    std::cout << "Testing chrUn and MAPQ 0 exclusion..." << std::endl;

    EvidenceMap ev;
    ev[{"chrUn", 60}] = 100000;
    ev[{"chr3", 0}] = 100000;
    ev[{"chr4", 1}] = 10;

    ChromAssignment a = assign_chromosome(ev);
    assert(a.chrom == "chr4");
    assert(a.confidence == 1.0);

    EvidenceMap only_ignored;
    only_ignored[{"chrUn", 60}] = 5;
    only_ignored[{"chr5", 0}] = 5;
    ChromAssignment none = assign_chromosome(only_ignored);
    assert(none.chrom == "random");
    assert(none.confidence == 0.0);

    ChromAssignment empty = assign_chromosome(EvidenceMap{});
    assert(empty.chrom == "random" && empty.confidence == 0.0);

    std::cout << "  Exclusion tests passed!" << std::endl;
}

void test_tie_break() {
    std::cout << "Testing ties..." << std::endl;

    EvidenceMap ev;
    ev[{"chr9", 60}] = 100;
    ev[{"chr10", 60}] = 100;

    ChromAssignment a = assign_chromosome(ev);
    assert(a.chrom == "chr10");    // lexicographically smaller
    assert(a.confidence == 0.5);

    std::cout << "  Tie tests passed!" << std::endl;
}

void test_alignments_per_scaffold() {
    std::cout << "Testing evidence union per scaffold..." << std::endl;

    AlignmentTable t = make_alignment_table({
        Alignment{"chr1", 0, 1000, "ctgA", 60, '+', 1000, "ctgA"},
        Alignment{"chr2", 0, 300,  "ctgB", 60, '+', 300,  "ctgB"},
        Alignment{"chr2", 0, 500,  "ctgC", 60, '+', 500,  "ctgC"},
    });

    ContigToScaffolds c2s;
    c2s["ctgA"] = {"S1", "S2"};
    c2s["ctgB"] = {"S1"};
    c2s["ctgC"] = {"S2", "S2"};      // placed twice: counted twice
    c2s["ctgD"] = {"S3"};            // no alignments

    ScaffoldChroms chroms = alignments_per_scaffold(c2s, t);
    assert(chroms.size() == 3);

    // S1: chr1 60000 vs chr2 18000
    assert(chroms.at("S1").chrom == "chr1");
    assert(std::fabs(chroms.at("S1").confidence - 0.769) < 1e-9);

    // S2: chr1 60000 vs chr2 60000 -> tie, chr1
    assert(chroms.at("S2").chrom == "chr1");
    assert(chroms.at("S2").confidence == 0.5);

    assert(chroms.at("S3").chrom == "random");
    assert(chroms.at("S3").confidence == 0.0);

    for (const auto& kv : chroms) {
        assert(kv.second.confidence >= 0.0 && kv.second.confidence <= 1.0);
        assert((kv.second.confidence == 0.0) == (kv.second.chrom == "random"));
    }

    assert(lookup_assignment(chroms, "S1", "test").chrom == "chr1");
    assert(throws<LookupError>([&] { lookup_assignment(chroms, "S9", "test"); }));

    std::cout << "  Per-scaffold tests passed!" << std::endl;
}

int main() {
    test_weighted_choice();
    test_sex_chromosomes_merge();
    test_ignored_evidence();
    test_tie_break();
    test_alignments_per_scaffold();
    std::cout << "[PASS] test_chrom_assign" << std::endl;
    return 0;
}
