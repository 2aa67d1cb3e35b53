#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "break_classifier.hpp"
#include "errors.hpp"
#include "test_utils.h"

using namespace scafbreak;
using scafbreak_test::throws;

static ContigStats contig(const std::string& name, int64_t supported, int64_t unsupported, int64_t breaks) {
    ContigStats c;
    c.name        = name;
    c.supported   = supported;
    c.unsupported = unsupported;
    c.breaks      = breaks;
    return c;
}

static ScaffoldChroms chroms_of(std::initializer_list<std::pair<const char*, const char*>> l) {
    ScaffoldChroms m;
    for (const auto& p : l) m[p.first] = ChromAssignment{p.second, 0.9};
    return m;
}

static void assert_accounted(const ContigStats& c) {
    assert(c.local_breaks + c.global_breaks + c.chimeric_breaks + c.support_breaks == c.breaks);
}

void test_pair_scan() {
    std::cout << "Testing placement pair scan..." << std::endl;

    std::vector<Placement> p = {
        {"S1", "chr1"}, {"S1", "chr1"}, {"S2", "chr1"}, {"S3", "chr2"},
    };
    PairScanResult r = scan_placement_pairs(p, 10);
    assert(r.global == 1);      // S1-S2
    assert(r.chimeric == 2);    // S1-S3, S2-S3
    assert(r.remaining == 7);

    PairScanResult capped = scan_placement_pairs(p, 2);
    assert(capped.global + capped.chimeric == 2);
    assert(capped.remaining == 0);

    PairScanResult none = scan_placement_pairs(p, 0);
    assert(none.global == 0 && none.chimeric == 0 && none.remaining == 0);

    std::cout << "  Pair scan tests passed!" << std::endl;
}

void test_chimeric_contig() {
    std::cout << "Testing contig split over two chromosomes..." << std::endl;

    ContigStats c = contig("ctgA", 3000, 0, 1);
    classify_contig(c, {"S1", "S2"}, chroms_of({{"S1", "chr1"}, {"S2", "chr2"}}));
    assert(c.chimeric_breaks == 1);
    assert(c.local_breaks == 0);
    assert(c.global_breaks == 0);
    assert(c.support_breaks == 0);
    assert_accounted(c);

    std::cout << "  Chimeric tests passed!" << std::endl;
}

void test_global_and_local() {
    std::cout << "Testing global and local breaks..." << std::endl;

    ContigStats g = contig("ctgG", 100, 0, 1);
    classify_contig(g, {"S1", "S2"}, chroms_of({{"S1", "chr1"}, {"S2", "chr1"}}));
    assert(g.global_breaks == 1 && g.chimeric_breaks == 0);
    assert_accounted(g);

    // only scaffold: everything left is local
    ContigStats l = contig("ctgL", 100, 0, 2);
    classify_contig(l, {"S1"}, chroms_of({{"S1", "chr1"}}));
    assert(l.local_breaks == 2);
    assert_accounted(l);

    // same scaffold twice plus another scaffold
    ContigStats m = contig("ctgM", 100, 0, 2);
    classify_contig(m, {"S1", "S1", "S2"}, chroms_of({{"S1", "chr1"}, {"S2", "chr3"}}));
    assert(m.local_breaks == 1);
    assert(m.chimeric_breaks == 1);
    assert_accounted(m);

    // same scaffold repeated only
    ContigStats r = contig("ctgR", 100, 0, 2);
    classify_contig(r, {"S1", "S1", "S1"}, chroms_of({{"S1", "chr1"}}));
    assert(r.local_breaks == 2);
    assert_accounted(r);

    std::cout << "  Global/local tests passed!" << std::endl;
}

void test_support_breaks() {
    std::cout << "Testing support breaks..." << std::endl;

    ContigStats s = contig("ctgS", 100, 50, 1);
    classify_contig(s, {"S1"}, chroms_of({{"S1", "chr1"}}));
    assert(s.support_breaks == 1);
    assert(s.local_breaks == 0);
    assert_accounted(s);

    // support transition plus a chimeric split
    ContigStats t = contig("ctgT", 100, 50, 2);
    classify_contig(t, {"S1", "S2"}, chroms_of({{"S1", "chr1"}, {"S2", "chr2"}}));
    assert(t.support_breaks == 1 && t.chimeric_breaks == 1);
    assert_accounted(t);

    // never scaffolded
    ContigStats u = contig("ctgU", 0, 500, 0);
    classify_contig(u, {}, ScaffoldChroms{});
    assert(u.classified() == 0);

    std::cout << "  Support tests passed!" << std::endl;
}

void test_budget_caps_scattered_contig() {
    std::cout << "Testing contig scattered over many scaffolds..." << std::endl;

    ContigStats c = contig("ctgX", 400, 0, 3);
    classify_contig(c, {"S1", "S2", "S3", "S4"},
                    chroms_of({{"S1", "chr1"}, {"S2", "chr2"}, {"S3", "chr3"}, {"S4", "chr4"}}));
    assert(c.chimeric_breaks == 3);
    assert_accounted(c);

    std::cout << "  Budget tests passed!" << std::endl;
}

void test_accounting_and_lookup_failures() {
    std::cout << "Testing accounting and lookup failures..." << std::endl;

    // two placements cannot explain two breaks
    std::vector<ContigStats> bad = { contig("ctgBad", 100, 0, 2) };
    ContigToScaffolds c2s;
    c2s["ctgBad"] = {"S1", "S2"};
    auto chroms = chroms_of({{"S1", "chr1"}, {"S2", "chr2"}});
    assert(throws<AccountingError>([&] { classify_contig_breaks(bad, c2s, chroms); }));

    std::vector<ContigStats> bad2 = { contig("ctgA", 5, 5, 3) };
    bad2[0].support_breaks = 1;
    assert(throws<AccountingError>([&] { check_break_accounting(bad2); }));

    ContigStats c = contig("ctgL", 100, 0, 1);
    assert(throws<LookupError>([&] { classify_contig(c, {"S1", "S9"}, chroms_of({{"S1", "chr1"}})); }));

    std::cout << "  Failure tests passed!" << std::endl;
}

void test_final_ordering() {
    std::cout << "Testing final ordering..." << std::endl;

    std::vector<ContigStats> contigs = {
        contig("a", 10, 0, 0),
        contig("b", 30, 5, 0),
        contig("c", 30, 9, 0),
        contig("d", 10, 0, 0),
        contig("e", 0, 100, 0),
    };
    classify_contig_breaks(contigs, ContigToScaffolds{}, ScaffoldChroms{});

    assert(contigs[0].name == "c");
    assert(contigs[1].name == "b");
    assert(contigs[2].name == "a");
    assert(contigs[3].name == "d");
    assert(contigs[4].name == "e");

    std::cout << "  Ordering tests passed!" << std::endl;
}

int main() {
    test_pair_scan();
    test_chimeric_contig();
    test_global_and_local();
    test_support_breaks();
    test_budget_caps_scattered_contig();
    test_accounting_and_lookup_failures();
    test_final_ordering();
    std::cout << "[PASS] test_break_classifier" << std::endl;
    return 0;
}
