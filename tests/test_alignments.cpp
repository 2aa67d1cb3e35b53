#include <cassert>
#include <iostream>
#include <string>

#include "alignments.hpp"
#include "errors.hpp"
#include "test_utils.h"

using namespace scafbreak;
using scafbreak_test::throws;

void test_parse_bed_line() {
    std::cout << "Testing BED line parsing..." << std::endl;

    Alignment a = parse_bed_line("chr1_KI270706v1_random\t100\t600\tcluster10_contig_270\t60\t-");
    assert(a.chrom == "chr1");
    assert(a.start == 100 && a.end == 600);
    assert(a.length == 500);
    assert(a.contig == "cluster10_contig_270");
    assert(a.cluster == "cluster10");
    assert(a.mapq == 60);
    assert(a.strand == '-');

    Alignment b = parse_bed_line("chrX\t0\t10\tctg\t0\t+");
    assert(b.chrom == "chrX");
    assert(b.cluster == "ctg");

    assert(throws<IoError>([] { parse_bed_line("chr1\t0\t10\tctg\t60"); }));
    assert(throws<IoError>([] { parse_bed_line("chr1\t0\tten\tctg\t60\t+"); }));
    assert(throws<IoError>([] { parse_bed_line("chr1\t20\t10\tctg\t60\t+"); }));
    assert(throws<IoError>([] { parse_bed_line("chr1\t0\t99999999999999999999\tctg\t60\t+"); }));

    std::cout << "  BED line tests passed!" << std::endl;
}

void test_evidence_aggregation() {
    std::cout << "Testing per-contig evidence and cluster coverage..." << std::endl;

    std::vector<Alignment> recs = {
        parse_bed_line("chr1\t0\t100\tc1_a\t60\t+"),
        parse_bed_line("chr1\t200\t300\tc1_a\t60\t+"),
        parse_bed_line("chr1_alt\t0\t50\tc1_a\t30\t+"),
        parse_bed_line("chr2\t0\t1000\tc2_b\t60\t+"),
        parse_bed_line("chr1\t0\t40\tc1_c\t60\t-"),
    };
    AlignmentTable t = make_alignment_table(recs);

    const EvidenceMap* ev = t.evidence_of("c1_a");
    assert(ev != nullptr);
    assert(ev->size() == 2);
    assert(ev->at(ChromMapq{"chr1", 60}) == 200);
    assert(ev->at(ChromMapq{"chr1", 30}) == 50);
    assert(t.evidence_of("nope") == nullptr);

    // (chr2, c2, 60) 1000 > (chr1, c1, 60) 240 > (chr1, c1, 30) 50
    assert(t.cluster_coverage.size() == 3);
    assert(t.cluster_coverage[0].chrom == "chr2" && t.cluster_coverage[0].length == 1000);
    assert(t.cluster_coverage[1].cluster == "c1" && t.cluster_coverage[1].mapq == 60);
    assert(t.cluster_coverage[1].length == 240);
    assert(t.cluster_coverage[2].length == 50);

    std::cout << "  Aggregation tests passed!" << std::endl;
}

void test_parse_file() {
    std::cout << "Testing BED file loading..." << std::endl;

    const std::string dir = scafbreak_test::make_temp_dir("scafbreak_test_bed");
    scafbreak_test::write_text(dir + "/aln.bed",
        "chr3\t0\t500\tctgA\t60\t+\n"
        "\n"
        "chr3\t500\t700\tctgA\t60\t+\n");

    AlignmentTable t = parse_contig_alignments(dir + "/aln.bed");
    assert(t.records.size() == 2);
    assert(t.evidence_of("ctgA")->at(ChromMapq{"chr3", 60}) == 700);

    assert(throws<IoError>([&] { parse_contig_alignments(dir + "/missing.bed"); }));

    std::cout << "  BED file tests passed!" << std::endl;
}

int main() {
    test_parse_bed_line();
    test_evidence_aggregation();
    test_parse_file();
    std::cout << "[PASS] test_alignments" << std::endl;
    return 0;
}
