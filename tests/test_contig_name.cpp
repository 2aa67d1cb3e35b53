#include <cassert>
#include <cstdint>
#include <iostream>

#include "contig_name.hpp"
#include "test_utils.h"

using namespace scafbreak;
using scafbreak_test::throws;

void test_plain_name() {
    std::cout << "Testing plain contig name..." << std::endl;

    ContigName cn = parse_contig_name("cluster10_contig_270");
    assert(cn.base == "cluster10_contig_270");
    assert(!cn.is_subseq());
    assert(cn.length() == 0);

    std::cout << "  Plain name tests passed!" << std::endl;
}

void test_subseq_name() {
    std::cout << "Testing sub-sequence name..." << std::endl;

    ContigName a = parse_contig_name("cluster10_contig_270_subseq_1:79636");
    assert(a.base == "cluster10_contig_270");
    assert(a.is_subseq());
    assert(a.range->start == 0);
    assert(a.range->end == 79636);
    assert(a.length() == 79636);

    ContigName b = parse_contig_name("cluster10_contig_270_subseq_79637:120374");
    assert(b.range->start == 79636);
    assert(b.range->end == 120374);
    assert(contig_base_name("cluster10_contig_270_subseq_79637:120374") == "cluster10_contig_270");

    // single base
    ContigName c = parse_contig_name("ctg_subseq_5:5");
    assert(c.length() == 1);

    std::cout << "  Sub-sequence tests passed!" << std::endl;
}

void test_malformed_subseq() {
    std::cout << "Testing malformed sub-sequence names..." << std::endl;

    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_"); }));
    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_10"); }));
    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_0:10"); }));
    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_20:10"); }));
    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_a:10"); }));
    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_1:10x"); }));
    // coordinates past int64 must not wrap into a small range
    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_1:18446744073709551617"); }));
    assert(throws<SchemaError>([] { parse_contig_name("ctg_subseq_99999999999999999999:99999999999999999999"); }));

    std::cout << "  Malformed name tests passed!" << std::endl;
}

void test_integer_bounds() {
    std::cout << "Testing integer field bounds..." << std::endl;

    int64_t v = 0;
    assert(kio::parse_i64("9223372036854775807", v) && v == INT64_MAX);
    assert(kio::parse_i64("-9223372036854775807", v) && v == -INT64_MAX);
    assert(!kio::parse_i64("9223372036854775808", v));
    assert(!kio::parse_i64("99999999999999999999", v));
    assert(!kio::parse_i64("-", v));

    ContigName big = parse_contig_name("ctg_subseq_1:9223372036854775807");
    assert(big.range->end == INT64_MAX);

    std::cout << "  Integer bound tests passed!" << std::endl;
}

int main() {
    test_plain_name();
    test_subseq_name();
    test_malformed_subseq();
    test_integer_bounds();
    std::cout << "[PASS] test_contig_name" << std::endl;
    return 0;
}
