#include <cassert>
#include <iostream>
#include <string>

#include "agp.hpp"
#include "errors.hpp"
#include "test_utils.h"

using namespace scafbreak;
using scafbreak_test::throws;

void test_parse_sequence_record() {
    std::cout << "Testing W record parsing..." << std::endl;

    AgpRecord r = parse_agp_line("Super-Scaffold_1\t1\t79636\t1\tW\tctg_270_subseq_1:79636\t1\t79636\t+", 7);
    assert(r.object == "Super-Scaffold_1");
    assert(r.object_start == 1 && r.object_end == 79636);
    assert(r.part_number == 1);
    assert(!r.is_gap());
    assert(r.component_id == "ctg_270_subseq_1:79636");
    assert(r.component_start == 1 && r.component_end == 79636);
    assert(r.length() == 79636);
    assert(r.orientation == "+");
    assert(r.line_no == 7);

    for (const char* o : {"-", "?", "0", "na"}) {
        AgpRecord x = parse_agp_line(std::string("obj\t1\t10\t1\tW\tctg\t1\t10\t") + o);
        assert(x.orientation == o);
    }

    std::cout << "  W record tests passed!" << std::endl;
}

void test_parse_gap_record() {
    std::cout << "Testing N record parsing..." << std::endl;

    AgpRecord r = parse_agp_line("Super-Scaffold_1\t79637\t79736\t2\tN\t100\tscaffold\tyes\tmap");
    assert(r.is_gap());
    assert(r.gap_length == 100);
    assert(r.length() == 100);
    assert(r.gap_type == "scaffold");
    assert(r.linkage == "yes");
    assert(r.linkage_evidence == "map");

    std::cout << "  N record tests passed!" << std::endl;
}

void test_schema_violations() {
    std::cout << "Testing AGP schema violations..." << std::endl;

    // component types other than W/N
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tU\t100\tscaffold\tyes\tmap"); }));
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tD\tctg\t1\t10\t+"); }));
    // gap with unexpected linkage or gap type
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tN\t10\tscaffold\tno\tmap"); }));
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tN\t10\tcontig\tyes\tmap"); }));
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tN\tten\tscaffold\tyes\tmap"); }));
    // placement with a bad orientation or span
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tW\tctg\t1\t10\tforward"); }));
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tW\tctg\tone\t10\t+"); }));
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tW\tctg\t10\t1\t+"); }));
    // non-numeric object coordinates
    assert(throws<SchemaError>([] { parse_agp_line("obj\tx\t10\t1\tW\tctg\t1\t10\t+"); }));
    // coordinates that overflow int64
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tW\tctg\t1\t99999999999999999999\t+"); }));
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t10\t1\tN\t18446744073709551617\tscaffold\tyes\tmap"); }));
    assert(throws<SchemaError>([] { parse_agp_line("obj\t1\t9223372036854775808\t1\tW\tctg\t1\t10\t+"); }));
    // too few columns
    assert(throws<IoError>([] { parse_agp_line("obj\t1\t10\t1\tW\tctg\t1\t10"); }));

    std::cout << "  Schema violation tests passed!" << std::endl;
}

void test_parse_file() {
    std::cout << "Testing AGP file loading..." << std::endl;

    const std::string dir = scafbreak_test::make_temp_dir("scafbreak_test_agp");
    const std::string path = dir + "/in.agp";
    scafbreak_test::write_text(path,
        "##agp-version\t2.0\n"
        "# comment\n"
        "Super-Scaffold_2\t1\t100\t1\tW\tctgB\t1\t100\t-\n"
        "Super-Scaffold_1\t1\t50\t1\tW\tctgA_subseq_1:50\t1\t50\t+\n"
        "\n"
        "Super-Scaffold_1\t151\t200\t3\tW\tctgA_subseq_151:200\t151\t200\t+\n"
        "Super-Scaffold_1\t51\t150\t2\tN\t100\tscaffold\tyes\tmap\n");

    AgpLayout agp = parse_agp_layout(path);
    assert(agp.records.size() == 4);
    assert(agp.by_object.size() == 2);

    auto recs = agp.records_of("Super-Scaffold_1");
    assert(recs.size() == 3);
    assert(recs[0]->part_number == 1);
    assert(recs[1]->part_number == 2 && recs[1]->is_gap());
    assert(recs[2]->part_number == 3);
    assert(recs[2]->line_no == 6);

    assert(agp.records_of("missing").empty());

    // one bad line rejects the whole file
    scafbreak_test::write_text(path,
        "Super-Scaffold_1\t1\t50\t1\tW\tctgA\t1\t50\t+\n"
        "Super-Scaffold_1\t51\t150\t2\tN\t100\tscaffold\tmaybe\tmap\n");
    assert(throws<SchemaError>([&] { parse_agp_layout(path); }));

    assert(throws<IoError>([&] { parse_agp_layout(dir + "/missing.agp"); }));

    std::cout << "  File loading tests passed!" << std::endl;
}

int main() {
    test_parse_sequence_record();
    test_parse_gap_record();
    test_schema_violations();
    test_parse_file();
    std::cout << "[PASS] test_agp" << std::endl;
    return 0;
}
