#include "catch.hpp"

#include <cstdio>
#include <sstream>
#include <RnaSS/structure_io.hh>
#include <RnaSS/structure_codec.hh>
#include <RnaSS/structure_failure.hh>

using namespace RnaSS;

/** @file some unit tests for reading and writing structure files
 */

static const std::string example_ct =
    ">example\n"
    "1\tC\t0\t2\t8\t1\n"
    "2\tG\t1\t3\t5\t2\n"
    "3\tA\t2\t4\t0\t3\n"
    "4\tA\t3\t5\t0\t4\n"
    "5\tC\t4\t6\t2\t5\n"
    "6\tA\t5\t7\t0\t6\n"
    "7\tA\t6\t8\t0\t7\n"
    "8\tG\t7\t9\t1\t8\n";

TEST_CASE("records are written in connect format") {
    StructureRecord record("example", "CGAACAAG", decode("((..)..)"));

    REQUIRE(ct_string(record) == example_ct);

    std::ostringstream out;
    write_ct(out, records_t{record, record});
    REQUIRE(out.str() == example_ct + example_ct);

    SECTION("sequence and structure must have the same length") {
        record.set_sequence("CGA");
        REQUIRE_THROWS_AS(ct_string(record), failure);
    }
}

TEST_CASE("connect format files can be read") {
    SECTION("with '>' header") {
        std::istringstream in(example_ct);
        records_t records;
        std::ostringstream log;

        REQUIRE(read_ct(in, records, log) == 0);
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].name() == "example");
        REQUIRE(records[0].sequence() == "CGAACAAG");
        REQUIRE(records[0].paired() == PairedSites{8, 5, 0, 0, 2, 0, 0, 1});
        REQUIRE(log.str() == "");
    }

    SECTION("with length header and extra columns") {
        std::istringstream in("4  ENERGY = -1.2  hairpin\n"
                              "  1 G 0 2 4 1\n"
                              "  2 A 1 3 0 2\n"
                              "  3 A 2 4 0 3\n"
                              "  4 C 3 0 1 4\n"
                              "\n"
                              "3 second\n"
                              "1 A 0 2 0 1\n"
                              "2 A 1 3 0 2\n"
                              "3 A 2 0 0 3\n");
        records_t records;
        std::ostringstream log;

        REQUIRE(read_ct(in, records, log) == 0);
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].name() == "ENERGY = -1.2  hairpin");
        REQUIRE(records[0].dot_bracket_string() == "(..)");
        REQUIRE(records[1].name() == "second");
        REQUIRE(records[1].sequence() == "AAA");
        REQUIRE(records[1].dot_bracket_string() == "...");
    }

    SECTION("malformed records are skipped") {
        std::istringstream in(">gap\n"
                              "1 G 0 2 0 1\n"
                              "3 A 1 3 0 3\n"
                              ">asymmetric\n"
                              "1 G 0 2 2 1\n"
                              "2 A 1 3 0 2\n" +
                              example_ct);
        records_t records;
        std::ostringstream log;

        REQUIRE(read_ct(in, records, log) == 2);
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].name() == "example");
        REQUIRE(log.str().find("WARNING: skip record 'gap'") !=
                std::string::npos);
        REQUIRE(log.str().find("WARNING: skip record 'asymmetric'") !=
                std::string::npos);
    }
}

TEST_CASE("dot-bracket files can be read") {
    std::istringstream in(">first\n"
                          "GGGAAACCC\n"
                          "(((...))) (-1.20)\n"
                          "\n"
                          ">second\n"
                          "<<..[[..>>..]]\n"
                          ">broken\n"
                          "((...\n"
                          ">mismatch\n"
                          "GGG\n"
                          "(.)..\n"
                          ">last\n"
                          "AAAA\n"
                          "....\n");
    records_t records;
    std::ostringstream log;

    REQUIRE(read_dbn(in, records, log) == 2);
    REQUIRE(records.size() == 3);

    REQUIRE(records[0].name() == "first");
    REQUIRE(records[0].sequence() == "GGGAAACCC");
    REQUIRE(records[0].dot_bracket_string() == "(((...)))");

    REQUIRE(records[1].name() == "second");
    REQUIRE(records[1].sequence() == "NNNNNNNNNNNNNN");
    REQUIRE(records[1].is_pseudoknotted());
    REQUIRE(records[1].dot_bracket_string() == "((..<<..))..>>");

    REQUIRE(records[2].name() == "last");

    REQUIRE(log.str().find("'broken'") != std::string::npos);
    REQUIRE(log.str().find("'mismatch'") != std::string::npos);

    SECTION("records are written back with normalised brackets") {
        std::ostringstream out;
        write_dbn(out, records);
        REQUIRE(out.str() ==
                ">first\nGGGAAACCC\n(((...)))\n"
                ">second\nNNNNNNNNNNNNNN\n((..<<..))..>>\n"
                ">last\nAAAA\n....\n");
    }
}

TEST_CASE("dot-bracket records are parsed from their lines") {
    StructureRecord record = parse_dbn_record("r", {"ACGU", "(..)"});
    REQUIRE(record.sequence() == "ACGU");

    REQUIRE_THROWS_AS(parse_dbn_record("r", {}), syntax_error_failure);
    REQUIRE_THROWS_AS(parse_dbn_record("r", {"A", "B", "C"}),
                      syntax_error_failure);
    REQUIRE_THROWS_AS(parse_dbn_record("r", {"ACG", "(..)"}),
                      syntax_error_failure);
    REQUIRE_THROWS_AS(parse_dbn_record("r", {"(.."}), structure_failure);
}

TEST_CASE("Rfam Stockholm files can be read") {
    std::istringstream in("# STOCKHOLM 1.0\n"
                          "#=GF AC   RF00001\n"
                          "#=GF ID   first\n"
                          "seq1      GGGAAAUCC\n"
                          "#=GC SS_cons <<<___>>>\n"
                          "#=GC RF      GGGaaaCCC\n"
                          "//\n"
                          "# STOCKHOLM 1.0\n"
                          "#=GF ID   only_id\n"
                          "#=GC SS_cons ((,,\n"
                          "#=GC RF      AAAA\n"
                          "#=GC SS_cons ))\n"
                          "#=GC RF      UU\n"
                          "//\n"
                          "# STOCKHOLM 1.0\n"
                          "#=GF AC   RF00003\n"
                          "#=GC SS_cons <<..\n"
                          "#=GC RF      AAAA\n"
                          "//\n");
    records_t records;
    std::ostringstream log;

    REQUIRE(read_rfam_stockholm(in, records, log) == 1);
    REQUIRE(records.size() == 2);

    REQUIRE(records[0].name() == "RF00001");
    REQUIRE(records[0].sequence() == "GGGaaaCCC");
    REQUIRE(records[0].dot_bracket_string() == "(((...)))");

    REQUIRE(records[1].name() == "only_id");
    REQUIRE(records[1].sequence() == "AAAAUU");
    REQUIRE(records[1].dot_bracket_string() == "((..))");

    REQUIRE(log.str().find("'RF00003'") != std::string::npos);
}

TEST_CASE("Stockholm records of inconsistent length are skipped") {
    std::istringstream in("# STOCKHOLM 1.0\n"
                          "#=GF AC   RF00010\n"
                          "#=GC SS_cons ((..))\n"
                          "#=GC RF      ACG\n"
                          "//\n"
                          "# STOCKHOLM 1.0\n"
                          "#=GF AC   RF00011\n"
                          "#=GC SS_cons <..>\n"
                          "#=GC RF      ACGU\n"
                          "//\n");
    records_t records;
    std::ostringstream log;

    REQUIRE(read_rfam_stockholm(in, records, log) == 1);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].name() == "RF00011");
    REQUIRE(records[0].sequence().length() == records[0].length());
    REQUIRE(log.str().find("WARNING: skip record 'RF00010'") !=
            std::string::npos);

    SECTION("the remaining records can be written in connect format") {
        std::ostringstream out;
        write_ct(out, records);
        REQUIRE(out.str() == ">RF00011\n"
                             "1\tA\t0\t2\t4\t1\n"
                             "2\tC\t1\t3\t0\t2\n"
                             "3\tG\t2\t4\t0\t3\n"
                             "4\tU\t3\t5\t1\t4\n");
    }
}

TEST_CASE("WUSS annotations map to dot-bracket strings") {
    REQUIRE(wuss_to_dot_bracket("<<__>>,,::--~~;;") == "<<..>>..........");
    REQUIRE(wuss_to_dot_bracket("[[..]]AAaa") == "[[..]]AAaa");
}

TEST_CASE("structure formats are named") {
    REQUIRE(StructureFormat::from_string("dbn") == StructureFormat::DBN);
    REQUIRE(StructureFormat::from_string("ct") == StructureFormat::CT);
    REQUIRE(StructureFormat::from_string("stockholm") ==
            StructureFormat::STOCKHOLM);
    REQUIRE(StructureFormat::from_string("sto") == StructureFormat::STOCKHOLM);
    REQUIRE_THROWS_AS(StructureFormat::from_string("fasta"), wrong_format_failure);
}

TEST_CASE("structure files can be written and read again") {
    records_t records;
    records.push_back(StructureRecord("a", "GGGAAACCC", decode("(((...)))")));
    records.push_back(StructureRecord("b", "GACUGACU", decode("(.<.).>.")));

    const std::string filename = "rnass_test_structure_io.tmp";

    SECTION("in connect format") {
        write_structure_file(filename, StructureFormat::CT, records);
        records_t read_records;
        REQUIRE(read_structure_file(filename, StructureFormat::CT,
                                    read_records) == 0);
        REQUIRE(read_records == records);
    }

    SECTION("in dot-bracket notation") {
        write_structure_file(filename, StructureFormat::DBN, records);
        records_t read_records;
        REQUIRE(read_structure_file(filename, StructureFormat::DBN,
                                    read_records) == 0);
        REQUIRE(read_records == records);
    }

    std::remove(filename.c_str());

    SECTION("Stockholm files are not written") {
        REQUIRE_THROWS_AS(
            write_structure_file(filename, StructureFormat::STOCKHOLM, records),
            failure);
    }

    SECTION("missing files are reported") {
        records_t read_records;
        REQUIRE_THROWS_AS(read_structure_file("rnass_no_such_file.dbn",
                                              StructureFormat::DBN,
                                              read_records),
                          failure);
    }
}
