#include "catch.hpp"

#include <sstream>
#include <RnaSS/structure_record.hh>
#include <RnaSS/structure_failure.hh>

using namespace RnaSS;

/** @file some unit tests for structure records
 */

TEST_CASE("structure records can be built from bracket strings") {
    StructureRecord record("((..)..)");

    REQUIRE(record.name() == "");
    REQUIRE(record.sequence() == "NNNNNNNN");
    REQUIRE(record.length() == 8);
    REQUIRE(record.paired() == PairedSites{8, 5, 0, 0, 2, 0, 0, 1});
    REQUIRE(record.dot_bracket_string() == "((..)..)");
    REQUIRE(!record.is_pseudoknotted());

    SECTION("fields can be set") {
        record.set_name("example");
        record.set_sequence("CGAACAAG");
        REQUIRE(record.to_string() == ">example\nCGAACAAG\n((..)..)");

        std::ostringstream out;
        out << record;
        REQUIRE(out.str() == record.to_string());
    }

    SECTION("records compare by all fields") {
        StructureRecord copy(record);
        REQUIRE(copy == record);
        copy.set_name("other");
        REQUIRE(!(copy == record));
    }

    SECTION("malformed strings are rejected") {
        REQUIRE_THROWS_AS(StructureRecord("((..)"), structure_failure);
    }
}

TEST_CASE("structure records with pseudoknots") {
    StructureRecord record("pk", "GGGAAACCCUUU", PairedSites());
    record.set_paired(PairedSites{9, 8, 0, 12, 0, 0, 0, 2, 1, 0, 0, 4});

    REQUIRE(record.is_pseudoknotted());
    REQUIRE(record.dot_bracket_string() == "((.<...))..>");

    BracketAlphabet alphabet("[{", "]}", '-');
    REQUIRE(record.dot_bracket_string(alphabet) == "[[-{---]]--}");
}

TEST_CASE("mountain distances of records") {
    StructureRecord star("((((..))))");
    StructureRecord zero(structure_zero(10));

    REQUIRE(zero.sequence() == "NNNNNNNNNN");
    REQUIRE(star.mountain_distance(zero) == Approx(24.0));
    REQUIRE(star.normalised_mountain_distance(zero) == Approx(1.0));
    REQUIRE(star.normalised_mountain_distance(star, 2.0) == 0.0);
}
