#include "catch.hpp"

#include <sstream>
#include <RnaSS/paired_sites.hh>
#include <RnaSS/structure_codec.hh>
#include <RnaSS/structure_failure.hh>

using namespace RnaSS;

/** @file some unit tests for paired sites arrays
 */

TEST_CASE("paired sites arrays know their base pairs") {
    //                             12345678
    PairedSites paired = decode("((..)..)");

    REQUIRE(paired == PairedSites{8, 5, 0, 0, 2, 0, 0, 1});
    REQUIRE(paired.is_symmetric());
    REQUIRE(paired.num_base_pairs() == 2);

    bps_t bps = paired.base_pairs();
    REQUIRE(bps.size() == 2);
    REQUIRE(bps.count(bp_t(1, 8)) == 1);
    REQUIRE(bps.count(bp_t(2, 5)) == 1);

    SECTION("and can be rebuilt from them") {
        REQUIRE(PairedSites::from_base_pairs(8, bps) == paired);
    }

    SECTION("and are written blank separated") {
        std::ostringstream out;
        out << paired;
        REQUIRE(out.str() == "8 5 0 0 2 0 0 1");
    }
}

TEST_CASE("symmetry of paired sites is checked") {
    REQUIRE(PairedSites().is_symmetric());
    REQUIRE(PairedSites{0, 0, 0}.is_symmetric());
    REQUIRE(PairedSites{3, 0, 1}.is_symmetric());

    REQUIRE(!PairedSites{3, 0, 0}.is_symmetric());
    REQUIRE(!PairedSites{1, 0}.is_symmetric());   // pairs with itself
    REQUIRE(!PairedSites{4, 0, 0}.is_symmetric()); // out of range
    REQUIRE(!PairedSites{-1, 0}.is_symmetric());
    REQUIRE(!PairedSites{2, 3, 2}.is_symmetric());
}

TEST_CASE("base pair sets with shared sites are rejected") {
    bps_t bps;
    bps.insert(bp_t(1, 5));
    bps.insert(bp_t(2, 5));
    REQUIRE_THROWS_AS(PairedSites::from_base_pairs(5, bps),
                      invalid_pairing_failure);

    bps_t out_of_range;
    out_of_range.insert(bp_t(1, 6));
    REQUIRE_THROWS_AS(PairedSites::from_base_pairs(5, out_of_range),
                      invalid_pairing_failure);
}

TEST_CASE("reference structures") {
    SECTION("zero structure has no pairs") {
        REQUIRE(structure_zero(4) == PairedSites{0, 0, 0, 0});
        REQUIRE(structure_zero(0).empty());
    }

    SECTION("star structure keeps a hairpin loop") {
        REQUIRE(encode(structure_star(10)) == "((((..))))");
        REQUIRE(encode(structure_star(9)) == "((((.))))");
        REQUIRE(encode(structure_star(3)) == "(.)");
        REQUIRE(encode(structure_star(2)) == "..");
        REQUIRE(encode(structure_star(1)) == ".");
        REQUIRE(structure_star(0).empty());
    }
}

TEST_CASE("base pair distance counts differing pairs") {
    PairedSites paired1 = decode("((..))..");
    PairedSites paired2 = decode("(.(..).)");

    REQUIRE(base_pair_distance(paired1, paired1) == 0);
    REQUIRE(base_pair_distance(paired1, paired2) == 4);
    REQUIRE(base_pair_distance(paired1, structure_zero(8)) == 2);

    REQUIRE_THROWS_AS(base_pair_distance(paired1, structure_zero(7)),
                      unequal_length_failure);
}
