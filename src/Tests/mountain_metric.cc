#include "catch.hpp"

#include <vector>

#include <RnaSS/mountain_metric.hh>
#include <RnaSS/structure_codec.hh>
#include <RnaSS/structure_failure.hh>

using namespace RnaSS;

/** @file some unit tests for mountain vectors and distances
 */

TEST_CASE("mountain vectors count the enclosing pairs") {
    REQUIRE(mountain_vector(decode("(((...)))")) ==
            mountain_t({1, 2, 3, 3, 3, 3, 2, 1, 0}));
    REQUIRE(mountain_vector(decode("....")) == mountain_t(4, 0.0));
    REQUIRE(mountain_vector(PairedSites()).empty());

    SECTION("pseudoknots are counted by their sites") {
        REQUIRE(mountain_vector(decode("([)]")) == mountain_t({1, 2, 1, 0}));
    }
}

TEST_CASE("nested structures are recovered from their mountains") {
    PairedSites paired = decode("((..)(...)).(.)");
    REQUIRE(mountain_to_paired(mountain_vector(paired)) == paired);
    REQUIRE(mountain_to_paired(mountain_t()).empty());

    SECTION("pseudoknots are resolved as nested pairs") {
        REQUIRE(encode(mountain_to_paired(mountain_vector(decode("([)]")))) ==
                "(())");
    }

    SECTION("invalid mountains are rejected") {
        REQUIRE_THROWS_AS(mountain_to_paired(mountain_t({1, 3, 1, 0})),
                          structure_failure);
        REQUIRE_THROWS_AS(mountain_to_paired(mountain_t({0, -1, 0})),
                          premature_closure_failure);
        REQUIRE_THROWS_AS(mountain_to_paired(mountain_t({1, 1})),
                          unconsumed_openings_failure);
    }
}

TEST_CASE("mountain distance between structures") {
    PairedSites star = structure_star(10);
    PairedSites zero = structure_zero(10);

    REQUIRE(mountain_distance(star, star) == 0.0);
    REQUIRE(mountain_distance(star, zero) == Approx(24.0));
    REQUIRE(mountain_distance(zero, star) == Approx(24.0));

    SECTION("the exponent is applied to every height difference") {
        // heights of star: 1 2 3 4 4 4 3 2 1 0
        REQUIRE(mountain_distance(star, zero, 2.0) == Approx(76.0));
    }

    SECTION("the diameter is the distance of star and zero structure") {
        REQUIRE(mountain_diameter(10) == Approx(24.0));
        REQUIRE(mountain_diameter(10, 2.0) == Approx(76.0));
        REQUIRE(mountain_diameter(2) == 0.0);
        REQUIRE(mountain_diameter(0) == 0.0);
    }

    SECTION("normalised distances are in [0,1]") {
        REQUIRE(normalised_mountain_distance(star, zero) == Approx(1.0));
        REQUIRE(normalised_mountain_distance(star, star) == 0.0);

        PairedSites star100 = structure_star(100);
        PairedSites zero100 = structure_zero(100);
        REQUIRE(normalised_mountain_distance(star100, zero100, 2.0) ==
                Approx(1.0));

        PairedSites other = decode("((......))");
        double d = normalised_mountain_distance(other, zero);
        REQUIRE(d > 0.0);
        REQUIRE(d < 1.0);
    }

    SECTION("normalisation of short structures yields zero") {
        REQUIRE(normalised_mountain_distance(PairedSites{2, 1},
                                             structure_zero(2)) == 0.0);
    }

    SECTION("structures must have equal length") {
        REQUIRE_THROWS_AS(mountain_distance(star, structure_zero(9)),
                          unequal_length_failure);
        REQUIRE_THROWS_AS(normalised_mountain_distance(star, structure_zero(9)),
                          unequal_length_failure);
    }
}

TEST_CASE("mountain distance is a metric on structures of equal length") {
    std::vector<PairedSites> structures = {
        decode("((..((...))..))."),
        decode("(((...)))......."),
        decode("..(((....)))...."),
        decode("((..[[..))..]].."),
        decode("................")};

    for (double p : {0.0, 0.5, 1.0, 2.0}) {
        for (const auto &a : structures) {
            // equal heights contribute nothing, also for p=0
            REQUIRE(mountain_distance(a, a, p) == 0.0);
            REQUIRE(normalised_mountain_distance(a, a, p) == 0.0);

            for (const auto &b : structures) {
                REQUIRE(mountain_distance(a, b, p) ==
                        mountain_distance(b, a, p));
            }
        }
    }

    SECTION("for p=0 the distance counts the differing heights") {
        REQUIRE(mountain_distance(structures[1], structures[4], 0.0) ==
                Approx(8.0));
        REQUIRE(mountain_diameter(10, 0.0) == Approx(9.0));
    }

    SECTION("weighted distances are symmetric as well") {
        for (const auto &a : structures) {
            REQUIRE(weighted_mountain_distance(a, a) == 0.0);
            for (const auto &b : structures) {
                REQUIRE(weighted_mountain_distance(a, b) ==
                        Approx(weighted_mountain_distance(b, a)));
            }
        }
    }
}

TEST_CASE("weighted mountain vectors divide by the pair span") {
    mountain_t mountain = weighted_mountain_vector(decode("(..)"));
    REQUIRE(mountain.size() == 4);
    REQUIRE(mountain[0] == Approx(1.0 / 3));
    REQUIRE(mountain[1] == Approx(1.0 / 3));
    REQUIRE(mountain[2] == Approx(1.0 / 3));
    REQUIRE(mountain[3] == Approx(0.0));

    SECTION("weighted distance and diameter") {
        REQUIRE(weighted_mountain_distance(decode("(..)"), structure_zero(4)) ==
                Approx(1.0));
        REQUIRE(weighted_mountain_diameter(4) == Approx(1.0));
        REQUIRE(normalised_weighted_mountain_distance(decode("(..)"),
                                                      structure_zero(4)) ==
                Approx(1.0));
        REQUIRE(normalised_weighted_mountain_distance(decode("(..)"),
                                                      decode("(..)")) == 0.0);
        REQUIRE_THROWS_AS(weighted_mountain_distance(decode("(..)"),
                                                     structure_zero(3)),
                          unequal_length_failure);
    }
}
