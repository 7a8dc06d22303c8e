#ifndef RNASS_MOUNTAIN_METRIC_HH
#define RNASS_MOUNTAIN_METRIC_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <vector>

#include "aux.hh"
#include "paired_sites.hh"

/**
 * @file mountain_metric.hh
 *
 * @brief Mountain metric on secondary structures
 *
 * The mountain vector of a structure is the running sum over its
 * sites, where opening sites step up and closing sites step
 * down. Distances between structures are p-norm style sums over the
 * differences of their mountain vectors, see
 *
 *   Moulton V, Zuker M, Steel M, Pointon R, Penny D. Metrics on RNA
 *   secondary structures. J Comput Biol. 2000;7(1-2):277-292.
 *
 * In the weighted variant, each step is divided by the span of its
 * base pair, i.e. the distance between the two paired sites.
 */

namespace RnaSS {

    //! type of mountain vectors
    typedef std::vector<double> mountain_t;

    /**
     * @brief Mountain vector
     *
     * @param paired paired sites array
     * @return heights; +1 at opening, -1 at closing sites
     */
    mountain_t
    mountain_vector(const PairedSites &paired);

    /**
     * @brief Weighted mountain vector
     *
     * The span of pair (i,j) is j-i, the same at both sites, so the
     * weighted mountain returns to 0 after every pair. This differs
     * from weighting the opening site by 1/(span+1) and the closing
     * site by 1/(span-1), which leaves a residual height and divides
     * by 0 for adjacent sites.
     *
     * @param paired paired sites array
     * @return heights; +1/span at opening, -1/span at closing sites
     */
    mountain_t
    weighted_mountain_vector(const PairedSites &paired);

    /**
     * @brief Structure of a mountain vector
     *
     * Inverts mountain_vector() for nested structures: every up step
     * opens a pair, every down step closes the innermost open pair.
     *
     * @param mountain heights of an unweighted mountain vector
     * @return paired sites array without pseudoknots
     *
     * @throw structure_failure if a step is not -1, 0 or +1
     * @throw premature_closure_failure if the height drops below 0
     * @throw unconsumed_openings_failure if the final height is not 0
     */
    PairedSites
    mountain_to_paired(const mountain_t &mountain);

    /**
     * @brief Mountain distance
     *
     * @param paired1 first structure
     * @param paired2 second structure
     * @param p exponent
     *
     * @return sum over all sites of |h1-h2|^p
     *
     * @throw unequal_length_failure if the lengths differ
     */
    double
    mountain_distance(const PairedSites &paired1,
                      const PairedSites &paired2,
                      double p = 1.0);

    /**
     * @brief Mountain diameter
     *
     * The maximal mountain distance between structures of a given
     * length, i.e. the distance between structure_star(length) and
     * structure_zero(length).
     *
     * @param length sequence length
     * @param p exponent
     *
     * @return diameter; 0 for length<=2
     */
    double
    mountain_diameter(size_type length, double p = 1.0);

    /**
     * @brief Mountain distance normalised by the diameter
     *
     * @param paired1 first structure
     * @param paired2 second structure
     * @param p exponent
     *
     * @return distance/diameter; 0, if the diameter is 0
     *
     * @throw unequal_length_failure if the lengths differ
     */
    double
    normalised_mountain_distance(const PairedSites &paired1,
                                 const PairedSites &paired2,
                                 double p = 1.0);

    /**
     * @brief Weighted mountain distance
     *
     * @param paired1 first structure
     * @param paired2 second structure
     *
     * @return sum over all sites of |h1-h2| for the weighted vectors
     *
     * @throw unequal_length_failure if the lengths differ
     */
    double
    weighted_mountain_distance(const PairedSites &paired1,
                               const PairedSites &paired2);

    //! weighted distance between structure_star(length) and structure_zero(length)
    double
    weighted_mountain_diameter(size_type length);

    /**
     * @brief Weighted mountain distance normalised by the weighted diameter
     *
     * @return distance/diameter; 0, if the diameter is 0
     *
     * @throw unequal_length_failure if the lengths differ
     */
    double
    normalised_weighted_mountain_distance(const PairedSites &paired1,
                                          const PairedSites &paired2);

} // end namespace RnaSS

#endif // RNASS_MOUNTAIN_METRIC_HH
