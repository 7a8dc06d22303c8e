#ifndef RNASS_PAIRED_SITES_HH
#define RNASS_PAIRED_SITES_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iosfwd>
#include <vector>

#include "aux.hh"

namespace RnaSS {

    /**
     * \brief An RNA secondary structure as paired sites array
     *
     * Entry i (0-based) holds the 1-based position of the partner of
     * site i+1, or 0 if the site is unpaired. In a valid array the
     * pairing is symmetric, i.e. for x[i]=j!=0 we have x[j-1]=i+1, and
     * no site pairs with itself. Arbitrary pseudoknots can be
     * represented.
     *
     * This is the canonical representation of structures; bracket
     * strings are derived from it.
     */
    class PairedSites : public std::vector<site_t> {
    public:
        //! entry of unpaired sites
        static constexpr site_t unpaired = 0;

        using std::vector<site_t>::vector;

        //! construct empty
        PairedSites() : std::vector<site_t>() {}

        //! construct from vector of entries
        explicit PairedSites(const std::vector<site_t> &v)
            : std::vector<site_t>(v) {}

        /**
         * @brief read-only access to the paired sites
         *
         * Structure records offer the same accessor, such that code
         * can be written generically for both.
         */
        const PairedSites &
        paired() const {
            return *this;
        }

        /**
         * @brief test symmetry of the pairing
         *
         * @return whether every partner is in range, no site pairs
         * with itself and every pairing is reciprocated
         */
        bool
        is_symmetric() const;

        //! number of base pairs
        size_type
        num_base_pairs() const;

        /**
         * @brief base pair set
         *
         * @return set of base pairs (i,j), i<j, in 1-based positions
         *
         * @note only pairs that are listed at their left end are
         * reported; symmetry is not checked
         */
        bps_t
        base_pairs() const;

        /**
         * @brief construct from base pair set
         *
         * @param length sequence length
         * @param bps base pairs (i,j) in 1-based positions
         *
         * @return paired sites array
         *
         * @throw invalid_pairing_failure if a base pair is out of
         * range or a site occurs in more than one base pair
         */
        static PairedSites
        from_base_pairs(size_type length, const bps_t &bps);
    };

    /**
     * @brief Structure with all sites unpaired
     *
     * @param length sequence length
     * @return paired sites array of zeros
     */
    PairedSites
    structure_zero(size_type length);

    /**
     * @brief Structure with the maximal number of nested base pairs
     *
     * Site i pairs with site length-1-i (0-based) for the first
     * length/2 - ((length+1) mod 2) sites; e.g. "((((..))))" for
     * length 10 and "((((.))))" for length 9. Every hairpin keeps at
     * least one unpaired site.
     *
     * @param length sequence length
     * @return paired sites array
     */
    PairedSites
    structure_star(size_type length);

    /**
     * @brief Base pair distance
     *
     * @param paired1 first structure
     * @param paired2 second structure
     *
     * @return number of base pairs that occur in exactly one of the
     * structures
     *
     * @throw unequal_length_failure if the lengths differ
     */
    size_type
    base_pair_distance(const PairedSites &paired1, const PairedSites &paired2);

    /**
     * Output operator writing the entries separated by blanks
     *
     * @param out output stream
     * @param paired paired sites array
     *
     * @return output stream
     */
    std::ostream &
    operator<<(std::ostream &out, const PairedSites &paired);

} // end namespace RnaSS

#endif // RNASS_PAIRED_SITES_HH
