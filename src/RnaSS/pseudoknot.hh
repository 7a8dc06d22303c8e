#ifndef RNASS_PSEUDOKNOT_HH
#define RNASS_PSEUDOKNOT_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include "aux.hh"
#include "paired_sites.hh"

namespace RnaSS {

    /**
     * @brief Test whether two base pairs cross
     *
     * @param bp1 base pair (i,j), i<j
     * @param bp2 base pair (k,l), k<l
     *
     * @return whether i<k<j<l or k<i<l<j
     */
    inline bool
    crossing(const bp_t &bp1, const bp_t &bp2) {
        return (bp1.first < bp2.first && bp2.first < bp1.second &&
                bp1.second < bp2.second) ||
            (bp2.first < bp1.first && bp1.first < bp2.second &&
             bp2.second < bp1.second);
    }

    /**
     * @brief Test for pseudoknots
     *
     * Scans the sites from left to right and keeps the partners of
     * open pairs on a stack. A pair that opens inside an open pair
     * but closes at or after it crosses that pair.
     *
     * @param paired paired sites array
     *
     * @return whether the structure contains crossing base pairs
     *
     * @throw premature_closure_failure if a closing site occurs while
     * no pair is open
     * @throw unconsumed_openings_failure if pairs remain open at the
     * end of a structure without crossing
     *
     * @note both failures indicate a non-symmetric array
     */
    bool
    is_pseudoknotted(const PairedSites &paired);

} // end namespace RnaSS

#endif // RNASS_PSEUDOKNOT_HH
