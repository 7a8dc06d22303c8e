#ifndef RNASS_VIENNA_INTEROP_HH
#define RNASS_VIENNA_INTEROP_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstdlib>
#include <memory>

#include "paired_sites.hh"

namespace RnaSS {

    //! @brief Deleter for memory allocated by the Vienna RNA library
    struct vrna_free_deleter {
        //! release memory
        void
        operator()(void *p) const {
            free(p);
        }
    };

    //! Vienna pair table; entry 0 holds the length, entry i the partner of site i
    typedef std::unique_ptr<short[], vrna_free_deleter> ptable_ptr_t;

    /**
     * @brief Convert to Vienna pair table
     *
     * @param paired paired sites array
     * @return pair table
     *
     * @throw invalid_pairing_failure if the pairing is not symmetric
     * @throw failure if the structure is too long for a pair table
     */
    ptable_ptr_t
    to_vienna_ptable(const PairedSites &paired);

    /**
     * @brief Convert from Vienna pair table
     *
     * @param pt pair table
     * @return paired sites array
     */
    PairedSites
    from_vienna_ptable(const short *pt);

    /**
     * @brief Remove pseudoknots
     *
     * Computes a pseudoknot-free sub-structure with maximal number of
     * base pairs using the Vienna RNA library.
     *
     * @param paired paired sites array
     * @return pseudoknot-free paired sites array of the same length
     *
     * @throw invalid_pairing_failure if the pairing is not symmetric
     * @throw failure if the library fails
     */
    PairedSites
    remove_pseudoknots(const PairedSites &paired);

} // end namespace RnaSS

#endif // RNASS_VIENNA_INTEROP_HH
