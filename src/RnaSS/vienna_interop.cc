#include "vienna_interop.hh"
#include "aux.hh"
#include "structure_failure.hh"

#include <limits>

extern "C" {
#include <ViennaRNA/utils/basic.h>
#include <ViennaRNA/utils/structures.h>
}

namespace RnaSS {

    ptable_ptr_t
    to_vienna_ptable(const PairedSites &paired) {
        // the library requires symmetric partners in range
        for (size_type i = 0; i < paired.size(); i++) {
            const site_t j = paired[i];
            if (j == PairedSites::unpaired)
                continue;
            if (j < 1 || j > static_cast<site_t>(paired.size()) ||
                j == static_cast<site_t>(i + 1) ||
                paired[j - 1] != static_cast<site_t>(i + 1)) {
                throw invalid_pairing_failure(i + 1);
            }
        }

        if (paired.size() >
            static_cast<size_type>(std::numeric_limits<short>::max())) {
            throw failure("Structure too long for Vienna pair table.");
        }

        ptable_ptr_t pt(static_cast<short *>(
            vrna_alloc(sizeof(short) * (paired.size() + 2))));

        pt[0] = static_cast<short>(paired.size());
        for (size_type i = 0; i < paired.size(); i++) {
            pt[i + 1] = static_cast<short>(paired[i]);
        }
        return pt;
    }

    PairedSites
    from_vienna_ptable(const short *pt) {
        const size_type length = pt[0];
        PairedSites paired(length, PairedSites::unpaired);
        for (size_type i = 1; i <= length; i++) {
            paired[i - 1] = pt[i];
        }
        return paired;
    }

    PairedSites
    remove_pseudoknots(const PairedSites &paired) {
        ptable_ptr_t pt = to_vienna_ptable(paired);

        ptable_ptr_t pk_free(vrna_pt_pk_remove(pt.get(), 0));
        if (!pk_free) {
            throw failure("Vienna RNA library failed to remove pseudoknots.");
        }

        return from_vienna_ptable(pk_free.get());
    }

} // end namespace RnaSS
