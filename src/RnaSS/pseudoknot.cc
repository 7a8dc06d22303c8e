#include "pseudoknot.hh"
#include "structure_failure.hh"

#include <stack>

namespace RnaSS {

    bool
    is_pseudoknotted(const PairedSites &paired) {
        std::stack<site_t> st;

        for (size_type i = 0; i < paired.size(); i++) {
            const site_t j = paired[i];
            if (j == PairedSites::unpaired)
                continue;

            if (j > static_cast<site_t>(i)) {
                // opening site; the new pair must close before the
                // innermost open pair
                if (!st.empty() && st.top() <= j) {
                    return true;
                }
                st.push(j);
            } else if (!st.empty()) {
                st.pop();
            } else {
                throw premature_closure_failure(i + 1);
            }
        }

        if (!st.empty()) {
            throw unconsumed_openings_failure(st.size());
        }

        return false;
    }

} // end namespace RnaSS
