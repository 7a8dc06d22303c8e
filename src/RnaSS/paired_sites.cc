#include "paired_sites.hh"
#include "structure_failure.hh"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace RnaSS {

    constexpr site_t PairedSites::unpaired;

    bool
    PairedSites::is_symmetric() const {
        const site_t n = static_cast<site_t>(size());
        for (site_t i = 0; i < n; i++) {
            site_t j = (*this)[i];
            if (j == unpaired)
                continue;
            if (j < 1 || j > n || j == i + 1)
                return false;
            if ((*this)[j - 1] != i + 1)
                return false;
        }
        return true;
    }

    size_type
    PairedSites::num_base_pairs() const {
        size_type count = 0;
        for (size_type i = 0; i < size(); i++) {
            if ((*this)[i] > static_cast<site_t>(i + 1))
                count++;
        }
        return count;
    }

    bps_t
    PairedSites::base_pairs() const {
        bps_t bps;
        for (size_type i = 0; i < size(); i++) {
            site_t j = (*this)[i];
            if (j > static_cast<site_t>(i + 1)) {
                bps.insert(bp_t(i + 1, j));
            }
        }
        return bps;
    }

    PairedSites
    PairedSites::from_base_pairs(size_type length, const bps_t &bps) {
        PairedSites paired(length, unpaired);
        for (const auto &bp : bps) {
            if (bp.first < 1 || bp.first >= bp.second || bp.second > length) {
                throw invalid_pairing_failure(bp.first);
            }
            if (paired[bp.first - 1] != unpaired) {
                throw invalid_pairing_failure(bp.first);
            }
            if (paired[bp.second - 1] != unpaired) {
                throw invalid_pairing_failure(bp.second);
            }
            paired[bp.first - 1] = bp.second;
            paired[bp.second - 1] = bp.first;
        }
        return paired;
    }

    PairedSites
    structure_zero(size_type length) {
        return PairedSites(length, PairedSites::unpaired);
    }

    PairedSites
    structure_star(size_type length) {
        PairedSites paired(length, PairedSites::unpaired);
        const site_t len = static_cast<site_t>(length);
        const site_t upper = len / 2 - ((len + 1) % 2);
        for (site_t i = 0; i < upper; i++) {
            site_t j = len - i - 1;
            paired[i] = j + 1;
            paired[j] = i + 1;
        }
        return paired;
    }

    size_type
    base_pair_distance(const PairedSites &paired1, const PairedSites &paired2) {
        if (paired1.size() != paired2.size()) {
            throw unequal_length_failure(paired1.size(), paired2.size());
        }
        bps_t bps1 = paired1.base_pairs();
        bps_t bps2 = paired2.base_pairs();

        bps_t diff;
        std::set_symmetric_difference(bps1.begin(), bps1.end(),
                                      bps2.begin(), bps2.end(),
                                      std::inserter(diff, diff.begin()));
        return diff.size();
    }

    std::ostream &
    operator<<(std::ostream &out, const PairedSites &paired) {
        for (size_type i = 0; i < paired.size(); i++) {
            if (i > 0)
                out << " ";
            out << paired[i];
        }
        return out;
    }

} // end namespace RnaSS
