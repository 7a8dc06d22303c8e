#include "structure_codec.hh"
#include "structure_failure.hh"

#include <vector>

namespace RnaSS {

    namespace {
        //! stack of pending positions, one per bracket class
        typedef std::vector<std::vector<site_t> > class_stacks_t;

        /**
         * @brief Assign base pairs to bracket classes
         *
         * Scan from left to right; open a pair in the lowest class
         * whose innermost open pair closes after the new pair (or
         * that has no open pair), close it in the class it was
         * opened in.
         *
         * @param paired paired sites array
         * @param max_classes number of available classes
         *
         * @return class of every site; BracketAlphabet::npos for
         * unpaired sites
         */
        std::vector<size_type>
        assign_classes(const PairedSites &paired, size_type max_classes) {
            const site_t n = static_cast<site_t>(paired.size());

            class_stacks_t stacks(max_classes);
            std::vector<size_type> classes(paired.size(),
                                           BracketAlphabet::npos);

            for (site_t i = 0; i < n; i++) {
                const site_t j = paired[i];
                if (j == PairedSites::unpaired)
                    continue;

                if (j < 1 || j > n || j == i + 1) {
                    throw invalid_pairing_failure(i + 1);
                }

                if (j > i + 1) {
                    // opening site
                    size_type k = 0;
                    while (k < max_classes && !stacks[k].empty() &&
                           stacks[k].back() < j) {
                        k++;
                    }
                    if (k == max_classes) {
                        throw insufficient_bracket_classes_failure(max_classes);
                    }
                    stacks[k].push_back(j);
                    classes[i] = k;
                } else {
                    // closing site; its pair is the innermost open
                    // pair of the class chosen at the opening site
                    const size_type k = classes[j - 1];
                    if (k == BracketAlphabet::npos || stacks[k].empty() ||
                        stacks[k].back() != i + 1) {
                        throw invalid_pairing_failure(i + 1);
                    }
                    stacks[k].pop_back();
                    classes[i] = k;
                }
            }

            // pairs left open have a partner to the right that does
            // not point back
            for (size_type k = 0; k < max_classes; k++) {
                if (!stacks[k].empty()) {
                    throw invalid_pairing_failure(stacks[k].back());
                }
            }

            return classes;
        }
    }

    PairedSites
    decode(const std::string &structure, const BracketAlphabet &alphabet) {
        PairedSites paired(structure.length(), PairedSites::unpaired);

        class_stacks_t stacks(alphabet.size());

        for (size_type i = 0; i < structure.length(); i++) {
            const char c = structure[i];
            if (c == alphabet.unpaired_symbol())
                continue;

            size_type k = alphabet.left_class(c);
            if (k != BracketAlphabet::npos) {
                stacks[k].push_back(i);
                continue;
            }

            k = alphabet.right_class(c);
            if (k != BracketAlphabet::npos) {
                if (stacks[k].empty()) {
                    throw unmatched_closing_bracket_failure(k, alphabet.left(k),
                                                            c, i + 1);
                }
                const site_t j = stacks[k].back();
                stacks[k].pop_back();
                paired[i] = j + 1;
                paired[j] = i + 1;
                continue;
            }

            throw unrecognized_symbol_failure(c, i + 1);
        }

        for (size_type k = 0; k < alphabet.size(); k++) {
            if (!stacks[k].empty()) {
                throw unmatched_opening_bracket_failure(
                    k, alphabet.left(k), alphabet.right(k),
                    stacks[k].back() + 1);
            }
        }

        return paired;
    }

    std::string
    encode(const PairedSites &paired, const BracketAlphabet &alphabet) {
        std::vector<size_type> classes =
            assign_classes(paired, alphabet.size());

        std::string s(paired.size(), alphabet.unpaired_symbol());
        for (size_type i = 0; i < paired.size(); i++) {
            if (classes[i] == BracketAlphabet::npos)
                continue;
            if (paired[i] > static_cast<site_t>(i + 1)) {
                s[i] = alphabet.left(classes[i]);
            } else {
                s[i] = alphabet.right(classes[i]);
            }
        }
        return s;
    }

    size_type
    bracket_classes_needed(const PairedSites &paired) {
        // every pair can take its own class, so this never fails
        // for lack of classes
        std::vector<size_type> classes =
            assign_classes(paired, paired.num_base_pairs());

        size_type needed = 0;
        for (size_type k : classes) {
            if (k != BracketAlphabet::npos && k + 1 > needed) {
                needed = k + 1;
            }
        }
        return needed;
    }

} // end namespace RnaSS
