#include "bracket_alphabet.hh"
#include "structure_failure.hh"

#include <iostream>

namespace RnaSS {

    const size_type BracketAlphabet::npos;

    BracketAlphabet::BracketAlphabet(const std::string &left_symbols,
                                     const std::string &right_symbols,
                                     char unpaired_symbol)
        : left_symbols_(left_symbols),
          right_symbols_(right_symbols),
          unpaired_symbol_(unpaired_symbol) {
        if (left_symbols_.length() != right_symbols_.length()) {
            throw failure("Bracket alphabet: left and right symbols differ in "
                          "number.");
        }

        std::string all = left_symbols_ + right_symbols_ + unpaired_symbol_;
        for (size_type i = 0; i < all.length(); i++) {
            if (all.find(all[i], i + 1) != std::string::npos) {
                throw failure((std::string) "Bracket alphabet: symbol '" +
                              all[i] + "' occurs more than once.");
            }
        }
    }

    const BracketAlphabet &
    BracketAlphabet::standard() {
        static const BracketAlphabet alphabet("(<{[ABCDEFGHIJKLMNOPQRSTUVWXYZ",
                                              ")>}]abcdefghijklmnopqrstuvwxyz",
                                              '.');
        return alphabet;
    }

    char
    BracketAlphabet::matching(char c) const {
        size_type k = left_class(c);
        if (k != npos) {
            return right(k);
        }
        k = right_class(c);
        if (k != npos) {
            return left(k);
        }
        throw unrecognized_symbol_failure(c);
    }

    std::ostream &
    operator<<(std::ostream &out, const BracketAlphabet &alphabet) {
        for (size_type k = 0; k < alphabet.size(); k++) {
            if (k > 0)
                out << " ";
            out << alphabet.left(k) << alphabet.right(k);
        }
        return out;
    }

} // end namespace RnaSS
