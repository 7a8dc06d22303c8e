#ifndef RNASS_BRACKET_ALPHABET_HH
#define RNASS_BRACKET_ALPHABET_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iosfwd>
#include <string>

#include "aux.hh"

namespace RnaSS {

    /**
     * \brief Bracket symbols of extended dot-bracket strings
     *
     * Maintains an ordered list of left bracket symbols and the
     * parallel list of right bracket symbols. The position of a
     * symbol in its list is the index of its bracket class; the left
     * and right symbol of a class form a pair.
     *
     * Several classes are required to write crossing base pairs
     * (pseudoknots) unambiguously. The standard alphabet provides 30
     * classes: four pairs of punctuation symbols followed by the
     * upper-case/lower-case letter pairs.
     */
    class BracketAlphabet {
    public:
        //! returned by lookups of symbols that are not brackets
        static const size_type npos = std::string::npos;

        /**
         * @brief Construct from symbol lists
         *
         * @param left_symbols left bracket symbols in class order
         * @param right_symbols corresponding right bracket symbols
         * @param unpaired_symbol symbol of unpaired sites
         *
         * @throw failure if the lists differ in length, contain a
         * symbol twice, or contain the unpaired symbol
         */
        BracketAlphabet(const std::string &left_symbols,
                        const std::string &right_symbols,
                        char unpaired_symbol = '.');

        /**
         * @brief The standard alphabet
         *
         * @return alphabet with left symbols "(<{[A..Z", right
         * symbols ")>}]a..z" and unpaired symbol '.'
         */
        static const BracketAlphabet &
        standard();

        //! number of bracket classes
        size_type
        size() const {
            return left_symbols_.length();
        }

        //! symbol of unpaired sites
        char
        unpaired_symbol() const {
            return unpaired_symbol_;
        }

        //! left symbol of class k
        char
        left(size_type k) const {
            return left_symbols_[k];
        }

        //! right symbol of class k
        char
        right(size_type k) const {
            return right_symbols_[k];
        }



        /**
         * @brief class of a left bracket
         * @param c symbol
         * @return class index or npos, if c is no left bracket
         */
        size_type
        left_class(char c) const {
            return left_symbols_.find(c);
        }

        /**
         * @brief class of a right bracket
         * @param c symbol
         * @return class index or npos, if c is no right bracket
         */
        size_type
        right_class(char c) const {
            return right_symbols_.find(c);
        }

        //! test for left bracket
        bool
        is_left(char c) const {
            return left_class(c) != npos;
        }

        //! test for right bracket
        bool
        is_right(char c) const {
            return right_class(c) != npos;
        }

        /**
         * @brief matching bracket of a symbol
         *
         * @param c left or right bracket
         * @return the right symbol for a left bracket and vice versa
         *
         * @throw unrecognized_symbol_failure if c is no bracket
         */
        char
        matching(char c) const;

    private:
        std::string left_symbols_;
        std::string right_symbols_;
        char unpaired_symbol_;
    };

    /**
     * Output operator writing the bracket pairs of an alphabet
     *
     * @param out the output stream
     * @param alphabet the alphabet
     *
     * @return output stream after writing alphabet
     */
    std::ostream &
    operator<<(std::ostream &out, const BracketAlphabet &alphabet);

} // end namespace RnaSS

#endif // RNASS_BRACKET_ALPHABET_HH
