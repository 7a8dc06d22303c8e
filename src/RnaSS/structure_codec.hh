#ifndef RNASS_STRUCTURE_CODEC_HH
#define RNASS_STRUCTURE_CODEC_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <string>

#include "paired_sites.hh"
#include "bracket_alphabet.hh"

namespace RnaSS {

    /**
     * @brief Parse an extended dot-bracket string
     *
     * Left and right brackets of the same class are matched like
     * parentheses; brackets of different classes may cross.
     *
     * @param structure bracket string
     * @param alphabet bracket alphabet
     *
     * @return paired sites array of the length of the string
     *
     * @throw unmatched_closing_bracket_failure for a right bracket
     * without pending left bracket of its class
     * @throw unmatched_opening_bracket_failure for left brackets that
     * are never closed; reported is the innermost unclosed bracket of
     * the lowest such class
     * @throw unrecognized_symbol_failure for symbols that are neither
     * brackets nor the unpaired symbol
     */
    PairedSites
    decode(const std::string &structure,
           const BracketAlphabet &alphabet = BracketAlphabet::standard());

    /**
     * @brief Write a paired sites array as extended dot-bracket string
     *
     * Base pairs are assigned to bracket classes greedily from left to
     * right: a pair gets the lowest class in which it does not cross
     * a pair that is still open. Non-crossing structures are
     * therefore written with the first class only.
     *
     * @param paired paired sites array
     * @param alphabet bracket alphabet
     *
     * @return bracket string
     *
     * @throw insufficient_bracket_classes_failure if the alphabet
     * has too few classes
     * @throw invalid_pairing_failure if the array is not symmetric
     */
    std::string
    encode(const PairedSites &paired,
           const BracketAlphabet &alphabet = BracketAlphabet::standard());

    /**
     * @brief Number of bracket classes used by encode()
     *
     * @param paired paired sites array
     * @return number of classes (0 for structures without base pairs)
     *
     * @throw invalid_pairing_failure if the array is not symmetric
     */
    size_type
    bracket_classes_needed(const PairedSites &paired);

} // end namespace RnaSS

#endif // RNASS_STRUCTURE_CODEC_HH
