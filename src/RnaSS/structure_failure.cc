#include "structure_failure.hh"

#include <string>

namespace RnaSS {

    unmatched_closing_bracket_failure::unmatched_closing_bracket_failure(
        size_type bracket_class, char left, char right, size_type position)
        : bracket_failure((std::string) "Missing left bracket '" + left +
                              "' for '" + right + "' at position " +
                              std::to_string(position),
                          bracket_class,
                          left,
                          right,
                          position) {}

    unmatched_opening_bracket_failure::unmatched_opening_bracket_failure(
        size_type bracket_class, char left, char right, size_type position)
        : bracket_failure((std::string) "Missing right bracket '" + right +
                              "' for '" + left + "' at position " +
                              std::to_string(position),
                          bracket_class,
                          left,
                          right,
                          position) {}

    unrecognized_symbol_failure::unrecognized_symbol_failure(char symbol,
                                                             size_type position)
        : structure_failure((std::string) "Bracket type not recognised: '" +
                            symbol + "' at position " +
                            std::to_string(position)),
          symbol_(symbol),
          position_(position) {}

    unrecognized_symbol_failure::unrecognized_symbol_failure(char symbol)
        : structure_failure((std::string) "Bracket type not recognised: '" +
                            symbol + "'"),
          symbol_(symbol),
          position_(0) {}

    insufficient_bracket_classes_failure::insufficient_bracket_classes_failure(
        size_type classes)
        : structure_failure("Insufficient bracket types: structure needs more "
                            "than " +
                            std::to_string(classes) + " bracket classes.") {}

    invalid_pairing_failure::invalid_pairing_failure(size_type position)
        : structure_failure("Invalid pairing partner at site " +
                            std::to_string(position)),
          position_(position) {}

    unequal_length_failure::unequal_length_failure(size_type length1,
                                                   size_type length2)
        : structure_failure("Secondary structures must be the same length (" +
                            std::to_string(length1) + " vs. " +
                            std::to_string(length2) + ")."),
          length1_(length1),
          length2_(length2) {}

    premature_closure_failure::premature_closure_failure(size_type position)
        : structure_failure("All paired sites to the left of site " +
                            std::to_string(position) +
                            " have already been consumed."),
          position_(position) {}

    unconsumed_openings_failure::unconsumed_openings_failure(size_type count)
        : structure_failure(std::to_string(count) +
                            " paired site(s) have not been consumed."),
          count_(count) {}

} // end namespace RnaSS
