#ifndef RNASS_STRUCTURE_FAILURE_HH
#define RNASS_STRUCTURE_FAILURE_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <string>

#include "aux.hh"

namespace RnaSS {

    /**
     * @brief Base of all failures on malformed structures
     *
     * Thrown by the structure codec, the pseudoknot classifier and
     * the metrics. Catch a derived type to distinguish the kind of
     * failure.
     */
    struct structure_failure : public failure {
        /**
         * @brief Construct with message string
         * @param msg message string
         */
        explicit structure_failure(const std::string &msg) : failure(msg) {}
    };

    /**
     * @brief Common data of bracket matching failures
     */
    class bracket_failure : public structure_failure {
        size_type bracket_class_;
        char left_;
        char right_;
        size_type position_;

    protected:
        /**
         * @brief Construct
         *
         * @param msg message string
         * @param bracket_class class index of the bracket
         * @param left left symbol of the class
         * @param right right symbol of the class
         * @param position 1-based position in the bracket string
         */
        bracket_failure(const std::string &msg,
                        size_type bracket_class,
                        char left,
                        char right,
                        size_type position)
            : structure_failure(msg),
              bracket_class_(bracket_class),
              left_(left),
              right_(right),
              position_(position) {}

    public:
        //! class index of the offending bracket
        size_type
        bracket_class() const {
            return bracket_class_;
        }

        //! left symbol of the offending bracket class
        char
        left() const {
            return left_;
        }

        //! right symbol of the offending bracket class
        char
        right() const {
            return right_;
        }

        //! 1-based position of the offending bracket
        size_type
        position() const {
            return position_;
        }
    };

    /**
     * @brief Right bracket without pending left bracket of its class
     */
    struct unmatched_closing_bracket_failure : public bracket_failure {
        /**
         * @brief Construct
         *
         * @param bracket_class class index of the bracket
         * @param left left symbol of the class
         * @param right right symbol (found in the string)
         * @param position 1-based position of the right bracket
         */
        unmatched_closing_bracket_failure(size_type bracket_class,
                                          char left,
                                          char right,
                                          size_type position);
    };

    /**
     * @brief Left bracket that is never closed
     */
    struct unmatched_opening_bracket_failure : public bracket_failure {
        /**
         * @brief Construct
         *
         * @param bracket_class class index of the bracket
         * @param left left symbol (found in the string)
         * @param right right symbol of the class
         * @param position 1-based position of the left bracket
         */
        unmatched_opening_bracket_failure(size_type bracket_class,
                                          char left,
                                          char right,
                                          size_type position);
    };

    /**
     * @brief Symbol that is neither bracket nor unpaired symbol
     */
    class unrecognized_symbol_failure : public structure_failure {
        char symbol_;
        size_type position_;

    public:
        /**
         * @brief Construct
         * @param symbol the unknown symbol
         * @param position its 1-based position
         */
        unrecognized_symbol_failure(char symbol, size_type position);

        /**
         * @brief Construct for a symbol that was not read from a string
         * @param symbol the unknown symbol
         */
        explicit unrecognized_symbol_failure(char symbol);

        //! the unknown symbol
        char
        symbol() const {
            return symbol_;
        }

        //! whether the symbol was read at a position of a string
        bool
        has_position() const {
            return position_ != 0;
        }

        //! 1-based position of the symbol; 0 if has_position() is false
        size_type
        position() const {
            return position_;
        }
    };

    /**
     * @brief The structure needs more bracket classes than available
     */
    struct insufficient_bracket_classes_failure : public structure_failure {
        //! @brief Construct for an alphabet with the given number of classes
        explicit insufficient_bracket_classes_failure(size_type classes);
    };

    /**
     * @brief A paired sites array refers to a partner that cannot pair back
     */
    class invalid_pairing_failure : public structure_failure {
        size_type position_;

    public:
        /**
         * @brief Construct
         * @param position 1-based site with invalid partner
         */
        explicit invalid_pairing_failure(size_type position);

        //! 1-based site with invalid partner
        size_type
        position() const {
            return position_;
        }
    };

    /**
     * @brief Structures of different length were compared
     */
    class unequal_length_failure : public structure_failure {
        size_type length1_;
        size_type length2_;

    public:
        //! @brief Construct with the two lengths
        unequal_length_failure(size_type length1, size_type length2);

        //! length of first structure
        size_type
        length1() const {
            return length1_;
        }

        //! length of second structure
        size_type
        length2() const {
            return length2_;
        }
    };

    /**
     * @brief A closing site was reached while no pair was open
     */
    class premature_closure_failure : public structure_failure {
        size_type position_;

    public:
        //! @brief Construct with 1-based position of the closing site
        explicit premature_closure_failure(size_type position);

        //! 1-based position of the closing site
        size_type
        position() const {
            return position_;
        }
    };

    /**
     * @brief Pairs were still open at the end of the structure
     */
    class unconsumed_openings_failure : public structure_failure {
        size_type count_;

    public:
        //! @brief Construct with number of open pairs
        explicit unconsumed_openings_failure(size_type count);

        //! number of pairs that were never closed
        size_type
        count() const {
            return count_;
        }
    };

} // end namespace RnaSS

#endif // RNASS_STRUCTURE_FAILURE_HH
