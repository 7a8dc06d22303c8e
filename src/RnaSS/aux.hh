#ifndef RNASS_AUX_HH
#define RNASS_AUX_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iosfwd>
#include <exception>
#include <string>
#include <vector>
#include <utility>
#include <set>

//!
//! auxilliary functions and classes for use in RnaSS
//!

namespace RnaSS {

    //! general size type
    typedef size_t size_type;

    //! @brief type of an entry of a paired sites array
    //!
    //! Entries are 1-based partner positions or 0 (unpaired)
    typedef long site_t;

    //! base pair type (1-based positions i<j)
    typedef std::pair<size_type, size_type> bp_t;

    //! base pair set type
    typedef std::set<bp_t> bps_t;

    //! Simple exception class that supports a text message
    class failure : public std::exception {
        //! message that is reported by what
        std::string msg_;

    public:
        /**
         * @brief Construct with message
         *
         * @param msg the message
         */
        explicit failure(const std::string &msg)
            : std::exception(), msg_(msg){};

        /**
         * @brief Construct empty
         */
        explicit failure() : std::exception(), msg_(){};

        //! Destruct
        virtual ~failure();

        /** @brief Provide message string
         * @return message
         */
        virtual const char *
        what() const noexcept;
    };

    /**
     * @brief thrown, when reading data that is not in the supposed format
     */
    struct wrong_format_failure : public failure {
        wrong_format_failure() : failure("Wrong format") {}

        //! @brief Construct with message string
        explicit wrong_format_failure(const std::string &msg)
            : failure("Wrong format: " + msg) {}
    };

    /**
     * @brief thrown, when the format is recognized but syntax is incorrect
     */
    struct syntax_error_failure : public failure {
        //! @brief empty constructor
        syntax_error_failure() : failure("Syntax error") {}

        /**
         * @brief Construct with message string
         *
         * @param msg message string
         */
        explicit syntax_error_failure(const std::string &msg)
            : failure("Syntax error: " + msg) {}
    };

    // ------------------------------------------------------------
    // transformation of strings

    /**
     * @brief Remove leading and trailing white space
     *
     * @param s string
     * @return s without surrounding blanks, tabs and line ends
     */
    std::string
    trim(const std::string &s);

    /**
     * @brief Tokenize string at white space
     *
     * @param s string
     * @return vector of non-empty tokens
     */
    std::vector<std::string>
    split_at_whitespace(const std::string &s);

    /**
     * @brief Test string prefix
     *
     * @param s string
     * @param p prefix
     * @param start optional start position
     *
     * @return whether s has prefix p (after dropping the first start
     * characters from s)
     */
    bool
    has_prefix(const std::string &s, const std::string &p, size_t start = 0);

    /**
     * @brief Parse a non-negative integer
     *
     * @param s string
     * @param[out] x parsed value
     *
     * @return whether s consists of decimal digits only (and fits into x)
     */
    bool
    parse_index(const std::string &s, long &x);

    /**
     * @brief Get next non-empty line
     *
     * @param in input stream
     * @param[out] line line without trailing white space
     *
     * Lines that are empty or consist of white space only are
     * skipped.
     *
     * @note on failure, sets line to empty
     *
     * @return success
     */
    bool
    get_nonempty_line(std::istream &in, std::string &line);

}

#endif
