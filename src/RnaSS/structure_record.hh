#ifndef RNASS_STRUCTURE_RECORD_HH
#define RNASS_STRUCTURE_RECORD_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iosfwd>
#include <string>

#include "paired_sites.hh"
#include "bracket_alphabet.hh"

namespace RnaSS {

    /**
     * \brief Named RNA sequence with secondary structure
     *
     * Bundles a name, a nucleotide sequence and a paired sites
     * array. The record does not enforce that sequence and structure
     * have the same length; readers and writers of structure files
     * check this where they need it.
     */
    class StructureRecord {
    public:
        //! placeholder for sequences that are not known
        static const char default_nucleotide = 'N';

        /**
         * \brief construct empty
         */
        StructureRecord() : name_(), sequence_(), paired_() {}

        /**
         * \brief construct from paired sites
         *
         * @param paired paired sites array
         *
         * The name is empty and the sequence consists of
         * default_nucleotide only.
         */
        explicit StructureRecord(const PairedSites &paired);

        /**
         * \brief construct from bracket string
         *
         * @param structure extended dot-bracket string
         * @param alphabet bracket alphabet
         *
         * The name is empty and the sequence consists of
         * default_nucleotide only.
         *
         * @throw structure_failure if the string cannot be decoded
         */
        explicit StructureRecord(
            const std::string &structure,
            const BracketAlphabet &alphabet = BracketAlphabet::standard());

        /**
         * \brief construct from all fields
         *
         * @param name name of the record
         * @param sequence nucleotide sequence
         * @param paired paired sites array
         */
        StructureRecord(const std::string &name,
                        const std::string &sequence,
                        const PairedSites &paired)
            : name_(name), sequence_(sequence), paired_(paired) {}

        //! name of the record
        const std::string &
        name() const {
            return name_;
        }

        //! nucleotide sequence
        const std::string &
        sequence() const {
            return sequence_;
        }

        //! read-only access to the paired sites
        const PairedSites &
        paired() const {
            return paired_;
        }

        //! number of sites of the structure
        size_type
        length() const {
            return paired_.size();
        }

        //! set name
        void
        set_name(const std::string &name) {
            name_ = name;
        }

        //! set nucleotide sequence
        void
        set_sequence(const std::string &sequence) {
            sequence_ = sequence;
        }

        //! set paired sites
        void
        set_paired(const PairedSites &paired) {
            paired_ = paired;
        }

        /**
         * \brief convert to extended dot-bracket string
         * @param alphabet bracket alphabet
         * @return bracket string
         * @throw structure_failure, see encode()
         */
        std::string
        dot_bracket_string(
            const BracketAlphabet &alphabet = BracketAlphabet::standard()) const;

        //! whether the structure contains crossing base pairs, see is_pseudoknotted()
        bool
        is_pseudoknotted() const;

        /**
         * @brief mountain distance to another record
         * @param other record of the same length
         * @param p exponent
         * @return distance of the structures
         */
        double
        mountain_distance(const StructureRecord &other, double p = 1.0) const;

        /**
         * @brief normalised mountain distance to another record
         * @param other record of the same length
         * @param p exponent
         * @return normalised distance of the structures
         */
        double
        normalised_mountain_distance(const StructureRecord &other,
                                     double p = 1.0) const;

        /**
         * @brief display form
         *
         * @return ">name", sequence and bracket string on three lines
         * (without final newline)
         */
        std::string
        to_string() const;

        /**
         * @brief equality
         * @param other record
         * @return whether all fields agree
         */
        bool
        operator==(const StructureRecord &other) const {
            return name_ == other.name_ && sequence_ == other.sequence_ &&
                paired_ == other.paired_;
        }

    private:
        std::string name_;
        std::string sequence_;
        PairedSites paired_;
    };

    /**
     * @brief Output operator writing the display form
     *
     * @param out output stream
     * @param record structure record
     *
     * @return output stream
     */
    std::ostream &
    operator<<(std::ostream &out, const StructureRecord &record);

} // end namespace RnaSS

#endif // RNASS_STRUCTURE_RECORD_HH
