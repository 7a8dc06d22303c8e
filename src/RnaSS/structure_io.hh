#ifndef RNASS_STRUCTURE_IO_HH
#define RNASS_STRUCTURE_IO_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iostream>
#include <string>
#include <vector>

#include "structure_record.hh"

/**
 * @file structure_io.hh
 *
 * @brief Reading and writing of structure files
 *
 * Supported formats are
 *
 *  - dot-bracket notation (DBN): records in the display form of
 *    StructureRecord, i.e. lines ">name", sequence and structure;
 *    the sequence line may be missing, the structure line may carry
 *    further white space separated fields (e.g. an energy)
 *  - connect format (CT): a header line (">name" or "length name")
 *    followed by one line per site with the fields index, base,
 *    index-1, index+1, partner (0 if unpaired) and index
 *  - Stockholm files of Rfam seed alignments: of each record, only
 *    the accession (#=GF AC, or #=GF ID), the consensus sequence
 *    (#=GC RF) and the consensus structure (#=GC SS_cons) are read
 *
 * Readers of multi-record files skip records that cannot be
 * interpreted. Each skipped record is reported on a log stream and
 * counted; the remaining records are read as usual.
 */

namespace RnaSS {

    //! vector of structure records
    typedef std::vector<StructureRecord> records_t;

    //! @brief File formats of structure files
    class StructureFormat {
    public:
        //! format type
        enum type {
            DBN,      //!< dot-bracket notation
            CT,       //!< connect format
            STOCKHOLM //!< Rfam Stockholm
        };

        /**
         * @brief Format from name
         *
         * @param name one of "dbn", "ct", "stockholm" (or "sto")
         * @return format type
         * @throw wrong_format_failure for unknown names
         */
        static type
        from_string(const std::string &name);
    };

    // ------------------------------------------------------------
    // dot-bracket notation

    /**
     * @brief Write a record in dot-bracket notation
     *
     * @param out output stream
     * @param record structure record
     *
     * @throw structure_failure if the structure cannot be encoded
     */
    void
    write_dbn(std::ostream &out, const StructureRecord &record);

    /**
     * @brief Write records in dot-bracket notation
     */
    void
    write_dbn(std::ostream &out, const records_t &records);

    /**
     * @brief Parse a single dot-bracket record
     *
     * @param name name of the record
     * @param lines the lines after the name: either structure only
     * or sequence and structure
     *
     * @return record
     *
     * @throw structure_failure if the structure cannot be decoded
     * @throw syntax_error_failure for a wrong number of lines or
     * sequence and structure of different length
     */
    StructureRecord
    parse_dbn_record(const std::string &name,
                     const std::vector<std::string> &lines);

    /**
     * @brief Read records in dot-bracket notation
     *
     * @param in input stream
     * @param[out] records read records are appended
     * @param log stream for reporting skipped records
     *
     * @return number of skipped records
     */
    size_type
    read_dbn(std::istream &in, records_t &records, std::ostream &log = std::cerr);

    // ------------------------------------------------------------
    // connect format

    /**
     * @brief Connect format representation of a record
     *
     * @param record structure record
     * @return CT string, terminated by newline
     *
     * @throw failure if sequence and structure have different length
     */
    std::string
    ct_string(const StructureRecord &record);

    //! write a record in connect format
    void
    write_ct(std::ostream &out, const StructureRecord &record);

    //! write records in connect format
    void
    write_ct(std::ostream &out, const records_t &records);

    /**
     * @brief Read records in connect format
     *
     * Records with non-consecutive site indices or non-symmetric
     * pairing are skipped.
     *
     * @param in input stream
     * @param[out] records read records are appended
     * @param log stream for reporting skipped records
     *
     * @return number of skipped records
     */
    size_type
    read_ct(std::istream &in, records_t &records, std::ostream &log = std::cerr);

    // ------------------------------------------------------------
    // Rfam Stockholm

    /**
     * @brief Convert WUSS structure annotation to dot-bracket
     *
     * @param wuss structure annotation
     * @return annotation with all WUSS unpaired symbols ",:_-~;"
     * replaced by '.'
     */
    std::string
    wuss_to_dot_bracket(const std::string &wuss);

    /**
     * @brief Read consensus structures of Rfam Stockholm records
     *
     * Records are terminated by "//". Records without name, reference
     * sequence or consensus structure are ignored without report;
     * records whose reference sequence and consensus structure
     * differ in length, or whose consensus structure cannot be
     * decoded, are skipped.
     *
     * @param in input stream (uncompressed)
     * @param[out] records read records are appended
     * @param log stream for reporting skipped records
     *
     * @return number of skipped records
     */
    size_type
    read_rfam_stockholm(std::istream &in,
                        records_t &records,
                        std::ostream &log = std::cerr);

    // ------------------------------------------------------------
    // files

    /**
     * @brief Read structure file
     *
     * @param filename name of file
     * @param format file format
     * @param[out] records read records are appended
     * @param log stream for reporting skipped records
     *
     * @return number of skipped records
     *
     * @throw failure if the file cannot be opened
     */
    size_type
    read_structure_file(const std::string &filename,
                        StructureFormat::type format,
                        records_t &records,
                        std::ostream &log = std::cerr);

    /**
     * @brief Write structure file
     *
     * @param filename name of file (truncated if it exists)
     * @param format file format; DBN or CT
     * @param records records
     *
     * @throw failure if the file cannot be written or the format is
     * not supported for writing
     */
    void
    write_structure_file(const std::string &filename,
                         StructureFormat::type format,
                         const records_t &records);

} // end namespace RnaSS

#endif // RNASS_STRUCTURE_IO_HH
