#include "structure_io.hh"
#include "structure_codec.hh"
#include "structure_failure.hh"

#include <fstream>
#include <sstream>

namespace RnaSS {

    StructureFormat::type
    StructureFormat::from_string(const std::string &name) {
        if (name == "dbn") {
            return DBN;
        } else if (name == "ct") {
            return CT;
        } else if (name == "stockholm" || name == "sto") {
            return STOCKHOLM;
        }
        throw wrong_format_failure("Unknown structure format '" + name + "'.");
    }

    namespace {
        void
        report_skipped(std::ostream &log,
                       const std::string &name,
                       const std::string &reason) {
            log << "WARNING: skip record '" << name << "': " << reason
                << std::endl;
        }
    }

    // ------------------------------------------------------------
    // dot-bracket notation

    void
    write_dbn(std::ostream &out, const StructureRecord &record) {
        out << record << std::endl;
    }

    void
    write_dbn(std::ostream &out, const records_t &records) {
        for (const auto &record : records) {
            write_dbn(out, record);
        }
    }

    StructureRecord
    parse_dbn_record(const std::string &name,
                     const std::vector<std::string> &lines) {
        if (lines.size() < 1 || lines.size() > 2) {
            throw syntax_error_failure(
                "Expected sequence and structure line for record '" + name +
                "'.");
        }

        // the structure is the first field of the last line; further
        // fields (like energies) are ignored
        std::vector<std::string> fields = split_at_whitespace(lines.back());
        const std::string structure = fields.empty() ? "" : fields[0];

        StructureRecord record(structure);
        record.set_name(name);

        if (lines.size() == 2) {
            const std::string sequence = trim(lines[0]);
            if (sequence.length() != structure.length()) {
                throw syntax_error_failure(
                    "Sequence and structure of record '" + name +
                    "' differ in length.");
            }
            record.set_sequence(sequence);
        }
        return record;
    }

    size_type
    read_dbn(std::istream &in, records_t &records, std::ostream &log) {
        size_type skipped = 0;

        std::string name;
        std::vector<std::string> lines;
        bool in_record = false;

        auto flush = [&]() {
            if (!in_record && lines.empty())
                return;
            try {
                records.push_back(parse_dbn_record(name, lines));
            } catch (failure &f) {
                report_skipped(log, name, f.what());
                skipped++;
            }
        };

        std::string line;
        while (get_nonempty_line(in, line)) {
            if (line[0] == '>') {
                flush();
                name = trim(line.substr(1));
                lines.clear();
                in_record = true;
            } else {
                lines.push_back(trim(line));
            }
        }
        flush();

        return skipped;
    }

    // ------------------------------------------------------------
    // connect format

    std::string
    ct_string(const StructureRecord &record) {
        const std::string &sequence = record.sequence();
        const PairedSites &paired = record.paired();

        if (sequence.length() != paired.size()) {
            throw failure("Cannot write record '" + record.name() +
                          "' in connect format: sequence and structure differ "
                          "in length.");
        }

        std::ostringstream out;
        out << ">" << record.name() << "\n";
        for (size_type i = 0; i < paired.size(); i++) {
            out << (i + 1) << "\t" << sequence[i] << "\t" << i << "\t"
                << (i + 2) << "\t" << paired[i] << "\t" << (i + 1) << "\n";
        }
        return out.str();
    }

    void
    write_ct(std::ostream &out, const StructureRecord &record) {
        out << ct_string(record);
    }

    void
    write_ct(std::ostream &out, const records_t &records) {
        for (const auto &record : records) {
            write_ct(out, record);
        }
    }

    namespace {
        /**
         * @brief Parse a site line of a CT file
         *
         * @param fields white space separated fields of the line
         * @param[out] index site index
         * @param[out] base nucleotide
         * @param[out] partner partner index
         *
         * @return whether the fields form a site line
         */
        bool
        parse_ct_site(const std::vector<std::string> &fields,
                      long &index,
                      std::string &base,
                      long &partner) {
            long dummy;
            if (fields.size() < 6 || !parse_index(fields[0], index) ||
                !parse_index(fields[4], partner) ||
                !parse_index(fields[5], dummy)) {
                return false;
            }
            base = fields[1];
            return true;
        }
    }

    size_type
    read_ct(std::istream &in, records_t &records, std::ostream &log) {
        size_type skipped = 0;

        std::string name;
        std::string sequence;
        PairedSites paired;
        bool consecutive = true;

        auto flush = [&]() {
            if (paired.empty())
                return;
            if (!consecutive) {
                report_skipped(log, name, "site indices are not consecutive.");
                skipped++;
            } else if (!paired.is_symmetric()) {
                report_skipped(log, name, "pairing is not symmetric.");
                skipped++;
            } else {
                records.push_back(StructureRecord(name, sequence, paired));
            }
            sequence.clear();
            paired.clear();
            consecutive = true;
        };

        std::string line;
        while (get_nonempty_line(in, line)) {
            line = trim(line);
            std::vector<std::string> fields = split_at_whitespace(line);

            long index;
            long partner;
            std::string base;

            if (line[0] == '>') {
                flush();
                name = trim(line.substr(1));
            } else if (parse_ct_site(fields, index, base, partner)) {
                if (index != static_cast<long>(paired.size() + 1)) {
                    consecutive = false;
                }
                sequence += base;
                paired.push_back(partner);
            } else if (parse_index(fields[0], index)) {
                // conventional header "length name"
                flush();
                name = trim(line.substr(fields[0].length()));
            }
        }
        flush();

        return skipped;
    }

    // ------------------------------------------------------------
    // Rfam Stockholm

    std::string
    wuss_to_dot_bracket(const std::string &wuss) {
        const std::string unpaired_symbols = ",:_-~;";
        std::string s = wuss;
        for (auto &c : s) {
            if (unpaired_symbols.find(c) != std::string::npos) {
                c = '.';
            }
        }
        return s;
    }

    size_type
    read_rfam_stockholm(std::istream &in, records_t &records, std::ostream &log) {
        const std::string start_record_tag = "# STOCKHOLM";
        const std::string accession_tag = "#=GF AC";
        const std::string id_tag = "#=GF ID";
        const std::string structure_tag = "#=GC SS_cons";
        const std::string consensus_tag = "#=GC RF";
        const std::string end_record_tag = "//";

        size_type skipped = 0;

        std::string accession;
        std::string id;
        std::string structure;
        std::string consensus;

        std::string line;
        while (std::getline(in, line)) {
            if (has_prefix(line, start_record_tag)) {
                accession.clear();
                id.clear();
                structure.clear();
                consensus.clear();
            } else if (has_prefix(line, accession_tag)) {
                accession = trim(line.substr(accession_tag.length()));
            } else if (has_prefix(line, id_tag)) {
                id = trim(line.substr(id_tag.length()));
            } else if (has_prefix(line, consensus_tag)) {
                // interleaved files repeat the tag per block
                consensus += trim(line.substr(consensus_tag.length()));
            } else if (has_prefix(line, structure_tag)) {
                structure += trim(line.substr(structure_tag.length()));
            } else if (has_prefix(line, end_record_tag)) {
                const std::string name = accession.empty() ? id : accession;
                if (!name.empty() && !structure.empty() && !consensus.empty()) {
                    if (consensus.length() != structure.length()) {
                        report_skipped(log, name,
                                       "consensus sequence and structure "
                                       "differ in length.");
                        skipped++;
                    } else {
                        try {
                            StructureRecord record(
                                wuss_to_dot_bracket(structure));
                            record.set_name(name);
                            record.set_sequence(consensus);
                            records.push_back(record);
                        } catch (structure_failure &f) {
                            report_skipped(log, name, f.what());
                            skipped++;
                        }
                    }
                }
                accession.clear();
                id.clear();
                structure.clear();
                consensus.clear();
            }
        }

        return skipped;
    }

    // ------------------------------------------------------------
    // files

    size_type
    read_structure_file(const std::string &filename,
                        StructureFormat::type format,
                        records_t &records,
                        std::ostream &log) {
        std::ifstream in(filename.c_str());
        if (!in.is_open()) {
            throw failure("Cannot open file " + filename + " for reading.");
        }

        switch (format) {
        case StructureFormat::DBN:
            return read_dbn(in, records, log);
        case StructureFormat::CT:
            return read_ct(in, records, log);
        case StructureFormat::STOCKHOLM:
            return read_rfam_stockholm(in, records, log);
        }
        throw failure("Unknown format.");
    }

    void
    write_structure_file(const std::string &filename,
                         StructureFormat::type format,
                         const records_t &records) {
        if (format == StructureFormat::STOCKHOLM) {
            throw failure("Writing Stockholm files is not supported.");
        }

        std::ofstream out(filename.c_str(), std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw failure("Cannot open file " + filename + " for writing.");
        }

        if (format == StructureFormat::DBN) {
            write_dbn(out, records);
        } else {
            write_ct(out, records);
        }

        if (!out.good()) {
            throw failure("Error while writing file " + filename + ".");
        }
    }

} // end namespace RnaSS
