//
// Convert secondary structure files between dot-bracket notation,
// connect format and Rfam Stockholm (reading only). Optionally
// remove pseudoknots or report pseudoknot information.
//

#include <stdlib.h>

#include <iostream>
#include <fstream>
#include <string>

#include "RnaSS/aux.hh"
#include "RnaSS/structure_failure.hh"
#include "RnaSS/structure_record.hh"
#include "RnaSS/structure_codec.hh"
#include "RnaSS/structure_io.hh"
#include "RnaSS/vienna_interop.hh"

using namespace std;
using namespace RnaSS;

// ------------------------------------------------------------
//
// Options
//
#include "RnaSS/options.hh"

const std::string VERSION_STRING = (std::string)PACKAGE_STRING;

struct convert_clp {
    bool help;
    bool version;
    bool verbose;

    string informat;  // format of input
    string outformat; // format of output

    bool opt_output;
    string output_filename;

    bool remove_pk;
    bool pk_info;

    string input_filename; // input file, "-" for stdin
};

convert_clp clp;

option_def my_options[] =
    {{"", 0, 0, O_SECTION, 0, O_NODEFAULT, "", "General"},
     {"help", 'h', &clp.help, O_NO_ARG, 0, O_NODEFAULT, "", "This help"},
     {"version", 'V', &clp.version, O_NO_ARG, 0, O_NODEFAULT, "", "Version info"},
     {"verbose", 'v', &clp.verbose, O_NO_ARG, 0, O_NODEFAULT, "", "Verbose"},

     {"", 0, 0, O_SECTION, 0, O_NODEFAULT, "", "Formats"},
     {"informat", 'i', 0, O_ARG_STRING, &clp.informat, "dbn", "format",
      "Input format: dbn, ct or stockholm"},
     {"outformat", 'f', 0, O_ARG_STRING, &clp.outformat, "dbn", "format",
      "Output format: dbn or ct"},
     {"output", 'o', &clp.opt_output, O_ARG_STRING, &clp.output_filename,
      O_NODEFAULT, "file", "Output file (default: standard out)"},

     {"", 0, 0, O_SECTION, 0, O_NODEFAULT, "", "Structures"},
     {"remove-pk", 'r', &clp.remove_pk, O_NO_ARG, 0, O_NODEFAULT, "",
      "Remove pseudoknots before writing"},
     {"pk-info", 'k', &clp.pk_info, O_NO_ARG, 0, O_NODEFAULT, "",
      "Report length, base pairs, pseudoknots and bracket classes per record "
      "instead of converting"},

     {"", 0, 0, O_ARG_STRING, &clp.input_filename, "-", "input-file",
      "Input file (default: standard in)"},
     {"", 0, 0, 0, 0, O_NODEFAULT, "", ""}};

// END Options
// ------------------------------------------------------------

//! print pseudoknot information of a record
void
write_pk_info(ostream &out, const StructureRecord &record) {
    out << record.name() << "\t" << record.length() << "\t"
        << record.paired().num_base_pairs() << "\t"
        << (record.is_pseudoknotted() ? "pseudoknotted" : "nested") << "\t"
        << bracket_classes_needed(record.paired()) << endl;
}

int
main(int argc, char **argv) {
    // ------------------------------------------------------------
    // Process options
    //
    bool process_success = process_options(argc, argv, my_options);

    if (clp.help) {
        cout << "rnass_convert - Convert RNA secondary structure files."
             << endl
             << endl;

        print_help(argv[0], my_options);
        return 0;
    }

    if (clp.version || clp.verbose) {
        cout << "rnass_convert (" << VERSION_STRING << ")" << endl;
        if (clp.version)
            return 0;
        else
            cout << endl;
    }

    if (!process_success) {
        std::cerr << "ERROR --- " << O_error_msg << std::endl;
        print_usage(argv[0], my_options);
        return -1;
    }

    if (clp.verbose) {
        print_options(my_options);
    }
    //
    // end option processing
    /// ----------------------------------------

    StructureFormat::type informat;
    StructureFormat::type outformat;
    try {
        informat = StructureFormat::from_string(clp.informat);
        outformat = StructureFormat::from_string(clp.outformat);
    } catch (failure &f) {
        std::cerr << "ERROR --- " << f.what() << std::endl;
        return -1;
    }
    if (outformat == StructureFormat::STOCKHOLM) {
        std::cerr << "ERROR --- Stockholm is supported only as input format."
                  << std::endl;
        return -1;
    }

    // ----------------------------------------
    // read records
    //
    records_t records;
    size_type skipped;
    try {
        if (clp.input_filename == "-") {
            if (informat == StructureFormat::DBN) {
                skipped = read_dbn(std::cin, records);
            } else if (informat == StructureFormat::CT) {
                skipped = read_ct(std::cin, records);
            } else {
                skipped = read_rfam_stockholm(std::cin, records);
            }
        } else {
            skipped = read_structure_file(clp.input_filename, informat, records);
        }
    } catch (failure &f) {
        std::cerr << "ERROR --- " << f.what() << std::endl;
        return -1;
    }

    if (clp.verbose) {
        cout << "Read " << records.size() << " records";
        if (skipped > 0) {
            cout << ", skipped " << skipped;
        }
        cout << "." << endl;
    }

    // ----------------------------------------
    // write records
    //
    ofstream outfile;
    if (clp.opt_output) {
        outfile.open(clp.output_filename.c_str());
        if (!outfile.is_open()) {
            std::cerr << "ERROR --- Cannot open file " << clp.output_filename
                      << " for writing." << std::endl;
            return -1;
        }
    }
    ostream &out = clp.opt_output ? outfile : cout;

    size_type failed = 0;
    for (auto &record : records) {
        try {
            if (clp.remove_pk && record.is_pseudoknotted()) {
                if (clp.verbose) {
                    cout << "Remove pseudoknots of " << record.name() << endl;
                }
                record.set_paired(remove_pseudoknots(record.paired()));
            }

            if (clp.pk_info) {
                write_pk_info(out, record);
            } else if (outformat == StructureFormat::DBN) {
                write_dbn(out, record);
            } else {
                write_ct(out, record);
            }
        } catch (failure &f) {
            std::cerr << "ERROR --- record '" << record.name()
                      << "': " << f.what() << std::endl;
            failed++;
        }
    }

    return failed > 0 ? 1 : 0;
}
