//
// Compute mountain distances between RNA secondary structures
//
// Either compare two structures given as extended dot-bracket strings
// or all pairs of records of a file in dot-bracket notation.
//

#include <stdlib.h>

#include <iostream>
#include <string>

#include "RnaSS/aux.hh"
#include "RnaSS/structure_failure.hh"
#include "RnaSS/structure_record.hh"
#include "RnaSS/structure_io.hh"
#include "RnaSS/mountain_metric.hh"

using namespace std;
using namespace RnaSS;

// ------------------------------------------------------------
//
// Options
//
#include "RnaSS/options.hh"

const std::string VERSION_STRING = (std::string)PACKAGE_STRING;

struct distance_clp {
    bool help;
    bool version;
    bool verbose;

    double exponent; // exponent p of the mountain distance
    bool weighted;
    bool normalised;
    bool bp_distance;

    bool opt_file;
    string filename; // dbn file for all-pairs comparison

    bool opt_structure1;
    string structure1;
    bool opt_structure2;
    string structure2;
};

distance_clp clp;

option_def my_options[] =
    {{"", 0, 0, O_SECTION, 0, O_NODEFAULT, "", "General"},
     {"help", 'h', &clp.help, O_NO_ARG, 0, O_NODEFAULT, "", "This help"},
     {"version", 'V', &clp.version, O_NO_ARG, 0, O_NODEFAULT, "", "Version info"},
     {"verbose", 'v', &clp.verbose, O_NO_ARG, 0, O_NODEFAULT, "", "Verbose"},

     {"", 0, 0, O_SECTION, 0, O_NODEFAULT, "", "Metric"},
     {"exponent", 'p', 0, O_ARG_DOUBLE, &clp.exponent, "1.0", "float",
      "Exponent of the mountain distance (ignored for weighted distances)"},
     {"weighted", 'w', &clp.weighted, O_NO_ARG, 0, O_NODEFAULT, "",
      "Weight steps by the span of their base pair"},
     {"normalised", 'n', &clp.normalised, O_NO_ARG, 0, O_NODEFAULT, "",
      "Normalise by the diameter"},
     {"bp-distance", 'b', &clp.bp_distance, O_NO_ARG, 0, O_NODEFAULT, "",
      "Report base pair distance as well"},

     {"", 0, 0, O_SECTION, 0, O_NODEFAULT, "", "Input"},
     {"file", 'f', &clp.opt_file, O_ARG_STRING, &clp.filename, O_NODEFAULT,
      "dbn-file", "Compare all pairs of records of this file"},
     {"", 0, &clp.opt_structure1, O_ARG_STRING, &clp.structure1, O_NODEFAULT,
      "structure1", "First structure"},
     {"", 0, &clp.opt_structure2, O_ARG_STRING, &clp.structure2, O_NODEFAULT,
      "structure2", "Second structure"},
     {"", 0, 0, 0, 0, O_NODEFAULT, "", ""}};

// END Options
// ------------------------------------------------------------

//! distance as selected on the command line
double
selected_distance(const PairedSites &paired1, const PairedSites &paired2) {
    if (clp.weighted) {
        return clp.normalised
            ? normalised_weighted_mountain_distance(paired1, paired2)
            : weighted_mountain_distance(paired1, paired2);
    }
    return clp.normalised
        ? normalised_mountain_distance(paired1, paired2, clp.exponent)
        : mountain_distance(paired1, paired2, clp.exponent);
}

//! compare two structures given as strings and report all values
void
compare_two(const StructureRecord &record1, const StructureRecord &record2) {
    const PairedSites &paired1 = record1.paired();
    const PairedSites &paired2 = record2.paired();

    if (clp.weighted) {
        cout << "weighted mountain distance: "
             << weighted_mountain_distance(paired1, paired2) << endl;
        cout << "weighted mountain diameter: "
             << weighted_mountain_diameter(paired1.size()) << endl;
        cout << "normalised weighted mountain distance: "
             << normalised_weighted_mountain_distance(paired1, paired2) << endl;
    } else {
        cout << "mountain distance: "
             << mountain_distance(paired1, paired2, clp.exponent) << endl;
        cout << "mountain diameter: "
             << mountain_diameter(paired1.size(), clp.exponent) << endl;
        cout << "normalised mountain distance: "
             << normalised_mountain_distance(paired1, paired2, clp.exponent)
             << endl;
    }
    if (clp.bp_distance) {
        cout << "base pair distance: " << base_pair_distance(paired1, paired2)
             << endl;
    }
}

//! compare all pairs of records, one line per pair
void
compare_all(const records_t &records) {
    for (size_type i = 0; i < records.size(); i++) {
        for (size_type j = i + 1; j < records.size(); j++) {
            const PairedSites &paired1 = records[i].paired();
            const PairedSites &paired2 = records[j].paired();
            cout << records[i].name() << "\t" << records[j].name() << "\t";
            try {
                double d = selected_distance(paired1, paired2);
                cout << d;
                if (clp.bp_distance) {
                    cout << "\t" << base_pair_distance(paired1, paired2);
                }
                cout << endl;
            } catch (unequal_length_failure &f) {
                cout << "NA" << endl;
                if (clp.verbose) {
                    std::cerr << "WARNING: " << f.what() << std::endl;
                }
            }
        }
    }
}

int
main(int argc, char **argv) {
    // ------------------------------------------------------------
    // Process options
    //
    bool process_success = process_options(argc, argv, my_options);

    if (clp.help) {
        cout << "rnass_distance - Mountain distances of RNA secondary "
             << "structures." << endl
             << endl;

        print_help(argv[0], my_options);
        return 0;
    }

    if (clp.version || clp.verbose) {
        cout << "rnass_distance (" << VERSION_STRING << ")" << endl;
        if (clp.version)
            return 0;
        else
            cout << endl;
    }

    if (process_success && !clp.opt_file &&
        !(clp.opt_structure1 && clp.opt_structure2)) {
        O_error_msg = "Specify two structures or a file.";
        process_success = false;
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

    try {
        if (clp.opt_file) {
            records_t records;
            size_type skipped = read_structure_file(clp.filename,
                                                    StructureFormat::DBN,
                                                    records);
            if (clp.verbose) {
                cout << "Read " << records.size() << " records, skipped "
                     << skipped << "." << endl;
            }
            compare_all(records);
        } else {
            StructureRecord record1(clp.structure1);
            StructureRecord record2(clp.structure2);
            compare_two(record1, record2);
        }
    } catch (failure &f) {
        std::cerr << "ERROR --- " << f.what() << std::endl;
        return -1;
    }

    return 0;
}
