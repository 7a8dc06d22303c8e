/* ***********************************************************
 *
 * options -- an interface for getopt_long
 *
 * ***********************************************************/

#include "options.hh"

#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace RnaSS {

    //! string holding for error message
    std::string O_error_msg;

    namespace {
        //! test for the end marker of the options array
        bool
        is_end(const option_def &opt) {
            return opt.longname == "" && opt.shortname == 0 &&
                opt.arg_type == O_NO_ARG && opt.argument == 0;
        }

        //! number of options before the end marker
        int
        count_opts(option_def *options) {
            int i = 0;
            while (!is_end(options[i])) {
                ++i;
            }
            return i;
        }

        //! test whether option is a positional argument
        bool
        positional(const option_def &opt) {
            return opt.arg_type > O_SECTION && opt.longname == "" &&
                opt.shortname == 0;
        }

        //! test whether option must be given
        bool
        mandatory(const option_def &opt) {
            return opt.arg_type > O_SECTION && opt.argument != 0 &&
                opt.flag == 0 && opt.deflt == O_NODEFAULT;
        }

        /**
         * @brief decode a string according to arg_type
         *
         * @param argument pointer to the variable
         * @param arg_type type of the variable
         * @param optarg string to decode
         *
         * @return success
         */
        bool
        decode_argument(void *argument, int arg_type, const std::string &optarg) {
            std::istringstream in(optarg);
            switch (arg_type) {
            case O_ARG_STRING:
                *static_cast<std::string *>(argument) = optarg;
                return true;
            case O_ARG_INT: {
                int x;
                if (!(in >> x) || !in.eof())
                    return false;
                *static_cast<int *>(argument) = x;
                return true;
            }
            case O_ARG_DOUBLE: {
                double x;
                if (!(in >> x) || !in.eof())
                    return false;
                *static_cast<double *>(argument) = x;
                return true;
            }
            case O_ARG_BOOL:
                if (optarg == "true" || optarg == "on" || optarg == "1") {
                    *static_cast<bool *>(argument) = true;
                    return true;
                }
                if (optarg == "false" || optarg == "off" || optarg == "0") {
                    *static_cast<bool *>(argument) = false;
                    return true;
                }
                return false;
            default:
                return false;
            }
        }

        //! type name of argument as shown in help
        const char *
        arg_type_name(int arg_type) {
            switch (arg_type) {
            case O_ARG_STRING:
                return "text";
            case O_ARG_INT:
                return "integer";
            case O_ARG_DOUBLE:
                return "float";
            case O_ARG_BOOL:
                return "boolean";
            default:
                return "";
            }
        }

        //! option name as shown in usage and help
        std::string
        option_name(const option_def &opt) {
            const std::string argname =
                opt.argname != "" ? opt.argname : arg_type_name(opt.arg_type);

            if (positional(opt)) {
                return "<" + argname + ">";
            }

            std::string s;
            if (opt.shortname) {
                s += "-";
                s += opt.shortname;
                if (opt.longname != "")
                    s += ",";
            }
            if (opt.longname != "") {
                s += "--" + opt.longname;
            }
            if (opt.argument != 0) {
                s += " <" + argname + ">";
            }
            return s;
        }

        //! current value of the variable of an option
        std::string
        option_value(const option_def &opt) {
            std::ostringstream out;
            switch (opt.arg_type) {
            case O_ARG_STRING:
                out << "\"" << *static_cast<std::string *>(opt.argument) << "\"";
                break;
            case O_ARG_INT:
                out << *static_cast<int *>(opt.argument);
                break;
            case O_ARG_DOUBLE:
                out << *static_cast<double *>(opt.argument);
                break;
            case O_ARG_BOOL:
                out << (*static_cast<bool *>(opt.argument) ? "true" : "false");
                break;
            default:
                out << "has unknown type";
            }
            return out.str();
        }
    }

    bool
    process_options(int argc, char *argv[], option_def *options) {
        const int num_opts = count_opts(options);

        std::string short_opts;
        std::vector<struct option> long_opts;
        std::vector<bool> is_set(num_opts, false);

        int index = 0;

        /* generate short options string and long options struct */
        for (int i = 0; i < num_opts; ++i) {
            if (options[i].arg_type <= O_SECTION)
                continue;
            if (options[i].shortname) {
                short_opts += options[i].shortname;
                if (options[i].argument != 0) {
                    short_opts += ':';
                }
            }
            if (options[i].longname != "") {
                struct option opt;
                opt.name = options[i].longname.c_str();
                opt.has_arg =
                    options[i].argument == 0 ? no_argument : required_argument;
                // getopt_long writes the index in options to variable index
                opt.flag = &index;
                opt.val = i;
                long_opts.push_back(opt);
            }
        }
        struct option end_marker = {0, 0, 0, 0};
        long_opts.push_back(end_marker);

        /* clear option flags and set default values */
        for (int i = 0; i < num_opts; ++i) {
            if (options[i].arg_type <= O_SECTION)
                continue;
            if (options[i].flag)
                *(options[i].flag) = false;
            if (options[i].argument != 0 && options[i].deflt != O_NODEFAULT) {
                if (!decode_argument(options[i].argument, options[i].arg_type,
                                     options[i].deflt)) {
                    O_error_msg = "Internal error: cannot parse default of "
                                  "option " +
                        option_name(options[i]);
                    return false;
                }
                is_set[i] = true;
            }
        }

        optind = 1;
        int c;
        int long_index;
        while ((c = getopt_long(argc, argv, short_opts.c_str(), &long_opts[0],
                                &long_index)) != -1) {
            if (c == '?' || c == ':') {
                O_error_msg = "Unknown option or missing argument.";
                return false;
            }

            if (c != 0) {
                /* short option: find its index */
                for (index = 0;
                     index < num_opts && options[index].shortname != c;
                     ++index)
                    ;
                if (index == num_opts) {
                    O_error_msg = "Unknown option.";
                    return false;
                }
            }

            if (options[index].flag)
                *(options[index].flag) = true;
            is_set[index] = true;

            if (options[index].argument != 0) {
                if (!decode_argument(options[index].argument,
                                     options[index].arg_type,
                                     std::string(optarg))) {
                    O_error_msg = "Cannot parse argument of option " +
                        option_name(options[index]);
                    return false;
                }
            }
        }

        /* positional arguments */
        for (int i = 0; i < num_opts; ++i) {
            if (positional(options[i]) && optind < argc) {
                if (options[i].flag)
                    *(options[i].flag) = true;
                if (!decode_argument(options[i].argument, options[i].arg_type,
                                     argv[optind])) {
                    O_error_msg =
                        "Cannot parse argument " + option_name(options[i]);
                    return false;
                }
                is_set[i] = true;
                optind++;
            }
        }

        if (optind != argc) {
            O_error_msg = "Too many arguments.";
            return false;
        }

        /* are mandatory arguments set */
        for (int i = 0; i < num_opts; ++i) {
            if (mandatory(options[i]) && !is_set[i]) {
                O_error_msg = "Mandatory option and/or argument missing: " +
                    option_name(options[i]);
                return false;
            }
        }

        return true;
    }

    void
    print_usage(const char *progname, option_def options[]) {
        const int num_opts = count_opts(options);

        std::cout << "USAGE: " << progname << " [options]";
        for (int i = 0; i < num_opts; ++i) {
            if (positional(options[i])) {
                if (mandatory(options[i])) {
                    std::cout << " " << option_name(options[i]);
                } else {
                    std::cout << " [" << option_name(options[i]) << "]";
                }
            }
        }
        std::cout << std::endl;
    }

    void
    print_help(const char *progname, option_def options[]) {
        const int num_opts = count_opts(options);

        print_usage(progname, options);

        std::cout << std::endl << "Options:" << std::endl;
        for (int i = 0; i < num_opts; ++i) {
            if (options[i].arg_type <= O_SECTION) {
                std::cout << std::endl << options[i].description << ":"
                          << std::endl;
                continue;
            }
            std::cout << "  " << option_name(options[i]) << std::endl
                      << "      " << options[i].description;
            if (options[i].deflt != O_NODEFAULT) {
                std::cout << " (default: " << options[i].deflt << ")";
            }
            std::cout << std::endl;
        }
    }

    void
    print_options(option_def options[]) {
        const int num_opts = count_opts(options);

        for (int i = 0; i < num_opts; ++i) {
            if (options[i].arg_type <= O_SECTION) {
                std::cout << options[i].description << ":" << std::endl;
                continue;
            }
            std::cout << "  " << std::left << std::setw(32)
                      << option_name(options[i]) << " ";
            if (options[i].argument == 0) {
                std::cout << ((options[i].flag && *options[i].flag) ? "ON"
                                                                    : "OFF");
            } else if (options[i].flag == 0 || *options[i].flag) {
                std::cout << "= " << option_value(options[i]);
            } else {
                std::cout << "-";
            }
            std::cout << std::endl;
        }
    }

} // end namespace RnaSS
