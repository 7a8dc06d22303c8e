#ifndef RNASS_OPTIONS_HH
#define RNASS_OPTIONS_HH

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

/**
 * @file options.hh
 * @brief options -- an interface for getopt_long
 *
 * Command line options of the tools are described by a table of
 * option_def entries; process_options() fills the variables
 * referenced from the table.
 */

#include <getopt.h>
#include <string>

namespace RnaSS {

/* argument types */
#define O_NO_ARG 0
#define O_ARG_STRING 1
#define O_ARG_INT 2
#define O_ARG_DOUBLE 4
#define O_ARG_BOOL 5
#define O_SECTION -1

#define O_NODEFAULT std::string("__")

    /**
       @brief Definition structure of an option
    */
    typedef struct {
        std::string longname; //!<  long option name
        char shortname;       //!<  short option char
        bool *flag;     //!<  pointer to flag that indicates if option given
        int arg_type;   //!<  type of argument
        void *argument; //!<  pointer to variable that should hold argument, 0
                        //!indicates no arg
        std::string deflt; //!<  default argument, O_NODEFAULT if none
        std::string
            argname; //!< optional name for an argument (shown in usage string)
        std::string description; //!< optional description (shown in help)
    } option_def;

    /*
      Example for option_def array

      bool help;
      double exponent;
      std::string inputfile;

      option_def my_options[] = {
      {"help",'h',&help,O_NO_ARG,0,O_NODEFAULT,"","This help"},
      {"exponent",'p',0,O_ARG_DOUBLE,&exponent,"1.0","float","Exponent"},
      {"",0,0,O_ARG_STRING,&inputfile,O_NODEFAULT,"input-file","File for input"},
      {"",0,0,0,0,O_NODEFAULT,"",""}
      };

      Entries without long and short name define positional
      arguments, in the order of the table. Entries of type O_SECTION
      start a new section in the help output. The last entry must
      have empty long name, no short name and arg_type 0.
    */

    //! error message of the last failing process_options() call
    extern std::string O_error_msg;

    /**
     * @brief process options
     *
     * @param argc argument counter from main()
     * @param argv argument vector from main()
     * @param options array describing the options
     *
     * @return whether all arguments could be decoded and all
     * mandatory arguments are given; otherwise O_error_msg describes
     * the problem
     */
    bool
    process_options(int argc, char *argv[], option_def options[]);

    //! print a usage string
    void
    print_usage(const char *progname, option_def options[]);

    //! print a longer help
    void
    print_help(const char *progname, option_def options[]);

    /**
     * Print all options and their settings to standard out
     *
     * @param options options array
     */
    void
    print_options(option_def options[]);

} // end namespace RnaSS

#endif
