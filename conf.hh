#ifndef CONF_HH
#define CONF_HH

#include <vector>
#include <deque>
#include <string>
#include <map>

/** Command line parameters.
 *
 * \li Short options are a hyphen and a character ("-v 2"), and can be
 * grouped after a single hyphen ("-am").
 * \li Long options are two hyphens and a name, with the argument in
 * the next command line argument or after an equal sign
 * ("--verbose 2", "--verbose=2").
 * \li A lone "-" is an ordinary argument, and everything after "--"
 * is an ordinary argument.
 *
 * Errors in the command line throw std::string.
 */
namespace conf {

  /** An option */
  struct Option {
    Option() : short_name(0), needs_argument(false), specified(false) { }
    unsigned char short_name; //!< The short name, 0 for none
    std::string long_name; //!< The long name without the "=ARG" part
    std::string help_name; //!< The long name shown in the help
    std::string value; //!< The default or the parsed value
    bool needs_argument; //!< Does the option need an argument
    bool specified; //!< Has the user specified the option
    std::string help; //!< The help string of the option

    int get_int() const; //!< Return the integer value of the option
    const std::string &get_str() const { return value; }
  };

  /** A class for defining, storing and querying options. */
  class Config {
  public:
    /** Set the usage text printed at the top of the help. */
    Config& operator()(const std::string &usage);

    /** Add a new option.
     * \param short_name = the character used after a hyphen, 0 for none
     * \param long_name = the name used after two hyphens, possibly
     * followed by "=ARG" for the help screen
     * \param type = "arg" if the option needs an argument, otherwise ""
     * \param default_value = the value if the option is not given
     * \param help = the help string of the option
     */
    Config& operator()(unsigned char short_name,
		       const std::string &long_name,
		       const std::string &type = "",
		       const std::string &default_value = "",
		       const std::string &help = "");

    /** Parse command line arguments. */
    void parse(int argc, char *argv[]);

    /** Parse the command line, and print the help and exit if "--help"
     * was given. */
    void default_parse(int argc, char *argv[]);

    /** Returns the usage information */
    std::string help_string() const;

    /** Get an option by its long name. */
    const Option& operator[](const std::string &long_name) const;

    std::vector<std::string> arguments; //!< The non-option arguments

  private:
    /** Mark the option given, or queue it for its argument. */
    void take(int index, std::deque<int> &pending);

    std::string m_usage;
    std::vector<Option> m_options;
    std::map<unsigned char, int> m_short_map;
    std::map<std::string, int> m_long_map;
  };

};

#endif /* CONF_HH */
