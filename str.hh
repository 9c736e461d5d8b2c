#ifndef STR_HH
#define STR_HH

#include <string>
#include <vector>
#include <stdio.h>

/** Functions for handling strings of the Standard Template Library. */
namespace str {

  /** Format a string.
   * \param size = maximum size of the resulting string (cut rest)
   * \param fmt = the format string as in standard printf()
   * \return the formatted string
   */
  std::string fmt(size_t size, const char *fmt, ...);

  /** Read a line from a file.
   * \param str = the string to read to
   * \param file = the file to read from
   * \param do_chomp = remove the trailing newline
   * \return false if no more lines in the file
   */
  bool read_line(std::string *str, FILE *file = stdin, bool do_chomp = false);

  /** Remove leading and trailing characters from a string. */
  void clean(std::string *str, const char *chars);

  /** Return a copy of a string with ASCII upper case letters
   * converted to lower case. */
  std::string lowered(const std::string &str);

  /** Split a string to fields.  If \c num_fields is positive, the
   * last field gets the rest of the string as such.
   *
   * \param str = the string to be splitted
   * \param delims = the delimiter characters
   * \param group = group subsequent delimiters as one delimeter
   * \param fields = the vector containing the resulting fields
   * \param num_fields = the maximum number of fields to return
   */
  void
  split(const std::string *str, const char *delims, bool group,
	std::vector<std::string> *fields, int num_fields = 0);

  /** Convert a decimal string to a long.
   * \param ok = set to false if the whole string could not be
   * converted or the value is out of range, otherwise not changed
   */
  long str2long(const std::string *str, bool *ok);
};

#endif /* STR_HH */
