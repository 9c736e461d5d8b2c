#ifndef MODULECONFIG_HH
#define MODULECONFIG_HH

#include <map>
#include <vector>
#include <string>
#include <stdio.h>

/** A block of "name value" lines enclosed in braces:
 *
 * \code
 * {
 *   dictionary cmudict.dict
 *   filler_dictionary filler.dict
 *   allow_missing_words 1
 * }
 * \endcode
 *
 * Values are converted on request, and an invalid value throws
 * std::string.
 */
class ModuleConfig {
public:
  /** Sets a value, replacing the previous one. */
  void set(const std::string &name, const std::string &value);

  // Leaves 'value' unchanged if 'name' not defined
  bool get(const std::string &name, int &value) const;
  bool get(const std::string &name, bool &value) const;
  bool get(const std::string &name, std::string &value) const;
  bool get(const std::string &name, std::vector<std::string> &value) const;

  /** Reads a block from file.  Empty lines and lines starting with
   * '#' are skipped. */
  void read(FILE *file);

private:
  const std::string *find(const std::string &name) const;

  std::map<std::string, std::string> m_values;
};

#endif /* MODULECONFIG_HH */
