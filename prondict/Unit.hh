#ifndef UNIT_HH
#define UNIT_HH

#include <string>

namespace prondict {

/** A context independent phonetic unit.  Units are created only by
 * UnitManager, which keeps exactly one instance for each (name,
 * filler) pair, so units are compared by address.
 */
class Unit {
public:
  /// Name of the silence unit.
  static const char *SILENCE_NAME;

  inline const std::string &name() const { return m_name; }
  inline bool is_filler() const { return m_filler; }

  /// Dense index assigned in the order the units were interned.
  inline int base_id() const { return m_base_id; }

  inline bool is_silence() const
    { return m_filler && m_name == SILENCE_NAME; }

  /// Units of a dictionary never carry left or right context.
  inline bool is_context_dependent() const { return false; }

  inline const std::string &str() const { return m_name; }

private:
  friend class UnitManager;

  Unit(const std::string &name, bool filler, int base_id)
    : m_name(name), m_filler(filler), m_base_id(base_id) { }
  Unit(const Unit &unit);
  Unit &operator=(const Unit &unit);

  std::string m_name;
  bool m_filler;
  int m_base_id;
};

}

#endif /* UNIT_HH */
