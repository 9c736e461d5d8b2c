#ifndef UNITMANAGER_HH
#define UNITMANAGER_HH

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Unit.hh"

namespace prondict {

/** Interns context independent units.
 *
 * The manager owns the units it creates, and the returned pointers
 * stay valid until the manager is destroyed.  Dictionaries sharing one
 * manager share the unit instances, so a phone that appears in both
 * the word and the filler dictionary with the same filler flag is the
 * same unit.
 */
class UnitManager {
public:
  UnitManager();

  /** Returns the unit for (name, filler), creating it on first request.
   * \param name = the unit name as written in the dictionary
   * \param filler = true if the unit comes from a filler dictionary
   */
  const Unit *get_unit(const std::string &name, bool filler);

  /** Returns the unit for (name, filler) or NULL if it has not been
   * interned. */
  const Unit *find_unit(const std::string &name, bool filler) const;

  /** The filler unit "SIL". */
  inline const Unit *silence() const { return m_silence; }

  inline int num_units() const { return m_units.size(); }

  /** Returns the unit with the given base id. */
  inline const Unit *unit(int base_id) const { return m_units.at(base_id).get(); }

private:
  UnitManager(const UnitManager &manager);
  UnitManager &operator=(const UnitManager &manager);

  typedef std::pair<std::string, bool> UnitKey;
  typedef std::map<UnitKey, const Unit*> UnitMap;

  std::vector<std::unique_ptr<Unit> > m_units;
  UnitMap m_unit_map;
  const Unit *m_silence;
};

}

#endif /* UNITMANAGER_HH */
