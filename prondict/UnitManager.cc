#include <cstddef>  // NULL
#include "UnitManager.hh"

namespace prondict {

const char *Unit::SILENCE_NAME = "SIL";

UnitManager::UnitManager()
  : m_silence(NULL)
{
  m_silence = get_unit(Unit::SILENCE_NAME, true);
}

const Unit*
UnitManager::get_unit(const std::string &name, bool filler)
{
  UnitMap::iterator it = m_unit_map.find(UnitKey(name, filler));
  if (it != m_unit_map.end())
    return it->second;

  m_units.push_back(std::unique_ptr<Unit>(
                      new Unit(name, filler, (int)m_units.size())));
  const Unit *unit = m_units.back().get();
  m_unit_map.insert(UnitMap::value_type(UnitKey(name, filler), unit));
  return unit;
}

const Unit*
UnitManager::find_unit(const std::string &name, bool filler) const
{
  UnitMap::const_iterator it = m_unit_map.find(UnitKey(name, filler));
  if (it == m_unit_map.end())
    return NULL;
  return it->second;
}

}
