#include <cstddef>  // NULL
#include <assert.h>
#include <math.h>

#include "Pronunciation.hh"
#include "Word.hh"

namespace prondict {

Pronunciation::Pronunciation(const UnitVector &units, float probability)
  : m_units(units),
    m_word(NULL),
    m_probability(probability)
{
}

float
Pronunciation::log_probability() const
{
  return logf(m_probability);
}

void
Pronunciation::set_word(const Word *word)
{
  assert(m_word == NULL);
  m_word = word;
}

std::string
Pronunciation::str() const
{
  std::string result;
  if (m_word != NULL)
    result.append(m_word->spelling());
  result.append("(");
  for (int i = 0; i < (int)m_units.size(); i++) {
    if (i > 0)
      result.append(" ");
    result.append(m_units[i]->name());
  }
  result.append(")");
  return result;
}

}
