#ifndef PRONUNCIATION_HH
#define PRONUNCIATION_HH

#include <string>
#include <vector>

#include "Unit.hh"

namespace prondict {

class Word;

/** One way to say a word: a sequence of units.  The owning word is
 * stamped by the Word constructor exactly once, after which the
 * pronunciation does not change.
 */
class Pronunciation {
public:
  typedef std::vector<const Unit*> UnitVector;

  Pronunciation(const UnitVector &units, float probability = 1.0);

  inline const UnitVector &units() const { return m_units; }
  inline int num_units() const { return m_units.size(); }
  inline const Unit *unit(int index) const { return m_units.at(index); }

  /// The owning word, or NULL before the pronunciation is part of a word.
  inline const Word *word() const { return m_word; }

  inline float probability() const { return m_probability; }
  float log_probability() const;

  /** Returns "spelling(U1 U2 ...)". */
  std::string str() const;

private:
  friend class Word;
  void set_word(const Word *word);

  UnitVector m_units;
  const Word *m_word;
  float m_probability;
};

}

#endif /* PRONUNCIATION_HH */
