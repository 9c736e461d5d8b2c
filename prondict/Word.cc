#include <cstddef>  // NULL

#include "Word.hh"
#include "Dictionary.hh"

namespace prondict {

Word::Word(const std::string &spelling,
           const std::vector<Pronunciation> &pronunciations,
           bool filler)
  : m_spelling(spelling),
    m_pronunciations(pronunciations),
    m_filler(filler)
{
  for (int i = 0; i < (int)m_pronunciations.size(); i++)
    m_pronunciations[i].set_word(this);
}

const Pronunciation*
Word::most_likely_pronunciation() const
{
  const Pronunciation *best = NULL;
  for (int i = 0; i < (int)m_pronunciations.size(); i++) {
    if (best == NULL || m_pronunciations[i].probability() > best->probability())
      best = &m_pronunciations[i];
  }
  return best;
}

bool
Word::is_sentence_start_word() const
{
  return m_spelling == Dictionary::SENTENCE_START_SPELLING;
}

bool
Word::is_sentence_end_word() const
{
  return m_spelling == Dictionary::SENTENCE_END_SPELLING;
}

bool
Word::is_silence() const
{
  return m_spelling == Dictionary::SILENCE_SPELLING;
}

}
