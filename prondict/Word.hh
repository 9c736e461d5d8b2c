#ifndef WORD_HH
#define WORD_HH

#include <string>
#include <vector>

#include "Pronunciation.hh"

namespace prondict {

/** A dictionary entry: a spelling and its pronunciations.
 *
 * The constructor takes the pronunciations over and stamps itself as
 * their owner, so a word can not be copied.  A word synthesized for a
 * missing spelling has no pronunciations.
 */
class Word {
public:
  Word(const std::string &spelling,
       const std::vector<Pronunciation> &pronunciations,
       bool filler);

  inline const std::string &spelling() const { return m_spelling; }
  inline const std::vector<Pronunciation> &pronunciations() const
    { return m_pronunciations; }
  inline int num_pronunciations() const { return m_pronunciations.size(); }
  inline bool is_filler() const { return m_filler; }

  /** Returns the pronunciation with the highest probability, the first
   * one on ties, or NULL if the word has no pronunciations. */
  const Pronunciation *most_likely_pronunciation() const;

  bool is_sentence_start_word() const;
  bool is_sentence_end_word() const;
  bool is_silence() const;

  inline const std::string &str() const { return m_spelling; }

private:
  Word(const Word &word);
  Word &operator=(const Word &word);

  std::string m_spelling;
  std::vector<Pronunciation> m_pronunciations;
  bool m_filler;
};

}

#endif /* WORD_HH */
