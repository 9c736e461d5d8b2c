#ifndef DICTIONARY_HH
#define DICTIONARY_HH

#include <string>
#include <vector>

#include "Word.hh"
#include "WordClassification.hh"

namespace prondict {

/** Interface of a pronunciation dictionary used by the decoder.
 *
 * A dictionary must be allocated before the queries are used.  The
 * queries return NULL for words that can not be resolved.
 */
class Dictionary {
public:
  static const char *SENTENCE_START_SPELLING; //!< "<s>"
  static const char *SENTENCE_END_SPELLING; //!< "</s>"
  static const char *SILENCE_SPELLING; //!< "<sil>"

  virtual ~Dictionary() { }

  /** Loads the dictionary.  Calling allocate() on an allocated
   * dictionary does nothing. */
  virtual void allocate() = 0;

  /** Releases the loaded words. */
  virtual void deallocate() = 0;

  /** Returns the word for the spelling, or NULL if it can not be
   * resolved. */
  virtual const Word *get_word(const std::string &text) = 0;

  virtual const Word *get_sentence_start_word() = 0;
  virtual const Word *get_sentence_end_word() = 0;
  virtual const Word *get_silence_word() = 0;

  /** Returns all filler words in unspecified order. */
  virtual std::vector<const Word*> get_filler_words() const = 0;

  /** Returns the classifications the words of this dictionary can
   * have. */
  virtual std::vector<WordClassification>
  get_possible_word_classifications() const = 0;
};

}

#endif /* DICTIONARY_HH */
