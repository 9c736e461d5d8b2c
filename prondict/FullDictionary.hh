#ifndef FULLDICTIONARY_HH
#define FULLDICTIONARY_HH

#include <exception>
#include <string>
#include <vector>

#include "Dictionary.hh"
#include "DictionaryReader.hh"
#include "UnitManager.hh"
#include "ModuleConfig.hh"

namespace prondict {

/** A dictionary that reads all words of a Sphinx-3 style word
 * dictionary and a filler dictionary at allocation.  A digits
 * dictionary looks like:
 *
 * \code
 * ONE                  HH W AH N
 * ONE(2)               W AH N
 * TWO                  T UW
 * ZERO                 Z IH R OW
 * ZERO(2)              Z IY R OW
 * \endcode
 *
 * Lookups are case insensitive.  A spelling is searched first from the
 * word dictionary and then from the filler dictionary.  If it is not
 * found, get_word() resolves it as follows:
 *
 * \li If a replacement word is set, the replacement is returned (NULL
 * if the replacement is missing too).
 * \li Otherwise if missing words are allowed and missing words are
 * created, an empty word is added to the word dictionary, but NULL is
 * returned.  Later calls return the created word.
 * \li Otherwise NULL is returned.
 *
 * The dictionary is not thread safe: get_word() may modify the word
 * dictionary.
 */
class FullDictionary : public Dictionary {
public:
  struct NotAllocated : public std::exception {
    virtual const char *what() const throw()
      { return "FullDictionary: dictionary not allocated"; }
  };

  /** Create a dictionary.
   * \param word_dictionary_file = the word dictionary
   * \param filler_dictionary_file = the filler dictionary
   * \param addenda_files = additional dictionaries, currently not read
   * \param add_sil_ending_pronunciation = add a copy of every word
   * pronunciation ending in silence
   * \param word_replacement = spelling returned for missing words, empty
   * for none
   * \param allow_missing_words = missing words are not reported as errors
   * \param create_missing_words = add missing words to the dictionary
   * \param unit_manager = the interner of the phones
   */
  FullDictionary(const std::string &word_dictionary_file,
                 const std::string &filler_dictionary_file,
                 const std::vector<std::string> &addenda_files,
                 bool add_sil_ending_pronunciation,
                 const std::string &word_replacement,
                 bool allow_missing_words,
                 bool create_missing_words,
                 UnitManager &unit_manager);

  /** Create a dictionary from a configuration block.  The keys are
   * "dictionary", "filler_dictionary", "addenda",
   * "add_sil_ending_pronunciation", "word_replacement",
   * "allow_missing_words", "create_missing_words" and "verbose".
   *
   * \throw std::string if a dictionary is not given or a value is
   * invalid
   */
  FullDictionary(const ModuleConfig &config, UnitManager &unit_manager);

  virtual ~FullDictionary() { }

  /** Reads the word and the filler dictionary, unless already
   * allocated.  If reading fails, the dictionary stays unallocated.
   *
   * \exception io::Stream::OpenError If a file can not be opened.
   * \exception DictionaryReader::ReadError If reading a file fails,
   * or the decompressor or command of a pipe fails.
   */
  virtual void allocate();
  virtual void deallocate();
  inline bool allocated() const { return m_state == LOADED; }

  virtual const Word *get_word(const std::string &text);
  virtual const Word *get_sentence_start_word();
  virtual const Word *get_sentence_end_word();
  virtual const Word *get_silence_word();
  virtual std::vector<const Word*> get_filler_words() const;

  /** Classifications are not supported: returns an empty vector. */
  virtual std::vector<WordClassification>
  get_possible_word_classifications() const;

  /** Returns the word from the word or the filler dictionary without
   * the missing word handling of get_word(). */
  const Word *lookup(const std::string &spelling) const;

  inline const std::string &word_dictionary_file() const
    { return m_word_dictionary_file; }
  inline const std::string &filler_dictionary_file() const
    { return m_filler_dictionary_file; }
  inline const std::vector<std::string> &addenda_files() const
    { return m_addenda_files; }

  int num_words() const;
  int num_filler_words() const;

  /// Time used by the last load in seconds.
  inline double load_time() const { return m_load_time; }

  /** Returns all words in alphabetical order, each word followed by
   * its pronunciations on separate lines. */
  std::string dump() const;

  /** Returns a one line description of the dictionary. */
  std::string str() const;

  void set_verbose(int verbose) { m_verbose = verbose; }

protected:
  enum State { UNLOADED, LOADED };

  void check_allocated() const;
  void load_dictionary(const std::string &file_name, bool filler,
                       DictionaryReader::WordMap &words);

  std::string m_word_dictionary_file;
  std::string m_filler_dictionary_file;
  std::vector<std::string> m_addenda_files;
  bool m_add_sil_ending_pronunciation;
  std::string m_word_replacement;
  bool m_allow_missing_words;
  bool m_create_missing_words;
  UnitManager &m_unit_manager;

  State m_state;
  DictionaryReader::WordMap m_word_dictionary;
  DictionaryReader::WordMap m_filler_dictionary;
  double m_load_time;
  int m_verbose;
};

}

#endif /* FULLDICTIONARY_HH */
