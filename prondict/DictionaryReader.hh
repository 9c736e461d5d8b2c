#ifndef DICTIONARYREADER_HH
#define DICTIONARYREADER_HH

#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <stdio.h>

#include "Pronunciation.hh"
#include "UnitManager.hh"
#include "Word.hh"

namespace prondict {

// A class that reads a Sphinx-3 style dictionary and creates the words
// of the dictionary.
//
// NOTES:
//
// The spelling is lowercased and a trailing "(n)" variant marker is
// removed, so all variants of a spelling end up as pronunciations of
// one word, in the order they appear in the file.
//
// A line without phones gives a pronunciation without units.
//
// Empty lines are skipped.  A line whose first token starts with '#'
// is a comment, following the comment character of the Sphinx
// tokenizer, so a spelling can not start with '#'.  Elsewhere on a
// line '#' is an ordinary character.
//
// FILE FORMAT:
//
// ^word phone1 phone2 ...
// ^word(variation) phone1 phone2 ...
//

class DictionaryReader {
public:
  typedef std::vector<Pronunciation::UnitVector> UnitVectorList;

  /// Unit sequences of each spelling in file order.
  typedef std::map<std::string, UnitVectorList> PronunciationMap;

  /// Words by spelling.
  typedef std::map<std::string, std::unique_ptr<Word> > WordMap;

  DictionaryReader(UnitManager &unit_manager);

  /// \brief Adds a copy of every pronunciation of a non-filler
  /// dictionary with the silence unit appended.
  void set_add_sil_ending_pronunciation(bool b)
    { m_add_sil_ending_pronunciation = b; }

  /// \brief Reads the dictionary from a file.
  ///
  /// The pronunciations are appended to \a pronunciations.  The phones
  /// are interned with the \a filler flag.
  ///
  /// \exception ReadError If reading the file fails.
  ///
  void read(FILE *file, bool filler, PronunciationMap &pronunciations);

  /// \brief Converts the unit sequences to words.
  ///
  /// Every spelling becomes one word owning its pronunciations.
  ///
  static void create_words(const PronunciationMap &pronunciations,
                           bool filler, WordMap &words);

  /// \brief Returns the spelling without the trailing "(n)".
  ///
  /// "LEAD(2)" gives "LEAD".  A parenthesis at the start of the
  /// spelling is kept.
  ///
  static std::string remove_parens(const std::string &word);

  /// \brief Returns the key under which the spelling is stored.
  static std::string normalize(const std::string &word);

  // Current state for error diagnosis
  inline int line_no() const { return m_line_no; }
  inline const std::string &word() const { return m_word; }
  inline const std::string &phone() const { return m_phone; }

  /// Number of dictionary lines read by the last read().
  inline int num_entries() const { return m_num_entries; }

  struct ReadError : public std::exception {
    ReadError(int line_no);
    virtual ~ReadError() throw () { }
    virtual const char *what() const throw()
      { return m_message.c_str(); }
    int line_no() const { return m_line_no; }
  private:
    int m_line_no;
    std::string m_message;
  };

protected:
  int next_char(FILE *file);
  void skip_blanks(FILE *file, bool newlines);
  void skip_line(FILE *file);
  bool get_token(FILE *file, std::string &str);

  UnitManager &m_unit_manager;
  bool m_add_sil_ending_pronunciation;
  int m_line_no;
  int m_num_entries;

  std::string m_word;

  // Temporary variables
  std::string m_phone;
};

}

#endif /* DICTIONARYREADER_HH */
