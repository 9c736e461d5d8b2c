#include <cstdio>

#include "DictionaryReader.hh"
#include "str.hh"

namespace prondict {

DictionaryReader::ReadError::ReadError(int line_no)
  : m_line_no(line_no),
    m_message(str::fmt(64, "DictionaryReader: read error on line %d",
                       line_no))
{
}

DictionaryReader::DictionaryReader(UnitManager &unit_manager)
  : m_unit_manager(unit_manager),
    m_add_sil_ending_pronunciation(false),
    m_line_no(0),
    m_num_entries(0)
{
}

// Reads one char.  End of file is returned as EOF, a failed read
// throws.
int
DictionaryReader::next_char(FILE *file)
{
  int c = getc(file);
  if (c == EOF && ferror(file))
    throw ReadError(m_line_no);
  return c;
}

// Skips whitespace and control chars.  Line breaks are skipped only if
// 'newlines' is set.
void
DictionaryReader::skip_blanks(FILE *file, bool newlines)
{
  while (1) {
    int c = next_char(file);
    if (c == EOF)
      return;
    if (c > ' ' || (!newlines && (c == '\n' || c == '\r'))) {
      ungetc(c, file);
      return;
    }
    if (c == '\n')
      m_line_no++;
  }
}

void
DictionaryReader::skip_line(FILE *file)
{
  while (1) {
    int c = next_char(file);
    if (c == EOF)
      return;
    if (c == '\n') {
      m_line_no++;
      return;
    }
  }
}

// Reads chars to 'str' until whitespace or end of file.  The
// delimiter is left unread.  Returns false if nothing was read.
bool
DictionaryReader::get_token(FILE *file, std::string &str)
{
  str.erase();

  while (1) {
    int c = next_char(file);
    if (c == EOF)
      break;
    if (c <= ' ') {
      ungetc(c, file);
      break;
    }
    str += (char)c;
  }
  return !str.empty();
}

std::string
DictionaryReader::remove_parens(const std::string &word)
{
  if (!word.empty() && word[word.length() - 1] == ')') {
    std::string::size_type index = word.rfind('(');
    if (index != std::string::npos && index > 0)
      return word.substr(0, index);
  }
  return word;
}

std::string
DictionaryReader::normalize(const std::string &word)
{
  return str::lowered(remove_parens(word));
}

void
DictionaryReader::read(FILE *file, bool filler,
                       PronunciationMap &pronunciations)
{
  Pronunciation::UnitVector units;
  units.reserve(20);
  m_word.reserve(128); // The size is not necessary, just for efficiency
  m_line_no = 1;
  m_num_entries = 0;

  while (1) {
    // Read the spelling
    skip_blanks(file, true);
    if (!get_token(file, m_word))
      break;

    if (m_word[0] == '#') {
      skip_line(file);
      continue;
    }

    // Read the phones up to the end of the line
    units.clear();
    while (1) {
      skip_blanks(file, false);
      if (!get_token(file, m_phone))
        break;
      units.push_back(m_unit_manager.get_unit(m_phone, filler));
    }

    UnitVectorList &list = pronunciations[normalize(m_word)];
    list.push_back(units);
    if (!filler && m_add_sil_ending_pronunciation) {
      units.push_back(m_unit_manager.silence());
      list.push_back(units);
    }
    m_num_entries++;
  }
}

void
DictionaryReader::create_words(const PronunciationMap &pronunciations,
                               bool filler, WordMap &words)
{
  std::vector<Pronunciation> pros;
  for (PronunciationMap::const_iterator it = pronunciations.begin();
       it != pronunciations.end(); ++it)
  {
    const UnitVectorList &list = it->second;
    pros.clear();
    pros.reserve(list.size());
    for (int i = 0; i < (int)list.size(); i++)
      pros.push_back(Pronunciation(list[i], 1.0));
    words[it->first].reset(new Word(it->first, pros, filler));
  }
}

}
