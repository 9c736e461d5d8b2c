#include <cstddef>  // NULL
#include <set>
#include <stdio.h>

#include <boost/chrono.hpp> // load time

#include "FullDictionary.hh"
#include "io.hh"
#include "str.hh"

namespace prondict {

const char *Dictionary::SENTENCE_START_SPELLING = "<s>";
const char *Dictionary::SENTENCE_END_SPELLING = "</s>";
const char *Dictionary::SILENCE_SPELLING = "<sil>";

FullDictionary::FullDictionary(const std::string &word_dictionary_file,
                               const std::string &filler_dictionary_file,
                               const std::vector<std::string> &addenda_files,
                               bool add_sil_ending_pronunciation,
                               const std::string &word_replacement,
                               bool allow_missing_words,
                               bool create_missing_words,
                               UnitManager &unit_manager)
  : m_word_dictionary_file(word_dictionary_file),
    m_filler_dictionary_file(filler_dictionary_file),
    m_addenda_files(addenda_files),
    m_add_sil_ending_pronunciation(add_sil_ending_pronunciation),
    m_word_replacement(word_replacement),
    m_allow_missing_words(allow_missing_words),
    m_create_missing_words(create_missing_words),
    m_unit_manager(unit_manager),
    m_state(UNLOADED),
    m_load_time(0),
    m_verbose(1)
{
}

FullDictionary::FullDictionary(const ModuleConfig &config,
                               UnitManager &unit_manager)
  : m_add_sil_ending_pronunciation(false),
    m_allow_missing_words(false),
    m_create_missing_words(false),
    m_unit_manager(unit_manager),
    m_state(UNLOADED),
    m_load_time(0),
    m_verbose(1)
{
  if (!config.get("dictionary", m_word_dictionary_file))
    throw std::string("FullDictionary: dictionary not defined");
  if (!config.get("filler_dictionary", m_filler_dictionary_file))
    throw std::string("FullDictionary: filler_dictionary not defined");
  config.get("addenda", m_addenda_files);
  config.get("add_sil_ending_pronunciation", m_add_sil_ending_pronunciation);
  config.get("word_replacement", m_word_replacement);
  config.get("allow_missing_words", m_allow_missing_words);
  config.get("create_missing_words", m_create_missing_words);
  config.get("verbose", m_verbose);
}

void
FullDictionary::allocate()
{
  if (m_state == LOADED)
    return;

  boost::chrono::steady_clock::time_point start =
    boost::chrono::steady_clock::now();

  // Install the maps only after both files are read
  DictionaryReader::WordMap words;
  DictionaryReader::WordMap fillers;

  if (m_verbose > 1)
    fprintf(stderr, "FullDictionary: loading dictionary from %s\n",
            m_word_dictionary_file.c_str());
  load_dictionary(m_word_dictionary_file, false, words);

  if (m_verbose > 1)
    fprintf(stderr, "FullDictionary: loading filler dictionary from %s\n",
            m_filler_dictionary_file.c_str());
  load_dictionary(m_filler_dictionary_file, true, fillers);

  m_word_dictionary.swap(words);
  m_filler_dictionary.swap(fillers);
  m_state = LOADED;

  boost::chrono::duration<double> elapsed =
    boost::chrono::steady_clock::now() - start;
  m_load_time = elapsed.count();

  if (m_verbose > 1)
    fprintf(stderr, "FullDictionary: %d words, %d filler words, "
            "%d units, loaded in %.3f s\n", (int)m_word_dictionary.size(),
            (int)m_filler_dictionary.size(), m_unit_manager.num_units(),
            m_load_time);
  if (m_verbose > 2)
    fputs(dump().c_str(), stderr);
}

void
FullDictionary::deallocate()
{
  if (m_state != LOADED)
    return;
  m_word_dictionary.clear();
  m_filler_dictionary.clear();
  m_state = UNLOADED;
}

void
FullDictionary::load_dictionary(const std::string &file_name, bool filler,
                                DictionaryReader::WordMap &words)
{
  io::Stream in(file_name);

  DictionaryReader reader(m_unit_manager);
  reader.set_add_sil_ending_pronunciation(m_add_sil_ending_pronunciation);
  DictionaryReader::PronunciationMap pronunciations;
  try {
    reader.read(in.file, filler, pronunciations);
  }
  catch (DictionaryReader::ReadError &e) {
    fprintf(stderr, "ERROR: FullDictionary: reading %s failed on line %d\n",
            file_name.c_str(), e.line_no());
    throw;
  }
  // A failed decompressor or command only shows in the exit status
  if (in.close() != 0) {
    fprintf(stderr, "ERROR: FullDictionary: reading %s failed\n",
            file_name.c_str());
    throw DictionaryReader::ReadError(reader.line_no());
  }

  DictionaryReader::create_words(pronunciations, filler, words);
  if (m_verbose > 1)
    fprintf(stderr, "FullDictionary: %d entries in %s\n",
            reader.num_entries(), file_name.c_str());
}

void
FullDictionary::check_allocated() const
{
  if (m_state != LOADED)
    throw NotAllocated();
}

const Word*
FullDictionary::lookup(const std::string &spelling) const
{
  check_allocated();

  std::string key(str::lowered(spelling));
  DictionaryReader::WordMap::const_iterator it = m_word_dictionary.find(key);
  if (it != m_word_dictionary.end())
    return it->second.get();
  it = m_filler_dictionary.find(key);
  if (it != m_filler_dictionary.end())
    return it->second.get();
  return NULL;
}

const Word*
FullDictionary::get_word(const std::string &text)
{
  std::string spelling(str::lowered(text));
  const Word *word = lookup(spelling);
  if (word != NULL)
    return word;

  if (m_verbose > 0)
    fprintf(stderr, "WARNING: FullDictionary: missing word: %s\n",
            spelling.c_str());

  if (!m_word_replacement.empty()) {
    word = lookup(m_word_replacement);
    if (m_verbose > 0)
      fprintf(stderr, "WARNING: FullDictionary: replacing %s with %s\n",
              spelling.c_str(), m_word_replacement.c_str());
    if (word == NULL)
      fprintf(stderr, "ERROR: FullDictionary: replacement word %s "
              "not found\n", m_word_replacement.c_str());
    return word;
  }

  // The created word is visible only to later calls.
  if (m_allow_missing_words && m_create_missing_words) {
    m_word_dictionary[spelling].reset(
      new Word(spelling, std::vector<Pronunciation>(), false));
  }
  return NULL;
}

const Word*
FullDictionary::get_sentence_start_word()
{
  return get_word(SENTENCE_START_SPELLING);
}

const Word*
FullDictionary::get_sentence_end_word()
{
  return get_word(SENTENCE_END_SPELLING);
}

const Word*
FullDictionary::get_silence_word()
{
  return get_word(SILENCE_SPELLING);
}

std::vector<const Word*>
FullDictionary::get_filler_words() const
{
  check_allocated();

  std::vector<const Word*> words;
  words.reserve(m_filler_dictionary.size());
  for (DictionaryReader::WordMap::const_iterator it =
         m_filler_dictionary.begin(); it != m_filler_dictionary.end(); ++it)
    words.push_back(it->second.get());
  return words;
}

std::vector<WordClassification>
FullDictionary::get_possible_word_classifications() const
{
  check_allocated();
  return std::vector<WordClassification>();
}

int
FullDictionary::num_words() const
{
  check_allocated();
  return m_word_dictionary.size();
}

int
FullDictionary::num_filler_words() const
{
  check_allocated();
  return m_filler_dictionary.size();
}

std::string
FullDictionary::dump() const
{
  check_allocated();

  std::set<std::string> spellings;
  DictionaryReader::WordMap::const_iterator it;
  for (it = m_word_dictionary.begin(); it != m_word_dictionary.end(); ++it)
    spellings.insert(it->first);
  for (it = m_filler_dictionary.begin(); it != m_filler_dictionary.end(); ++it)
    spellings.insert(it->first);

  std::string result;
  for (std::set<std::string>::const_iterator s = spellings.begin();
       s != spellings.end(); ++s)
  {
    const Word *word = lookup(*s);
    result.append(word->str());
    result.append("\n");
    for (int i = 0; i < word->num_pronunciations(); i++) {
      result.append("   ");
      result.append(word->pronunciations()[i].str());
      result.append("\n");
    }
  }
  return result;
}

std::string
FullDictionary::str() const
{
  int words = m_state == LOADED ? (int)m_word_dictionary.size() : 0;
  return str::fmt(64, "FullDictionary numWords=%d dictLocation=", words) +
    m_word_dictionary_file;
}

}
