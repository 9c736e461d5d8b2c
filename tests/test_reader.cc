#include <cassert>
#include <cstdio>
#include <string>

#include "DictionaryReader.hh"

using namespace prondict;

typedef DictionaryReader::PronunciationMap PronunciationMap;
typedef DictionaryReader::WordMap WordMap;

FILE*
string_file(const std::string &text)
{
  FILE *file = tmpfile();
  assert(file != NULL);
  fputs(text.c_str(), file);
  rewind(file);
  return file;
}

void
read_string(DictionaryReader &reader, const std::string &text, bool filler,
            PronunciationMap &pronunciations)
{
  FILE *file = string_file(text);
  reader.read(file, filler, pronunciations);
  fclose(file);
}

std::string
units_str(const Pronunciation::UnitVector &units)
{
  std::string str;
  for (int i = 0; i < (int)units.size(); i++) {
    if (i > 0)
      str += " ";
    str += units[i]->name();
  }
  return str;
}

void
test_variants()
{
  UnitManager m;
  DictionaryReader reader(m);
  PronunciationMap pm;
  read_string(reader, "ONE HH W AH N\nONE(2) W AH N\n", false, pm);

  assert(pm.size() == 1);
  assert(pm.count("one") == 1);
  assert(pm["one"].size() == 2);
  assert(units_str(pm["one"][0]) == "HH W AH N");
  assert(units_str(pm["one"][1]) == "W AH N");
  assert(reader.num_entries() == 2);

  WordMap words;
  DictionaryReader::create_words(pm, false, words);
  assert(words.size() == 1);
  const Word *one = words["one"].get();
  assert(one->spelling() == "one");
  assert(!one->is_filler());
  assert(one->num_pronunciations() == 2);
  for (int i = 0; i < one->num_pronunciations(); i++) {
    assert(one->pronunciations()[i].word() == one);
    assert(one->pronunciations()[i].probability() == 1.0);
  }
  assert(one->most_likely_pronunciation() == &one->pronunciations()[0]);
  assert(one->pronunciations()[1].str() == "one(W AH N)");
}

void
test_variants_anywhere_in_file()
{
  UnitManager m;
  DictionaryReader reader(m);
  PronunciationMap pm;
  read_string(reader, "LEAD L IY D\nTWO T UW\nlead(2) L EH D\n"
              "Lead(3) L IY D Z\n", false, pm);

  assert(pm.size() == 2);
  assert(pm["lead"].size() == 3);
  assert(units_str(pm["lead"][0]) == "L IY D");
  assert(units_str(pm["lead"][1]) == "L EH D");
  assert(units_str(pm["lead"][2]) == "L IY D Z");
}

void
test_sil_ending()
{
  UnitManager m;
  DictionaryReader reader(m);
  reader.set_add_sil_ending_pronunciation(true);

  PronunciationMap pm;
  read_string(reader, "TWO T UW\nONE W AH N\nONE(2) HH W AH N\n", false, pm);
  assert(pm["two"].size() == 2);
  assert(units_str(pm["two"][0]) == "T UW");
  assert(units_str(pm["two"][1]) == "T UW SIL");
  assert(pm["two"][1].back() == m.silence());

  // Plain and silence variants are interleaved in file order
  assert(pm["one"].size() == 4);
  assert(units_str(pm["one"][0]) == "W AH N");
  assert(units_str(pm["one"][1]) == "W AH N SIL");
  assert(units_str(pm["one"][2]) == "HH W AH N");
  assert(units_str(pm["one"][3]) == "HH W AH N SIL");

  // No silence variants in a filler dictionary
  PronunciationMap fillers;
  read_string(reader, "++NOISE++ +NSN+\n<sil> SIL\n", true, fillers);
  assert(fillers["++noise++"].size() == 1);
  assert(fillers["<sil>"].size() == 1);
}

void
test_remove_parens()
{
  assert(DictionaryReader::remove_parens("LEAD(2)") == "LEAD");
  assert(DictionaryReader::remove_parens("LEAD") == "LEAD");
  assert(DictionaryReader::remove_parens("LEAD(12)") == "LEAD");
  assert(DictionaryReader::remove_parens("A(B)") == "A");
  assert(DictionaryReader::remove_parens("(B)") == "(B)");
  assert(DictionaryReader::remove_parens("A(B") == "A(B");
  assert(DictionaryReader::remove_parens("A)") == "A)");
  assert(DictionaryReader::remove_parens("F(1)(2)") == "F(1)");

  assert(DictionaryReader::normalize("LEAD(2)") == "lead");
  assert(DictionaryReader::normalize("One") == "one");
  assert(DictionaryReader::normalize(DictionaryReader::normalize("ONE(3)"))
         == "one");
}

void
test_whitespace_and_comments()
{
  UnitManager m;
  DictionaryReader reader(m);
  PronunciationMap pm;
  read_string(reader,
              "# a comment line\n"
              "\n"
              "   TWO \t T\tUW   \n"
              "\r\n"
              "THREE TH R IY\r\n"
              "OH OW", false, pm);

  assert(pm.size() == 3);
  assert(units_str(pm["two"][0]) == "T UW");
  assert(units_str(pm["three"][0]) == "TH R IY");
  // Last line without a newline
  assert(units_str(pm["oh"][0]) == "OW");
  assert(reader.num_entries() == 3);
  assert(reader.line_no() == 6);

  // '#' starts a comment only at the start of the first token
  PronunciationMap hashes;
  read_string(reader, "  #FOO F UW\nC# S IY SH#\n", false, hashes);
  assert(hashes.size() == 1);
  assert(units_str(hashes["c#"][0]) == "S IY SH#");
}

void
test_empty_pronunciation()
{
  UnitManager m;
  DictionaryReader reader(m);
  PronunciationMap pm;
  read_string(reader, "UH\nAH AH\n", false, pm);

  assert(pm["uh"].size() == 1);
  assert(pm["uh"][0].empty());

  WordMap words;
  DictionaryReader::create_words(pm, false, words);
  assert(words["uh"]->num_pronunciations() == 1);
  assert(words["uh"]->pronunciations()[0].num_units() == 0);
}

void
test_shared_units()
{
  UnitManager m;
  DictionaryReader reader(m);

  PronunciationMap words;
  read_string(reader, "ONE W AH N\nNINE N AY N\n", false, words);
  PronunciationMap fillers;
  read_string(reader, "<sil> SIL\n++UH++ AH\n", true, fillers);

  const Unit *n1 = words["one"][0][2];
  const Unit *n2 = words["nine"][0][0];
  const Unit *n3 = words["nine"][0][2];
  assert(n1 == n2 && n2 == n3);

  // Same name, different filler flag
  const Unit *ah = words["one"][0][1];
  const Unit *filler_ah = fillers["++uh++"][0][0];
  assert(ah->name() == filler_ah->name());
  assert(ah != filler_ah);
  assert(filler_ah->is_filler());

  assert(fillers["<sil>"][0][0] == m.silence());
}

void
test_filler_words()
{
  UnitManager m;
  DictionaryReader reader(m);
  PronunciationMap pm;
  read_string(reader, "<s> SIL\n</s> SIL\n<sil> SIL\n", true, pm);

  WordMap words;
  DictionaryReader::create_words(pm, true, words);
  assert(words.size() == 3);
  assert(words["<s>"]->is_filler());
  assert(words["<s>"]->is_sentence_start_word());
  assert(words["</s>"]->is_sentence_end_word());
  assert(words["<sil>"]->is_silence());
  assert(!words["<sil>"]->is_sentence_start_word());
}

void
test_read_error()
{
  UnitManager m;
  DictionaryReader reader(m);
  PronunciationMap pm;

  // Reading a directory fails with EISDIR
  FILE *file = fopen("/", "r");
  if (file == NULL)
    return;
  bool thrown = false;
  try {
    reader.read(file, false, pm);
  }
  catch (DictionaryReader::ReadError &e) {
    thrown = true;
    assert(e.line_no() == 1);
  }
  fclose(file);
  assert(thrown);
}

int
main(int argc, char *argv[])
{
  test_variants();
  test_variants_anywhere_in_file();
  test_sil_ending();
  test_remove_parens();
  test_whitespace_and_comments();
  test_empty_pronunciation();
  test_shared_units();
  test_filler_words();
  test_read_error();
  printf("test_reader: ok\n");
  return 0;
}
