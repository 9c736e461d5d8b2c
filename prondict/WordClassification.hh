#ifndef WORDCLASSIFICATION_HH
#define WORDCLASSIFICATION_HH

#include <string>

namespace prondict {

/** A grammatical classification of a word, such as a part of speech. */
class WordClassification {
public:
  explicit WordClassification(const std::string &name) : m_name(name) { }

  inline const std::string &name() const { return m_name; }

  bool operator==(const WordClassification &other) const
    { return m_name == other.m_name; }

private:
  std::string m_name;
};

}

#endif /* WORDCLASSIFICATION_HH */
