#include <errno.h>
#include <stdarg.h>
#include <stdlib.h>
#include "str.hh"

namespace str {

  std::string
  fmt(size_t size, const char *fmt, ...)
  {
    va_list ap;
    va_start(ap, fmt);
    std::vector<char> buf(size);
    vsnprintf(&buf[0], size, fmt, ap);
    va_end(ap);
    return std::string(&buf[0]);
  }

  bool
  read_line(std::string *str, FILE *file, bool do_chomp)
  {
    str->erase();
    int c;
    while ((c = getc(file)) != EOF) {
      if (c == '\n') {
	if (!do_chomp)
	  str->push_back('\n');
	return true;
      }
      str->push_back(c);
    }
    return !ferror(file) && !str->empty();
  }

  void
  clean(std::string *str, const char *chars)
  {
    std::string::size_type end = str->find_last_not_of(chars);
    if (end == std::string::npos) {
      str->erase();
      return;
    }
    str->erase(end + 1);
    str->erase(0, str->find_first_not_of(chars));
  }

  std::string
  lowered(const std::string &str)
  {
    std::string ret(str);
    for (size_t i = 0; i < ret.length(); i++) {
      if (ret[i] >= 'A' && ret[i] <= 'Z')
	ret[i] += 'a' - 'A';
    }
    return ret;
  }

  void
  split(const std::string *str, const char *delims, bool group,
	std::vector<std::string> *fields, int num_fields)
  {
    fields->clear();
    std::string::size_type begin = 0;
    while (begin < str->length()) {
      if (num_fields > 0 && (int)fields->size() == num_fields - 1) {
	fields->push_back(str->substr(begin));
	return;
      }

      std::string::size_type end = str->find_first_of(delims, begin);
      if (end == std::string::npos)
	end = str->length();
      fields->push_back(str->substr(begin, end - begin));

      begin = end + 1;
      if (group) {
	begin = str->find_first_not_of(delims, begin);
	if (begin == std::string::npos)
	  return;
      }
    }
  }

  long
  str2long(const std::string *str, bool *ok)
  {
    char *endptr;
    errno = 0;
    long value = strtol(str->c_str(), &endptr, 10);
    if (errno == ERANGE || str->empty() || *endptr != '\0')
      *ok = false;
    return value;
  }

}
