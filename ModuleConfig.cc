#include <cstddef>  // NULL
#include <assert.h>
#include "str.hh"
#include "ModuleConfig.hh"

const std::string*
ModuleConfig::find(const std::string &name) const
{
  std::map<std::string, std::string>::const_iterator it = m_values.find(name);
  if (it == m_values.end())
    return NULL;
  return &it->second;
}

void
ModuleConfig::set(const std::string &name, const std::string &value)
{
  assert(name.find_first_of(" \t\n") == std::string::npos);
  assert(value.find('\n') == std::string::npos);
  m_values[name] = value;
}

bool
ModuleConfig::get(const std::string &name, int &value) const
{
  const std::string *str = find(name);
  if (str == NULL)
    return false;

  bool ok = true;
  long l = str::str2long(str, &ok);
  if (!ok)
    throw "invalid integer value for " + name + ": " + *str;
  value = l;
  return true;
}

bool
ModuleConfig::get(const std::string &name, bool &value) const
{
  const std::string *str = find(name);
  if (str == NULL)
    return false;

  if (*str == "1" || *str == "true" || *str == "yes")
    value = true;
  else if (*str == "0" || *str == "false" || *str == "no")
    value = false;
  else
    throw "invalid boolean value for " + name + ": " + *str;
  return true;
}

bool
ModuleConfig::get(const std::string &name, std::string &value) const
{
  const std::string *str = find(name);
  if (str == NULL)
    return false;
  value = *str;
  return true;
}

bool
ModuleConfig::get(const std::string &name,
                  std::vector<std::string> &value) const
{
  const std::string *str = find(name);
  if (str == NULL)
    return false;
  str::split(str, " \t", true, &value);
  return true;
}

void
ModuleConfig::read(FILE *file)
{
  bool opened = false;
  std::string line;
  std::vector<std::string> fields;
  while (str::read_line(&line, file, true)) {
    str::clean(&line, " \t\r");
    if (line.empty() || line[0] == '#')
      continue;

    if (!opened) {
      if (line != "{")
        throw "'{' expected in module config file: " + line;
      opened = true;
    }
    else if (line == "}")
      return;
    else {
      str::split(&line, " \t", true, &fields, 2);
      if (fields.size() < 2)
        throw "value missing for option: " + line;
      if (find(fields[0]) != NULL)
        throw "value redefined: " + line;
      m_values[fields[0]] = fields[1];
    }
  }
  throw std::string("unexpected end of module config file");
}
