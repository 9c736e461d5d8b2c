#include <stdio.h>
#include <stdlib.h>
#include "conf.hh"
#include "str.hh"

namespace conf {

  int
  Option::get_int() const
  {
    bool ok = true;
    long return_value = str::str2long(&value, &ok);
    if (!ok)
      throw "invalid value for option --" + long_name + ": " + value;
    return return_value;
  }

  Config&
  Config::operator()(const std::string &usage)
  {
    m_usage = usage;
    return *this;
  }

  Config&
  Config::operator()(unsigned char short_name, const std::string &long_name,
		     const std::string &type, const std::string &default_value,
		     const std::string &help)
  {
    Option o;
    o.short_name = short_name;
    o.help_name = long_name;
    o.long_name = long_name.substr(0, long_name.find('='));
    o.value = default_value;
    o.help = help;

    if (type == "arg")
      o.needs_argument = true;
    else if (!type.empty())
      throw "invalid option type " + type + " for option --" + o.long_name;

    int index = m_options.size();
    if (short_name != 0) {
      if (!m_short_map.insert(std::make_pair(short_name, index)).second)
	throw str::fmt(64, "trying to add option -%c twice", short_name);
    }
    if (!o.long_name.empty()) {
      if (!m_long_map.insert(std::make_pair(o.long_name, index)).second)
	throw "trying to add option --" + o.long_name + " twice";
    }
    m_options.push_back(o);
    return *this;
  }

  void
  Config::take(int index, std::deque<int> &pending)
  {
    if (m_options[index].needs_argument)
      pending.push_back(index);
    else
      m_options[index].specified = true;
  }

  void
  Config::parse(int argc, char *argv[])
  {
    std::deque<std::string> queue(argv + 1, argv + argc);
    std::deque<int> pending; // Options waiting for the argument
    bool options_allowed = true;

    while (!queue.empty()) {
      std::string arg(queue.front());
      queue.pop_front();

      if (!pending.empty()) {
	Option &option = m_options[pending.front()];
	pending.pop_front();
	option.value = arg;
	option.specified = true;
      }
      else if (!options_allowed || arg.length() < 2 || arg[0] != '-')
	arguments.push_back(arg);
      else if (arg == "--")
	options_allowed = false;
      else if (arg[1] != '-') {
	for (int c = 1; c < (int)arg.length(); c++) {
	  std::map<unsigned char, int>::const_iterator it =
	    m_short_map.find(arg[c]);
	  if (it == m_short_map.end())
	    throw str::fmt(64, "invalid option -%c", arg[c]);
	  take(it->second, pending);
	}
      }
      else {
	std::string name(arg, 2);
	std::string::size_type equal_pos = name.find('=');
	if (equal_pos != std::string::npos) {
	  queue.push_front(name.substr(equal_pos + 1));
	  name.erase(equal_pos);
	}
	std::map<std::string, int>::const_iterator it = m_long_map.find(name);
	if (it == m_long_map.end())
	  throw "invalid option --" + name;
	take(it->second, pending);
      }
    }

    if (!pending.empty())
      throw "option --" + m_options[pending.front()].long_name +
	" lacks an argument";
  }

  void
  Config::default_parse(int argc, char *argv[])
  {
    parse(argc, argv);
    if ((*this)["help"].specified) {
      fputs(help_string().c_str(), stdout);
      exit(0);
    }
  }

  std::string
  Config::help_string() const
  {
    int width = 0;
    for (int i = 0; i < (int)m_options.size(); i++)
      if ((int)m_options[i].help_name.length() > width)
	width = m_options[i].help_name.length();

    std::string help(m_usage);
    for (int i = 0; i < (int)m_options.size(); i++) {
      const Option &option = m_options[i];
      if (option.short_name != 0)
	help += str::fmt(16, "  -%c", option.short_name);
      else
	help += "    ";
      if (option.help_name.empty())
	help += "    ";
      else
	help += option.short_name != 0 ? ", --" : "  --";
      help += option.help_name;
      help.append(width - option.help_name.length() + 2, ' ');
      help += option.help + "\n";
    }
    return help;
  }

  const Option&
  Config::operator[](const std::string &long_name) const
  {
    std::map<std::string, int>::const_iterator it = m_long_map.find(long_name);
    if (it == m_long_map.end())
      throw "Config::get(): unknown option " + long_name;
    return m_options[it->second];
  }
};
