#include <memory>
#include <stdio.h>

#include "io.hh"
#include "conf.hh"
#include "str.hh"
#include "ModuleConfig.hh"
#include "FullDictionary.hh"

using namespace prondict;

conf::Config config;

void
print_word(const std::string &text, const Word *word)
{
  if (word == NULL) {
    printf("%s\t<missing>\n", text.c_str());
    return;
  }
  if (word->num_pronunciations() == 0) {
    printf("%s\t<none>\n", word->spelling().c_str());
    return;
  }
  for (int i = 0; i < word->num_pronunciations(); i++) {
    const Pronunciation &pron = word->pronunciations()[i];
    printf("%s%s\t", word->spelling().c_str(), word->is_filler() ? "*" : "");
    for (int u = 0; u < pron.num_units(); u++)
      printf("%s%s", u == 0 ? "" : " ", pron.unit(u)->name().c_str());
    printf("\n");
  }
}

int
main(int argc, char *argv[])
{
  try {
    config("usage: dictlookup [OPTION...] [WORD...]\n"
           "Prints the pronunciations of the words given as arguments, "
           "or of the words\nread from the standard input one per line.\n")
      ('h', "help", "", "", "display help")
      ('c', "config=FILE", "arg", "", "read dictionary configuration")
      ('d', "dictionary=FILE", "arg", "", "word dictionary")
      ('f', "filler=FILE", "arg", "", "filler dictionary")
      ('s', "sil-ending", "", "", "add pronunciations ending in silence")
      ('r', "replacement=WORD", "arg", "", "word returned for missing words")
      ('a', "allow-missing", "", "", "allow missing words")
      ('m', "create-missing", "", "", "create missing words")
      ('\0', "dump", "", "", "print the whole dictionary")
      ('v', "verbose=INT", "arg", "1", "verbosity level")
      ;
    config.default_parse(argc, argv);

    UnitManager units;
    std::unique_ptr<FullDictionary> dict;
    if (config["config"].specified) {
      ModuleConfig dict_config;
      dict_config.read(io::Stream(config["config"].get_str()));
      dict.reset(new FullDictionary(dict_config, units));
    }
    else {
      if (!config["dictionary"].specified || !config["filler"].specified)
        throw std::string("either --config or both --dictionary and "
                          "--filler required");
      dict.reset(new FullDictionary(config["dictionary"].get_str(),
                                    config["filler"].get_str(),
                                    std::vector<std::string>(),
                                    config["sil-ending"].specified,
                                    config["replacement"].get_str(),
                                    config["allow-missing"].specified,
                                    config["create-missing"].specified,
                                    units));
    }
    if (config["verbose"].specified || !config["config"].specified)
      dict->set_verbose(config["verbose"].get_int());

    dict->allocate();

    if (config["dump"].specified) {
      fputs(dict->dump().c_str(), stdout);
      return 0;
    }

    if (!config.arguments.empty()) {
      for (int i = 0; i < (int)config.arguments.size(); i++)
        print_word(config.arguments[i], dict->get_word(config.arguments[i]));
    }
    else {
      std::string line;
      while (str::read_line(&line, stdin, true)) {
        str::clean(&line, " \t\r");
        if (line.empty())
          continue;
        print_word(line, dict->get_word(line));
      }
    }

    dict->deallocate();
  }
  catch (std::exception &e) {
    fprintf(stderr, "exception: %s\n", e.what());
    return 1;
  }
  catch (std::string &str) {
    fprintf(stderr, "exception: %s\n", str.c_str());
    return 1;
  }
}
