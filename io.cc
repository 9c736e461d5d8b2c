#include <cstddef>  // NULL
#include "io.hh"

namespace io {

  static bool
  ends_with(const std::string &str, const std::string &suffix)
  {
    return str.length() >= suffix.length() &&
      str.compare(str.length() - suffix.length(), suffix.length(),
		  suffix) == 0;
  }

  Stream::Stream(const std::string &file_name)
    : file(NULL),
      is_pipe(false)
  {
    if (file_name.empty())
      throw OpenError("empty filename");

    std::string command;
    if (file_name == "-") {
      file = stdin;
      return;
    }
    else if (ends_with(file_name, "|"))
      command = file_name.substr(0, file_name.length() - 1);
    else if (ends_with(file_name, ".gz"))
      command = "gzip -dc '" + file_name + "'";
    else if (ends_with(file_name, ".bz2"))
      command = "bzip2 -dc '" + file_name + "'";

    if (command.empty()) {
      file = fopen(file_name.c_str(), "r");
      if (file == NULL)
	throw OpenError(file_name);
    }
    else {
      file = popen(command.c_str(), "r");
      if (file == NULL)
	throw OpenError("pipe " + command);
      is_pipe = true;
    }
  }

  Stream::~Stream()
  {
    close();
  }

  int
  Stream::close()
  {
    int status = 0;
    if (file != NULL && file != stdin) {
      if (is_pipe)
	status = pclose(file);
      else
	status = fclose(file);
    }
    is_pipe = false;
    file = NULL;
    return status;
  }

}
