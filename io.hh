#ifndef IO_HH
#define IO_HH

#include <exception>
#include <string>
#include <stdio.h>

/** Reading plain files, compressed files and process pipes
 * transparently.
 */
namespace io {

  /** An input stream.  A stream can be a file or a pipe.
   *
   * \li "-" reads the standard input, which is never closed.
   * \li "command|" reads the output of the command.
   * \li "*.gz" and "*.bz2" are read through the decompressor.
   * \li Anything else is opened as a plain file.
   */
  struct Stream {

    struct OpenError : public std::exception {
      OpenError(const std::string &file_name)
	: m_message("could not open " + file_name) { }
      virtual ~OpenError() throw () { }
      virtual const char *what() const throw()
	{ return m_message.c_str(); }
    private:
      std::string m_message;
    };

    /** Open a stream for reading.
     * \throw OpenError if the file or pipe can not be opened
     */
    Stream(const std::string &file_name);

    /** Close the stream, ignoring the status. */
    ~Stream();

    /** Close the stream.  Closing an already closed stream does
     * nothing.
     *
     * \return 0 on success.  For a pipe, non-zero if the command or the
     * decompressor failed, so that a pipe that produced no data can be
     * told apart from an empty file.
     */
    int close();

    operator FILE*() const { return file; }

    FILE *file; //!< The handle for the file or pipe
    bool is_pipe; //!< Is the file a pipe that must be closed with pclose

  private:
    Stream(const Stream &stream);
    const Stream &operator=(const Stream &stream);
  };
};

#endif /* IO_HH */
