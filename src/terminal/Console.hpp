#ifndef __PD_CONSOLE_HPP__
#define __PD_CONSOLE_HPP__

#include "FdUtils.hpp"
#include "Headers.hpp"

namespace pd {
/**
 * @brief Abstract console the front end reads keystrokes from and renders
 * session output to.
 */
class Console {
 public:
  virtual ~Console() {}
  /** @brief Current window geometry. */
  virtual TerminalSize getTerminalSize() = 0;
  /** @brief Puts the terminal into raw mode. */
  virtual void setup() = 0;
  /** @brief Restores the terminal state saved by `setup`. */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives session output. */
  virtual int getFd() = 0;
  /** @brief Descriptor keystrokes are read from. */
  virtual int getInputFd() = 0;

  virtual void write(const string& s) {
    FdUtils::writeAll(getFd(), s.c_str(), s.length());
  }
};
}  // namespace pd

#endif  // __PD_CONSOLE_HPP__
