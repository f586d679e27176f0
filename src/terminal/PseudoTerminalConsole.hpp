#ifndef __PD_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __PD_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"

namespace pd {
/**
 * @brief Console backed by the controlling terminal (stdin/stdout).
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : rawMode(false) {
    tcgetattr(STDIN_FILENO, &terminal_backup);
  }

  virtual ~PseudoTerminalConsole() {}

  virtual void setup() {
    termios terminal_local;
    if (tcgetattr(STDIN_FILENO, &terminal_local) == -1) {
      // Not a tty (for example piped input); nothing to configure.
      return;
    }
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));
    rawMode = true;
  }

  virtual void teardown() {
    if (rawMode) {
      tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
      rawMode = false;
    }
  }

  virtual TerminalSize getTerminalSize() {
    winsize win;
    memset(&win, 0, sizeof(winsize));
    TerminalSize ts;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1 || win.ws_col == 0) {
      ts.set_cols(120);
      ts.set_rows(40);
      return ts;
    }
    ts.set_cols(win.ws_col);
    ts.set_rows(win.ws_row);
    return ts;
  }

  virtual int getFd() { return STDOUT_FILENO; }
  virtual int getInputFd() { return STDIN_FILENO; }

 protected:
  termios terminal_backup;
  bool rawMode;
};
}  // namespace pd

#endif  // __PD_PSEUDO_TERMINAL_CONSOLE_HPP__
