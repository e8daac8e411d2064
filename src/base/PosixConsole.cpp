#include "PosixConsole.hpp"

namespace tabmux {
termios PosixConsole::terminal_backup;
std::atomic<bool> PosixConsole::active(false);

PosixConsole::PosixConsole() {}

PosixConsole::~PosixConsole() { teardown(); }

void PosixConsole::setup() {
  if (active.exchange(true)) {
    STFATAL << "Console was set up twice";
  }
  setvbuf(stdin, NULL, _IONBF, 0);   // turn off buffering
  setvbuf(stdout, NULL, _IONBF, 0);  // turn off buffering

  termios terminal_local;
  FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminal_local));
  memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
  cfmakeraw(&terminal_local);
  // Keep output processing so a bare \n still returns the carriage
  terminal_local.c_oflag |= (OPOST | ONLCR);
  FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));

  write(ENABLE_MOUSE_EVENTS);
  VLOG(1) << "Console is in raw mode";
}

void PosixConsole::teardown() {
  if (!active.exchange(false)) {
    return;
  }
  try {
    write(DISABLE_MOUSE_EVENTS);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Could not disable mouse events: " << ex.what();
  }
  tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
  VLOG(1) << "Console restored";
}

void PosixConsole::emergencyRestore() {
  if (!active.exchange(false)) {
    return;
  }
  ssize_t ignored = ::write(STDOUT_FILENO, DISABLE_MOUSE_EVENTS.c_str(),
                            DISABLE_MOUSE_EVENTS.length());
  (void)ignored;
  tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
}
}  // namespace tabmux
