// src/app/terminal.hpp
// POSIX terminal plumbing for the console host: raw (non-canonical,
// non-echo) input for the lifetime of a RawTerminal, and a non-blocking
// key reader that understands arrow-key escape sequences.

#pragma once
#include <termios.h>
#include <unistd.h>

#include <sys/select.h>

#include "app/keys.hpp"

namespace app {

class RawTerminal {
public:
  RawTerminal() {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved_) != 0)
      return;
    termios raw = saved_;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    active_ = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
  }

  ~RawTerminal() {
    if (active_)
      tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
  }

  RawTerminal(const RawTerminal &) = delete;
  RawTerminal &operator=(const RawTerminal &) = delete;

  bool active() const { return active_; }

private:
  termios saved_{};
  bool active_ = false;
};

namespace detail {

inline bool stdin_ready() {
  fd_set set;
  FD_ZERO(&set);
  FD_SET(STDIN_FILENO, &set);
  timeval tv{0, 0};
  return select(STDIN_FILENO + 1, &set, nullptr, nullptr, &tv) > 0;
}

inline int read_byte() {
  unsigned char c = 0;
  return read(STDIN_FILENO, &c, 1) == 1 ? c : -1;
}

} // namespace detail

// Returns Key::None when nothing is waiting.
inline Key poll_key() {
  if (!detail::stdin_ready())
    return Key::None;
  const int c = detail::read_byte();
  switch (c) {
  case -1:
    return Key::None;
  case ' ':
    return Key::Space;
  case 'r':
  case 'R':
    return Key::Reset;
  case 'q':
  case 'Q':
    return Key::Quit;
  case 27: {
    // ESC [ A/B/C/D are the arrow keys; a bare ESC quits.
    if (!detail::stdin_ready() || detail::read_byte() != '[')
      return Key::Quit;
    switch (detail::read_byte()) {
    case 'A':
      return Key::Up;
    case 'B':
      return Key::Down;
    case 'C':
      return Key::Right;
    case 'D':
      return Key::Left;
    default:
      return Key::Other;
    }
  }
  default:
    return Key::Other;
  }
}

} // namespace app
