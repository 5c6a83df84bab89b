// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/term/tty.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
}

#include "ask/error.hpp"
#include "ask/macros.hpp"

using namespace std::string_view_literals;

namespace ask {

static struct termios gSavedAttrs {};
static bool gActive { false };

TTY::~TTY() noexcept
{
  close();
}

TTY::TTY(TTY&& b) noexcept
  : mFd(b.mFd)
  , mBuffer(std::move(b.mBuffer))
  , mDecoder(std::move(b.mDecoder))
{
  b.mFd = kInvalidFd;
}

TTY& TTY::operator=(TTY&& b) noexcept
{
  close();
  mFd = b.mFd;
  mBuffer = std::move(b.mBuffer);
  mDecoder = std::move(b.mDecoder);
  b.mFd = kInvalidFd;
  return *this;
}

void TTY::open()
{
  ASSERT(!isOpen());
  if (gActive)
    throw IOError { "the terminal is already in use by another prompt" };

  const int fd = ::open("/dev/tty", O_RDWR | O_CLOEXEC);
  if (fd == -1) {
    if (errno == ENXIO || errno == ENOENT)
      throw NotTTYError {};
    throw IOError::fromErrno("open(\"/dev/tty\")");
  }

  if (!isatty(fd)) {
    ::close(fd);
    throw NotTTYError {};
  }

  if (tcgetattr(fd, &gSavedAttrs)) {
    auto error = IOError::fromErrno("tcgetattr");
    ::close(fd);
    throw error;
  }

  struct termios attrs = gSavedAttrs;
  attrs.c_iflag &= ~(ICRNL | IXON);
  attrs.c_lflag &= ~(ICANON | ECHO | ISIG);
  attrs.c_cc[VMIN] = 1;
  attrs.c_cc[VTIME] = 0;
  if (tcsetattr(fd, TCSANOW, &attrs) != 0) {
    auto error = IOError::fromErrno("tcsetattr");
    ::close(fd);
    throw error;
  }

  mFd = fd;
  gActive = true;
}

void TTY::close() noexcept
{
  if (!isOpen())
    return;
  if (!mBuffer.empty()) {
    if (::write(mFd, mBuffer.data(), mBuffer.size()) == -1)
      perror("ask: write");
    mBuffer.clear();
  }
  if (tcsetattr(mFd, TCSANOW, &gSavedAttrs) != 0)
    perror("ask: tcsetattr");
  ::close(mFd);
  mFd = kInvalidFd;
  gActive = false;
}

std::optional<TerminalSize> TTY::size() const
{
  struct winsize ws {};
  if (ioctl(mFd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0 || ws.ws_row == 0)
    return std::nullopt;
  return TerminalSize { ws.ws_col, ws.ws_row };
}

std::optional<uint8_t> TTY::readByte(int timeoutMs)
{
  for (;;) {
    if (timeoutMs >= 0) {
      struct pollfd pfd { mFd, POLLIN, 0 };
      const int res = ::poll(&pfd, 1, timeoutMs);
      if (res == -1) {
        if (errno == EINTR)
          continue;
        throw IOError::fromErrno("poll");
      }
      if (res == 0)
        return std::nullopt;
    }

    uint8_t ch = 0;
    const auto res = ::read(mFd, &ch, 1);
    if (res == 1)
      return ch;
    if (res == 0)
      throw IOError { "unexpected end of terminal input" };
    if (errno != EINTR && errno != EAGAIN)
      throw IOError::fromErrno("read");
  }
}

Key TTY::readKey()
{
  ASSERT(isOpen());
  while (!mDecoder.hasKey()) {
    const int timeout = mDecoder.pending() ? kEscapeTimeoutMs : -1;
    if (auto byte = readByte(timeout))
      mDecoder.feed(*byte);
    else
      mDecoder.timeout();
  }
  return mDecoder.pop();
}

void TTY::cursorUp(uint16_t n)
{
  if (n > 0)
    put("\x1B[{}A", n);
}

void TTY::cursorDown(uint16_t n)
{
  if (n > 0)
    put("\x1B[{}B", n);
}

void TTY::cursorLeft(uint16_t n)
{
  if (n > 0)
    put("\x1B[{}D", n);
}

void TTY::cursorRight(uint16_t n)
{
  if (n > 0)
    put("\x1B[{}C", n);
}

void TTY::cursorMoveToColumn(uint16_t col)
{
  put("\x1B[{}G", col + 1);
}

void TTY::cursorHide()
{
  put("\x1B[?25l"sv);
}

void TTY::cursorShow()
{
  put("\x1B[?25h"sv);
}

void TTY::write(std::string_view s)
{
  put(s);
}

void TTY::writeStyled(const Styled& s)
{
  if (s.mStyle.isEmpty()) {
    put(s.mContent);
    return;
  }
  put(sgr(s.mStyle));
  put(s.mContent);
  put(kSgrReset);
}

void TTY::clearLine()
{
  put("\x1B[2K"sv);
}

void TTY::clearUntilNewLine()
{
  put("\x1B[K"sv);
}

void TTY::put(char c)
{
  mBuffer.push_back(c);
}

void TTY::put(std::string_view s)
{
  if (s.empty())
    return;
  const auto size = mBuffer.size();
  mBuffer.resize(size + s.size());
  std::memcpy(mBuffer.data() + size, s.data(), s.size());
}

void TTY::flush()
{
  if (mBuffer.empty() || !isOpen())
    return;
  const char* p = mBuffer.data();
  size_t left = mBuffer.size();
  while (left > 0) {
    const auto res = ::write(mFd, p, left);
    if (res == -1) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      mBuffer.clear();
      throw IOError::fromErrno("write");
    }
    p += res;
    left -= static_cast<size_t>(res);
  }
  mBuffer.clear();
}

} // namespace ask
