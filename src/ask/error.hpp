// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <stdexcept>
#include <string>

namespace ask {

enum class ErrorKind {
  NotTTY,
  InvalidConfiguration,
  IO,
  Canceled,
  Interrupted,
  Custom,
};

/// Base class of everything a prompt throws
class Error : public std::runtime_error
{
public:
  Error(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), mKind(kind) { }

  [[nodiscard]] ErrorKind kind() const noexcept { return mKind; }

private:
  ErrorKind mKind;
};

struct NotTTYError : Error
{
  NotTTYError();
};

/// Thrown before touching the terminal when the prompt options don't make sense
struct InvalidConfigurationError : Error
{
  explicit InvalidConfigurationError(const std::string& detail);
};

struct IOError : Error
{
  explicit IOError(const std::string& detail);

  /// Builds the message from errno, like perror does
  static IOError fromErrno(const char* what);
};

/// Esc was pressed
struct CanceledError : Error
{
  CanceledError();
};

/// Ctrl-C was pressed
struct InterruptedError : Error
{
  InterruptedError();
};

/// For validators and other callbacks that need to abort the prompt
struct CustomError : Error
{
  explicit CustomError(const std::string& detail);
};

} // namespace ask
