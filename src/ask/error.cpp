// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/error.hpp"

#include <cerrno>
#include <cstring>

#include <fmt/core.h>

namespace ask {

NotTTYError::NotTTYError()
  : Error(ErrorKind::NotTTY, "The input device is not a TTY")
{
}

InvalidConfigurationError::InvalidConfigurationError(const std::string& detail)
  : Error(ErrorKind::InvalidConfiguration,
          fmt::format("The prompt configuration is invalid: {}", detail))
{
}

IOError::IOError(const std::string& detail)
  : Error(ErrorKind::IO, fmt::format("IO error: {}", detail))
{
}

IOError IOError::fromErrno(const char* what)
{
  return IOError { fmt::format("{}: {}", what, std::strerror(errno)) };
}

CanceledError::CanceledError()
  : Error(ErrorKind::Canceled, "Operation was canceled by the user")
{
}

InterruptedError::InterruptedError()
  : Error(ErrorKind::Interrupted, "Operation was interrupted by the user")
{
}

CustomError::CustomError(const std::string& detail)
  : Error(ErrorKind::Custom, fmt::format("User-provided error: {}", detail))
{
}

} // namespace ask
