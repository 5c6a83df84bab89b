// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/validator.hpp"

#include "ask/unicode.hpp"

namespace ask {

size_t answerLength(std::string_view s)
{
  return unicode::graphemeBreaks(s).size() - 1;
}

StringValidator required(std::string message)
{
  return [message = std::move(message)](const std::string& value) {
    return value.empty() ? Validation::invalid(message) : Validation::valid();
  };
}

} // namespace ask
