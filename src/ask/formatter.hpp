// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "ask/date.hpp"
#include "ask/list_option.hpp"

namespace ask {

/// Turns a submitted answer into the text shown on the answered prompt line
template <typename T>
using Formatter = std::function<std::string(const T&)>;

using StringFormatter = Formatter<std::string>;

template <typename T>
using MultiOptionFormatter = Formatter<std::vector<ListOption<T>>>;

template <typename T>
using MultiCountFormatter = Formatter<std::vector<CountedListOption<T>>>;

inline std::string formatString(const std::string& s)
{
  return s;
}

inline std::string formatBool(const bool& b)
{
  return b ? "Yes" : "No";
}

/// "January 15, 2023"
inline std::string formatDate(const Date& d)
{
  return d.format("%B %-e, %Y");
}

/// Options joined with ", "
template <typename T, typename ToString>
std::string joinOptions(const std::vector<ListOption<T>>& options, ToString&& toString)
{
  std::string out;
  for (const auto& option : options) {
    if (!out.empty())
      out.append(", ");
    out.append(toString(option.mValue));
  }
  return out;
}

} // namespace ask
