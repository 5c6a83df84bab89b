// Licensed under LGPLv3 - see LICENSE file for details.

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ask/list_option.hpp"

namespace ask {

/// Error shown under the prompt when an answer is rejected.
/// Without a custom message RenderConfig's default message is shown.
struct ErrorMessage
{
  std::optional<std::string> mCustom;

  ErrorMessage() = default;
  ErrorMessage(std::string message) : mCustom(std::move(message)) { } // NOLINT(google-explicit-constructor)
  ErrorMessage(const char* message) : mCustom(message) { } // NOLINT(google-explicit-constructor)

  bool operator==(const ErrorMessage& b) const { return mCustom == b.mCustom; }
  bool operator!=(const ErrorMessage& b) const { return !(*this == b); }
};

/// Result of a validator. Invalid answers are rejected and the prompt continues.
struct Validation
{
  bool mValid { true };
  ErrorMessage mMessage;

  static Validation valid() { return {}; }
  static Validation invalid(ErrorMessage message = {}) { return { false, std::move(message) }; }

  [[nodiscard]] bool isValid() const noexcept { return mValid; }

  bool operator==(const Validation& b) const { return mValid == b.mValid && mMessage == b.mMessage; }
  bool operator!=(const Validation& b) const { return !(*this == b); }
};

/// Checks an answer before it is accepted.
/// A validator that can't do its job should throw, CustomError preferably;
/// the exception leaves the prompt unchanged.
template <typename T>
using Validator = std::function<Validation(const T&)>;

using StringValidator = Validator<std::string>;

template <typename T>
using MultiOptionValidator = Validator<std::vector<ListOption<T>>>;

template <typename T>
using MultiCountValidator = Validator<std::vector<CountedListOption<T>>>;

/// Runs validators in order, stopping at the first that rejects the value
template <typename T>
[[nodiscard]] std::optional<ErrorMessage> runValidators(const std::vector<Validator<T>>& validators, const T& value)
{
  for (const auto& validator : validators) {
    Validation res = validator(value);
    if (!res.isValid())
      return std::move(res.mMessage);
  }
  return std::nullopt;
}

/// Length of an answer in grapheme clusters
[[nodiscard]] size_t answerLength(std::string_view s);

template <typename T>
[[nodiscard]] size_t answerLength(const std::vector<T>& v) noexcept
{
  return v.size();
}

/// Rejects empty answers
[[nodiscard]] StringValidator required(std::string message = "A response is required.");

template <typename T = std::string>
[[nodiscard]] Validator<T> maxLength(size_t limit, std::optional<std::string> message = std::nullopt)
{
  std::string msg = message ? std::move(*message)
                            : "The length of the response should be at most " + std::to_string(limit);
  return [limit, msg = std::move(msg)](const T& value) {
    return answerLength(value) <= limit ? Validation::valid() : Validation::invalid(msg);
  };
}

template <typename T = std::string>
[[nodiscard]] Validator<T> minLength(size_t limit, std::optional<std::string> message = std::nullopt)
{
  std::string msg = message ? std::move(*message)
                            : "The length of the response should be at least " + std::to_string(limit);
  return [limit, msg = std::move(msg)](const T& value) {
    return answerLength(value) >= limit ? Validation::valid() : Validation::invalid(msg);
  };
}

template <typename T = std::string>
[[nodiscard]] Validator<T> exactLength(size_t length, std::optional<std::string> message = std::nullopt)
{
  std::string msg = message ? std::move(*message)
                            : "The length of the response should be " + std::to_string(length);
  return [length, msg = std::move(msg)](const T& value) {
    return answerLength(value) == length ? Validation::valid() : Validation::invalid(msg);
  };
}

} // namespace ask
