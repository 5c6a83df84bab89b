// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/style.hpp"

#include <iterator>

#include <fmt/core.h>

namespace ask {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

/// Append the SGR parameters of a color. Foreground and background differ by 10.
void colorParams(std::string& out, const Color& color, bool background)
{
  const int base = background ? 10 : 0;
  std::visit(Overloaded {
    [&](const TermColor& c) {
      if (c.mCode == Default)
        fmt::format_to(std::back_inserter(out), "{};", 39 + base);
      else
        fmt::format_to(std::back_inserter(out), "{};", (c.mBright ? 90 : 30) + base + c.mCode);
    },
    [&](const AnsiColor& c) {
      fmt::format_to(std::back_inserter(out), "{};5;{};", 38 + base, c.mIndex);
    },
    [&](const TrueColor& c) {
      fmt::format_to(std::back_inserter(out), "{};2;{};{};{};", 38 + base, c.mRed, c.mGreen, c.mBlue);
    },
  }, color.mInner);
}

} // namespace

void Color::hash(Hasher& h) const noexcept
{
  h.feedInt(mInner.index());
  std::visit(Overloaded {
    [&](const TermColor& c) { h.feedInt(c.mCode); h.feedInt(c.mBright); },
    [&](const AnsiColor& c) { h.feedInt(c.mIndex); },
    [&](const TrueColor& c) { h.feedInt(c.mRed); h.feedInt(c.mGreen); h.feedInt(c.mBlue); },
  }, mInner);
}

void StyleSheet::hash(Hasher& h) const noexcept
{
  h.feedInt(mFg.has_value());
  if (mFg)
    mFg->hash(h);
  h.feedInt(mBg.has_value());
  if (mBg)
    mBg->hash(h);
  h.feedInt(mAttr);
}

std::string sgr(const StyleSheet& style)
{
  if (style.isEmpty())
    return {};

  std::string params;
  if (style.mAttr & kAttrBold)
    params += "1;";
  if (style.mAttr & kAttrItalic)
    params += "3;";
  if (style.mFg)
    colorParams(params, *style.mFg, false);
  if (style.mBg)
    colorParams(params, *style.mBg, true);
  params.pop_back(); // trailing ';'

  return fmt::format("\x1B[{}m", params);
}

} // namespace ask
