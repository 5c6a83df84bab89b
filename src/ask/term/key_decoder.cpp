// Licensed under LGPLv3 - see LICENSE file for details.

#include "ask/term/key_decoder.hpp"

#include "ask/macros.hpp"
#include "ask/strings.hpp"

namespace ask {

namespace {

constexpr size_t kMaxSequence = 32;

/// xterm encodes modifiers as 1 + (shift | alt << 1 | ctrl << 2)
constexpr KeyModifiers modifiersFromParam(int param) noexcept
{
  const int bits = param - 1;
  KeyModifiers mods = kNone;
  if (bits & 1)
    mods = mods | kShift;
  if (bits & 2)
    mods = mods | kAlt;
  if (bits & 4)
    mods = mods | kControl;
  return mods;
}

} // namespace

Key KeyDecoder::pop()
{
  ASSERT(!mKeys.empty());
  Key key = mKeys.front();
  mKeys.pop_front();
  return key;
}

void KeyDecoder::feed(uint8_t byte)
{
  switch (mState) {
  case State::Ground:
    if (byte == kAsciiEscape) {
      mState = State::Escape;
      return;
    }
    ground(byte, kNone);
    return;

  case State::Utf8:
    if ((byte & 0xC0) != 0x80) {
      // Truncated sequence, start over with this byte
      emit(Key::character(kReplacementChar, mUtf8Mods));
      mSequence.clear();
      mState = State::Ground;
      feed(byte);
      return;
    }
    mSequence.push_back(static_cast<char>(byte));
    if (--mUtf8Needed == 0) {
      size_t pos = 0;
      emit(Key::character(decodeUtf8(mSequence, pos), mUtf8Mods));
      mSequence.clear();
      mState = State::Ground;
    }
    return;

  case State::Escape:
    if (byte == '[') {
      mState = State::Csi;
      mSequence.clear();
      return;
    }
    if (byte == 'O') {
      mState = State::Ss3;
      return;
    }
    if (byte == kAsciiEscape) {
      // Esc Esc: the first one was a lone Esc
      emit(kCancel);
      return;
    }
    mState = State::Ground;
    ground(byte, kAlt);
    return;

  case State::Csi:
    if (byte >= 0x40 && byte <= 0x7E) {
      mState = State::Ground;
      csi(byte);
      mSequence.clear();
    } else if (mSequence.size() < kMaxSequence) {
      mSequence.push_back(static_cast<char>(byte));
    }
    return;

  case State::Ss3:
    mState = State::Ground;
    ss3(byte);
    return;
  }
}

void KeyDecoder::timeout()
{
  switch (mState) {
  case State::Ground:
    return;
  case State::Escape:
    emit(kCancel);
    break;
  case State::Csi:
    if (mSequence.empty())
      emit(Key::character('[', kAlt));
    break;
  case State::Ss3:
    emit(Key::character('O', kAlt));
    break;
  case State::Utf8:
    emit(Key::character(kReplacementChar, mUtf8Mods));
    break;
  }
  mState = State::Ground;
  mSequence.clear();
}

void KeyDecoder::ground(uint8_t byte, KeyModifiers mods)
{
  switch (byte) {
  case kAsciiEnter:
  case kAsciiNewLine:
    emit(Key { kSubmit, mods });
    return;
  case kAsciiTab:
    emit(Key { kTab, mods });
    return;
  case kAsciiBackspace:
    emit(Key { kBackspace, mods });
    return;
  case kAsciiCtrlC:
    emit(kInterrupt);
    return;
  case kAsciiCtrlH:
    emit(Key::character('h', mods | kControl));
    return;
  case kAsciiCtrlSpace:
    emit(Key::character(' ', mods | kControl));
    return;
  default:
    break;
  }

  if (byte <= kAsciiCtrlZ) {
    emit(Key::character(U'a' + byte - 1, mods | kControl));
  } else if (byte >= kAsciiCtrlBackslash && byte <= kAsciiCtrlUnderscore) {
    constexpr char kPunct[] = "\\]^_";
    emit(Key::character(static_cast<char32_t>(kPunct[byte - kAsciiCtrlBackslash]), mods | kControl));
  } else if (byte < 0x80) {
    emit(Key::character(byte, mods));
  } else if (const size_t len = utf8Length(byte); len >= 2) {
    mState = State::Utf8;
    mSequence.assign(1, static_cast<char>(byte));
    mUtf8Needed = len - 1;
    mUtf8Mods = mods;
  } else {
    emit(Key::character(kReplacementChar, mods));
  }
}

void KeyDecoder::csi(uint8_t final)
{
  int params[2] = { 0, 0 };
  size_t count = 0;
  bool inNumber = false;
  for (char ch : mSequence) {
    if (ch >= '0' && ch <= '9') {
      // Saturated, nothing meaningful is that large
      if (count < 2 && params[count] <= 0xFFFF)
        params[count] = params[count] * 10 + (ch - '0');
      inNumber = true;
    } else if (ch == ';') {
      ++count;
      inNumber = false;
    }
  }
  if (inNumber || count > 0)
    ++count;

  const KeyModifiers mods = count >= 2 && params[1] > 1 ? modifiersFromParam(params[1]) : kNone;

  switch (final) {
  case 'A': emit(Key { kUp, mods }); return;
  case 'B': emit(Key { kDown, mods }); return;
  case 'C': emit(Key { kRight, mods }); return;
  case 'D': emit(Key { kLeft, mods }); return;
  case 'H': emit(Key { kHome, mods }); return;
  case 'F': emit(Key { kEnd, mods }); return;
  case 'Z': emit(Key { kTab, kShift }); return;
  case '~':
    switch (params[0]) {
    case 1: case 7: emit(Key { kHome, mods }); return;
    case 4: case 8: emit(Key { kEnd, mods }); return;
    case 3: emit(Key { kDelete, mods }); return;
    case 5: emit(Key { kPageUp, mods }); return;
    case 6: emit(Key { kPageDown, mods }); return;
    default: return;
    }
  default:
    return;
  }
}

void KeyDecoder::ss3(uint8_t final)
{
  switch (final) {
  case 'A': emit(kUp); return;
  case 'B': emit(kDown); return;
  case 'C': emit(kRight); return;
  case 'D': emit(kLeft); return;
  case 'H': emit(kHome); return;
  case 'F': emit(kEnd); return;
  case 'M': emit(kSubmit); return; // keypad enter
  default: return;
  }
}

} // namespace ask
