//
// created by : Timothée Feuillet
// date: 2026-03-08
//
//
// Copyright (c) 2026 Timothée Feuillet
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace arguably::utf8
{
  /// \brief length (in bytes) of the encoded code point starting at str[offset]
  /// \return 0 if the sequence is truncated, overlong, a surrogate, out of range or not a lead byte
  inline size_t sequence_length(std::string_view str, size_t offset)
  {
    if (offset >= str.size())
      return 0;

    const uint8_t lead = (uint8_t)str[offset];
    size_t length = 0;
    uint32_t cp = 0;
    if (lead < 0x80) return 1;
    else if ((lead & 0xE0) == 0xC0) { length = 2; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { length = 3; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { length = 4; cp = lead & 0x07; }
    else return 0;

    if (offset + length > str.size())
      return 0;

    for (size_t i = 1; i < length; ++i)
    {
      const uint8_t cont = (uint8_t)str[offset + i];
      if ((cont & 0xC0) != 0x80)
        return 0;
      cp = (cp << 6) | (cont & 0x3F);
    }

    // overlong encodings:
    if ((length == 2 && cp < 0x80) || (length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000))
      return 0;
    // surrogates and out-of-range:
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
      return 0;
    return length;
  }

  inline bool is_valid(std::string_view str)
  {
    for (size_t i = 0; i < str.size();)
    {
      const size_t length = sequence_length(str, i);
      if (length == 0)
        return false;
      i += length;
    }
    return true;
  }

  /// \brief number of code points in a valid utf-8 string
  inline size_t count(std::string_view str)
  {
    size_t ret = 0;
    for (size_t i = 0; i < str.size(); ++ret)
    {
      const size_t length = sequence_length(str, i);
      i += (length == 0 ? 1 : length);
    }
    return ret;
  }
}
