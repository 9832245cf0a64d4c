//
// created by : Timothée Feuillet
// date: 2022-5-21
//
//
// Copyright (c) 2022 Timothée Feuillet
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

#include <string>
#include <string_view>
#include <vector>
#include <regex>

namespace arguably::cr
{
  [[maybe_unused]] static std::vector<std::string> split_string(const std::string& input, const std::string& regex)
  {
    // passing -1 as the submatch index parameter performs splitting
    std::regex re(regex);
    std::sregex_token_iterator
        first{input.begin(), input.end(), re, -1},
        last;
    return {first, last};
  }

  inline bool is_ascii_space(char c)
  {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
  }

  /// \brief split on any run of whitespace, empty entries are never returned
  /// (so "  a  b " gives { "a", "b" } and "" or " " gives {})
  inline std::vector<std::string> split_whitespace(std::string_view input)
  {
    std::vector<std::string> ret;
    size_t i = 0;
    while (i < input.size())
    {
      while (i < input.size() && is_ascii_space(input[i])) ++i;
      const size_t start = i;
      while (i < input.size() && !is_ascii_space(input[i])) ++i;
      if (i > start)
        ret.emplace_back(input.substr(start, i - start));
    }
    return ret;
  }

  /// \brief remove leading and trailing whitespace
  inline std::string_view trim(std::string_view input)
  {
    size_t start = 0;
    while (start < input.size() && is_ascii_space(input[start])) ++start;
    size_t end = input.size();
    while (end > start && is_ascii_space(input[end - 1])) --end;
    return input.substr(start, end - start);
  }
}

