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

#include <string>

#include <fmt/format.h>

#include "../exception.hpp"

namespace arguably::cmdline
{
  enum class error_kind
  {
    // unregistered flag, option or command name (on the command line or in a query)
    bad_name,
    // an option was found without a value
    missing_value,
    // the help command was found without a command name
    missing_help_arg,
    // the arguments given by the OS are not valid utf-8
    not_unicode,
  };

  const char* error_kind_to_str(error_kind k);

  /// \brief the error raised by parse() and by the query functions of parser
  /// what() returns the detail message (without the "Error: " prefix)
  class error : public arguably::exception
  {
    public:
      error(error_kind _kind, std::string detail);
      /// \brief use the default message for kinds that have one (missing_help_arg, not_unicode)
      explicit error(error_kind _kind);

      error_kind kind() const noexcept { return kd; }

      /// \brief print "Error: <message>." to stderr and exit with status 1
      /// \note goes through the exit function (see exit.hpp)
      [[noreturn]] void exit() const;

    private:
      error_kind kd;
  };
}

template<> struct fmt::formatter<arguably::cmdline::error_kind> : fmt::formatter<std::string_view>
{
  template <typename FormatContext>
  auto format(arguably::cmdline::error_kind v, FormatContext& ctx) const
  {
    return fmt::formatter<std::string_view>::format(arguably::cmdline::error_kind_to_str(v), ctx);
  }
};
