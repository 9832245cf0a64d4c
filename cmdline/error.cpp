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

#include <cstdio>

#include <fmt/format.h>

#include "error.hpp"
#include "exit.hpp"

namespace arguably::cmdline
{
  const char* error_kind_to_str(error_kind k)
  {
    switch (k)
    {
      case error_kind::bad_name: return "bad_name";
      case error_kind::missing_value: return "missing_value";
      case error_kind::missing_help_arg: return "missing_help_arg";
      case error_kind::not_unicode: return "not_unicode";
    }
    return "unknown";
  }

  static std::string default_message(error_kind k)
  {
    switch (k)
    {
      case error_kind::missing_help_arg: return "missing argument for the help command";
      case error_kind::not_unicode: return "arguments are not valid unicode strings";
      default: break;
    }
    return error_kind_to_str(k);
  }

  error::error(error_kind _kind, std::string detail)
    : arguably::exception(std::move(detail)), kd(_kind)
  {
  }

  error::error(error_kind _kind)
    : error(_kind, default_message(_kind))
  {
  }

  void error::exit() const
  {
    std::FILE* output = get_error_output();
    fmt::print(output, "Error: {}.\n", message());
    std::fflush(output);
    exit_process(1);
  }
}
