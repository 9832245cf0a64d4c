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

#include <cstdlib>

#include <fmt/format.h>

#include "exit.hpp"
#include "../container_utils.hpp"
#include "../logger/logger.hpp"

namespace arguably::cmdline
{
  namespace
  {
    exit_fnc exit_function = nullptr;
    std::FILE* help_output = nullptr;
    std::FILE* error_output = nullptr;
  }

  void set_exit_function(exit_fnc fnc)
  {
    exit_function = fnc;
  }

  void set_help_output(std::FILE* output)
  {
    help_output = output;
  }

  std::FILE* get_help_output()
  {
    return help_output != nullptr ? help_output : stdout;
  }

  void set_error_output(std::FILE* output)
  {
    error_output = output;
  }

  std::FILE* get_error_output()
  {
    return error_output != nullptr ? error_output : stderr;
  }

  void exit_process(int status)
  {
    cr::out().debug("cmdline: exiting with status {}", status);
    if (exit_function != nullptr)
      exit_function(status);
    std::exit(status);
  }

  void print_and_exit(std::string_view text)
  {
    std::FILE* output = get_help_output();
    fmt::print(output, "{}\n", cr::trim(text));
    std::fflush(output);
    exit_process(0);
  }
}
