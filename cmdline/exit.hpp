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

#include <cstdio>
#include <string_view>

// process termination for --help / --version / help <cmd> and error::exit()
// The exit function, the help output and the error output can all be swapped (tests do that to observe help output
// without terminating the process: their exit function throws).
namespace arguably::cmdline
{
  using exit_fnc = void(*)(int status);

  /// \brief set the function called to terminate the process (std::exit by default)
  /// \note passing nullptr restores the default.
  /// \note the function must not return. If it does, std::exit is called right after it.
  void set_exit_function(exit_fnc fnc);

  /// \brief set where print_and_exit writes (stdout by default, nullptr restores it)
  void set_help_output(std::FILE* output);
  std::FILE* get_help_output();

  /// \brief set where error::exit writes (stderr by default, nullptr restores it)
  void set_error_output(std::FILE* output);
  std::FILE* get_error_output();

  /// \brief end the process through the exit function
  [[noreturn]] void exit_process(int status);

  /// \brief print the whitespace-trimmed text (+ a newline) to the help output, then exit with status 0
  [[noreturn]] void print_and_exit(std::string_view text);
}
