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
#include <string_view>
#include <vector>

#include "../debug/assert.hpp"
#include "../utf8.hpp"
#include "error.hpp"

namespace arguably::cmdline
{
  /// \brief single-pass cursor over the command-line arguments
  /// The same stream is handed (by reference) to the sub-command parsers,
  /// so that they continue from where the parent stopped.
  class arg_stream
  {
    public:
      explicit arg_stream(std::vector<std::string> _args) : args(std::move(_args)) {}

      /// \brief read the arguments from the OS. Skips the program name.
      /// \throw error (not_unicode) when an argument is not valid utf-8
      arg_stream(int argc, char** argv)
      {
        if (argc > 1)
          args.reserve((unsigned)argc - 1);
        for (int i = 1; i < argc; ++i)
        {
          const std::string_view arg = argv[i];
          if (!utf8::is_valid(arg))
            throw error(error_kind::not_unicode);
          args.emplace_back(arg);
        }
      }

      bool has_next() const { return index < args.size(); }

      /// \brief return the current argument and advance
      /// \note has_next() must be true
      std::string next()
      {
        check::debug::a_assert(has_next(), "arg_stream::next called on an exhausted stream (position: {})", index);
        return args[index++];
      }

      size_t remaining() const { return args.size() - index; }
      size_t position() const { return index; }

    private:
      std::vector<std::string> args;
      size_t index = 0;
  };
}
