//
// created by : Timothée Feuillet
// date: 2021-11-24
//
//
// Copyright (c) 2021 Timothée Feuillet
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

#include <cstdlib>
#include <source_location>
#include <utility>

#include "../logger/logger.hpp"

#ifndef ARGUABLY_ALLOW_DEBUG
  #define ARGUABLY_ALLOW_DEBUG false
#endif

#ifndef ARGUABLY_DISABLE_CHECKS
  #define ARGUABLY_DISABLE_CHECKS 0
#endif


namespace arguably::debug
{
  /// \brief log-and-continue (_check) or log-and-abort (_assert) helpers
  /// Usage: check::debug::a_check(cond, "message {}", arg)
  class on_error
  {
    public:
      on_error() = delete;

#if !ARGUABLY_DISABLE_CHECKS
      template<typename... Args>
      static void _assert(std::source_location sloc, const bool test, const char* test_str, fmt::format_string<Args...> message, Args&&... args)
      {
        [[unlikely]] if (ARGUABLY_ALLOW_DEBUG && test && cr::get_global_logger().can_log(cr::logger::severity::debug))
        {
          cr::out().log_fmt(cr::logger::severity::debug, sloc, "[ASSERT PASSED: {0}]", test_str);
          return;
        }
        [[likely]] if (test)
          return;

        cr::out().log_fmt(cr::logger::severity::critical, sloc, "[ASSERT FAILED: {0}]: {1}", test_str, fmt::format(std::move(message), std::forward<Args>(args)...));
        std::abort();
      }

      template<typename... Args>
      static bool _check(std::source_location sloc, const bool test, const char* test_str, fmt::format_string<Args...> message, Args&&... args)
      {
        [[unlikely]] if (ARGUABLY_ALLOW_DEBUG && test && cr::get_global_logger().can_log(cr::logger::severity::debug))
        {
          cr::out().log_fmt(cr::logger::severity::debug, sloc, "[CHECK  PASSED: {0}]", test_str);
          return test;
        }
        [[likely]] if (test)
          return test;

        cr::out().log_fmt(cr::logger::severity::error, sloc, "[CHECK  FAILED: {0}]: {1}", test_str, fmt::format(std::move(message), std::forward<Args>(args)...));
        return test;
      }
#endif

      static void _dummy() {}
      static bool _dummy(bool r) { return r; }
  };
}

#if !ARGUABLY_DISABLE_CHECKS

#define a_assert(test, ...)       _assert(std::source_location::current(), test, #test, __VA_ARGS__)
#define a_check(test, ...)        _check(std::source_location::current(), test, #test, __VA_ARGS__)

#else // ARGUABLY_DISABLE_CHECKS

#define a_assert(test, ...)       _dummy()
#define a_check(test, ...)        _dummy(test)

#endif

namespace arguably::check
{
  using debug = arguably::debug::on_error;
}
