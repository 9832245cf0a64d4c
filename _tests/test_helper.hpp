//
// created by : Timothée Feuillet
// date: 2026-03-09
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
#include <string>
#include <utility>
#include <vector>

#include "../cmdline/cmdline.hpp"
#include "../logger/logger.hpp"

namespace arguably::tests
{
  /// \brief thrown by the stubbed exit function
  struct exit_called
  {
    int status;
  };

  [[noreturn]] inline void throwing_exit(int status)
  {
    throw exit_called { status };
  }

  /// \brief while alive: exit throws exit_called, help/version and error output go to temporary files
  class exit_capture
  {
    public:
      exit_capture()
        : file(std::tmpfile()), error_file(std::tmpfile())
      {
        cmdline::set_exit_function(&throwing_exit);
        cmdline::set_help_output(file);
        cmdline::set_error_output(error_file);
      }
      ~exit_capture()
      {
        cmdline::set_exit_function(nullptr);
        cmdline::set_help_output(nullptr);
        cmdline::set_error_output(nullptr);
        if (file != nullptr)
          std::fclose(file);
        if (error_file != nullptr)
          std::fclose(error_file);
      }
      exit_capture(const exit_capture&) = delete;
      exit_capture& operator = (const exit_capture&) = delete;

      bool is_valid() const { return file != nullptr && error_file != nullptr; }

      /// \brief everything that has been printed to the help output so far
      std::string output() const { return read_all(file); }
      /// \brief everything that has been printed to the error output so far
      std::string error_output() const { return read_all(error_file); }

    private:
      static std::string read_all(std::FILE* f)
      {
        std::string ret;
        if (f == nullptr)
          return ret;
        std::fflush(f);
        std::rewind(f);
        char buffer[256];
        size_t read_size = 0;
        while ((read_size = std::fread(buffer, 1, sizeof(buffer), f)) > 0)
          ret.append(buffer, read_size);
        return ret;
      }

    private:
      std::FILE* file;
      std::FILE* error_file;
  };

  /// \brief run fnc, expect a cmdline::error of the given kind (and detail, if not empty)
  template<typename Fnc>
  bool expect_error(Fnc&& fnc, cmdline::error_kind kind, const std::string& detail = {})
  {
    try
    {
      fnc();
    }
    catch (const cmdline::error& e)
    {
      if (e.kind() != kind)
      {
        cr::out().error("expected an error of kind {}, got {}: {}", kind, e.kind(), e.what());
        return false;
      }
      if (!detail.empty() && e.message() != detail)
      {
        cr::out().error("expected error detail `{}`, got `{}`", detail, e.message());
        return false;
      }
      return true;
    }
    cr::out().error("expected an error of kind {}, got none", kind);
    return false;
  }

  /// \brief run fnc (with an exit_capture active), expect it to exit with status and print `expected_output`
  template<typename Fnc>
  bool expect_exit(Fnc&& fnc, int status, const std::string& expected_output)
  {
    exit_capture capture;
    if (!capture.is_valid())
    {
      cr::out().error("could not create a temporary file");
      return false;
    }
    try
    {
      fnc();
    }
    catch (const exit_called& e)
    {
      if (e.status != status)
      {
        cr::out().error("expected exit status {}, got {}", status, e.status);
        return false;
      }
      const std::string output = capture.output();
      if (output != expected_output)
      {
        cr::out().error("expected output `{}`, got `{}`", expected_output, output);
        return false;
      }
      return true;
    }
    catch (const cmdline::error& e)
    {
      cr::out().error("expected an exit, got the error: {}", e.what());
      return false;
    }
    cr::out().error("expected an exit, the function returned");
    return false;
  }

  /// \brief run all the tests, log the results. Return the exit code of the test program
  template<typename... Tests>
  int run_tests(const char* suite, Tests&&... tests)
  {
    unsigned failed = 0;
    const auto run_one = [&failed](const char* name, bool (*fnc)())
    {
      bool success = false;
      try
      {
        success = fnc();
      }
      catch (const cmdline::error& e)
      {
        cr::out().error("{}: unexpected error ({}): {}", name, e.kind(), e.what());
      }
      if (success)
        cr::out().log("[PASSED] {}", name);
      else
        cr::out().error("[FAILED] {}", name);
      failed += success ? 0 : 1;
    };
    (run_one(tests.first, tests.second), ...);
    if (failed > 0)
      cr::out().error("{}: {} test(s) failed", suite, failed);
    else
      cr::out().log("{}: all tests passed", suite);
    return failed > 0 ? 1 : 0;
  }
}

// { "name", &function }
#define A_TEST(fnc) std::pair<const char*, bool(*)()>{ #fnc, &fnc }
