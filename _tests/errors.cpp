#include "test_helper.hpp"
#include "../utf8.hpp"

using namespace arguably;

static bool unknown_names_on_the_command_line()
{
  bool success = true;
  success &= tests::expect_error([] { cmdline::parser().flag("flag f").parse({"--nope"}); },
                                 cmdline::error_kind::bad_name, "--nope is not a recognised flag or option name");
  success &= tests::expect_error([] { cmdline::parser().flag("flag f").parse({"-x"}); },
                                 cmdline::error_kind::bad_name, "-x is not a recognised flag or option name");
  success &= tests::expect_error([] { cmdline::parser().flag("flag f").parse({"-fxf"}); },
                                 cmdline::error_kind::bad_name, "'x' in -fxf is not a recognised flag or option name");
  success &= tests::expect_error([] { cmdline::parser().flag("flag f").parse({"-fλ"}); },
                                 cmdline::error_kind::bad_name, "'λ' in -fλ is not a recognised flag or option name");
  return success;
}

static bool unknown_names_in_queries()
{
  cmdline::parser p;
  p.flag("flag f").option("opt o");
  p.parse(std::vector<std::string>{});

  bool success = true;
  success &= tests::expect_error([&p] { (void)p.value("flag"); },
                                 cmdline::error_kind::bad_name, "'flag' is not a registered option name");
  success &= tests::expect_error([&p] { (void)p.values("nope"); },
                                 cmdline::error_kind::bad_name, "'nope' is not a registered option name");
  success &= tests::expect_error([&p] { (void)p.count("nope"); },
                                 cmdline::error_kind::bad_name, "'nope' is not a registered flag or option name");
  success &= tests::expect_error([&p] { (void)p.found("nope"); },
                                 cmdline::error_kind::bad_name, "'nope' is not a registered flag or option name");
  // count/found work with both flags and options
  success &= check::debug::a_check(p.count("flag") == 0 && p.count("opt") == 0, "count should work for flags and options");
  return success;
}

static bool partial_state_is_kept()
{
  // the parser stops at the first error, what was parsed before stays
  cmdline::parser p;
  p.flag("flag f").option("opt o");
  const bool has_error = tests::expect_error([&p] { p.parse({"-f", "pos", "--opt", "a", "--nope", "-f"}); },
                                             cmdline::error_kind::bad_name, "--nope is not a recognised flag or option name");

  bool success = has_error;
  success &= check::debug::a_check(p.count("flag") == 1, "flag: {}", p.count("flag"));
  success &= check::debug::a_check((p.values("opt") == std::vector<std::string>{"a"}), "opt: {}", p.values("opt"));
  success &= check::debug::a_check((p.args() == std::vector<std::string>{"pos"}), "args: {}", p.args());
  return success;
}

static bool error_descriptions()
{
  bool success = true;
  success &= check::debug::a_check(std::string(cmdline::error(cmdline::error_kind::missing_help_arg).what()) == "missing argument for the help command", "missing_help_arg message");
  success &= check::debug::a_check(std::string(cmdline::error(cmdline::error_kind::not_unicode).what()) == "arguments are not valid unicode strings", "not_unicode message");
  success &= check::debug::a_check(fmt::format("{}", cmdline::error_kind::missing_value) == "missing_value", "error_kind formatting");

  const cmdline::error e(cmdline::error_kind::missing_value, "missing value for --opt");
  const std::exception& base = e;
  success &= check::debug::a_check(std::string(base.what()) == "missing value for --opt", "what(): {}", base.what());
  return success;
}

static bool arg_stream_from_argv()
{
  std::string prog = "prog";
  std::string a = "--opt";
  std::string b = "value";
  char* argv[] = { prog.data(), a.data(), b.data(), nullptr };

  cmdline::arg_stream stream(3, argv);

  bool success = true;
  success &= check::debug::a_check(stream.remaining() == 2, "remaining: {}", stream.remaining());
  success &= check::debug::a_check(stream.has_next() && stream.next() == "--opt", "first argument should be --opt");
  success &= check::debug::a_check(stream.position() == 1, "position: {}", stream.position());
  success &= check::debug::a_check(stream.has_next() && stream.next() == "value", "second argument should be value");
  success &= check::debug::a_check(!stream.has_next(), "stream should be exhausted");

  cmdline::parser p;
  p.option("opt");
  p.parse(3, argv);
  success &= check::debug::a_check(p.value("opt") == "value", "opt: {}", p.value("opt").value_or("[none]"));
  return success;
}

static bool not_unicode()
{
  std::string prog = "prog";
  std::string good = "fine";
  std::string bad = "caf\xC3";    // truncated sequence
  std::string overlong = "\xC0\xAF";
  char* argv[] = { prog.data(), good.data(), bad.data(), nullptr };
  char* argv_overlong[] = { prog.data(), overlong.data(), nullptr };

  bool success = true;
  success &= tests::expect_error([&argv] { cmdline::parser().parse(3, argv); },
                                 cmdline::error_kind::not_unicode, "arguments are not valid unicode strings");
  success &= tests::expect_error([&argv_overlong] { cmdline::parser().parse(2, argv_overlong); },
                                 cmdline::error_kind::not_unicode);

  // the program name is never looked at
  std::string bad_prog = "\xFF";
  char* argv_bad_prog[] = { bad_prog.data(), nullptr };
  cmdline::parser p;
  p.parse(1, argv_bad_prog);
  success &= check::debug::a_check(!p.has_args(), "args: {}", p.args());
  return success;
}

static bool utf8_helpers()
{
  bool success = true;
  success &= check::debug::a_check(utf8::is_valid("plain"), "ascii is valid");
  success &= check::debug::a_check(utf8::is_valid("λ€😀"), "multi-byte is valid");
  success &= check::debug::a_check(!utf8::is_valid("\xED\xA0\x80"), "surrogates are invalid");
  success &= check::debug::a_check(!utf8::is_valid("\xF4\x90\x80\x80"), "out of range is invalid");
  success &= check::debug::a_check(!utf8::is_valid("\x80"), "lone continuation byte is invalid");
  success &= check::debug::a_check(utf8::count("-λ€😀") == 4, "count: {}", utf8::count("-λ€😀"));
  success &= check::debug::a_check(utf8::sequence_length("😀", 0) == 4, "sequence length");
  return success;
}

int main(int, char**)
{
  return tests::run_tests("errors",
    A_TEST(unknown_names_on_the_command_line),
    A_TEST(unknown_names_in_queries),
    A_TEST(partial_state_is_kept),
    A_TEST(error_descriptions),
    A_TEST(arg_stream_from_argv),
    A_TEST(not_unicode),
    A_TEST(utf8_helpers)
  );
}
