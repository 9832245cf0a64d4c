#include "test_helper.hpp"

using namespace arguably;

static bool option_empty_input()
{
  cmdline::parser p;
  p.option("opt o");
  p.parse(std::vector<std::string>{});

  bool success = true;
  success &= check::debug::a_check(!p.found("opt"), "option should not be found");
  success &= check::debug::a_check(!p.value("opt").has_value(), "value should be empty");
  success &= check::debug::a_check(p.values("opt").empty(), "values: {}", p.values("opt"));
  return success;
}

static bool option_long_and_short()
{
  cmdline::parser p;
  p.option("opt o");
  p.parse({"-o", "foo", "--opt", "bar"});

  bool success = true;
  success &= check::debug::a_check(p.count("opt") == 2, "count is {}", p.count("opt"));
  success &= check::debug::a_check((p.values("opt") == std::vector<std::string>{"foo", "bar"}), "values: {}", p.values("opt"));
  success &= check::debug::a_check(p.value("opt") == "bar", "value: {}", p.value("opt").value_or("[none]"));
  success &= check::debug::a_check(p.args().empty(), "args: {}", p.args());
  return success;
}

static bool option_inline_values()
{
  cmdline::parser p;
  p.option("opt o");
  p.parse({"--opt=a", "-o=b", "--opt=c=d", "---opt=e"});

  bool success = true;
  success &= check::debug::a_check((p.values("o") == std::vector<std::string>{"a", "b", "c=d", "e"}), "values: {}", p.values("o"));
  return success;
}

static bool option_value_taken_verbatim()
{
  // whatever follows an option is its value, even when it looks like a flag
  cmdline::parser p;
  p.option("opt o")
   .flag("flag f");
  p.parse({"--opt", "--flag", "-o", "-f", "-o", "--"});

  bool success = true;
  success &= check::debug::a_check((p.values("opt") == std::vector<std::string>{"--flag", "-f", "--"}), "values: {}", p.values("opt"));
  success &= check::debug::a_check(!p.found("flag"), "flag should not be found");
  return success;
}

static bool option_trailing_in_cluster()
{
  cmdline::parser p;
  p.flag("all a")
   .flag("brief b")
   .option("output o");
  p.parse({"-abo", "file.txt", "pos"});

  bool success = true;
  success &= check::debug::a_check(p.count("all") == 1, "all: {}", p.count("all"));
  success &= check::debug::a_check(p.count("brief") == 1, "brief: {}", p.count("brief"));
  success &= check::debug::a_check(p.value("output") == "file.txt", "output: {}", p.value("output").value_or("[none]"));
  success &= check::debug::a_check((p.args() == std::vector<std::string>{"pos"}), "args: {}", p.args());
  return success;
}

static bool option_two_in_cluster()
{
  // each option of the cluster takes the next argument, in order
  cmdline::parser p;
  p.option("input i")
   .option("output o");
  p.parse({"-io", "in.txt", "out.txt"});

  bool success = true;
  success &= check::debug::a_check(p.value("input") == "in.txt", "input: {}", p.value("input").value_or("[none]"));
  success &= check::debug::a_check(p.value("output") == "out.txt", "output: {}", p.value("output").value_or("[none]"));
  return success;
}

static bool option_default_value()
{
  bool success = true;
  {
    cmdline::parser p;
    p.option("level l", "3");
    p.parse(std::vector<std::string>{});
    success &= check::debug::a_check(p.value("level") == "3", "level: {}", p.value("level").value_or("[none]"));
    success &= check::debug::a_check(p.count("level") == 0, "count is {}", p.count("level"));
    success &= check::debug::a_check(!p.found("level"), "the default value is not an occurrence");
    success &= check::debug::a_check(p.values("level").empty(), "values: {}", p.values("level"));
  }
  {
    cmdline::parser p;
    p.option("level l", "3");
    p.parse({"-l", "7"});
    success &= check::debug::a_check(p.value("level") == "7", "level: {}", p.value("level").value_or("[none]"));
  }
  return success;
}

static bool option_missing_value()
{
  bool success = true;
  success &= tests::expect_error([]
  {
    cmdline::parser p;
    p.option("opt o");
    p.parse({"--opt"});
  }, cmdline::error_kind::missing_value, "missing value for --opt");

  success &= tests::expect_error([]
  {
    cmdline::parser p;
    p.option("opt o");
    p.parse({"-o"});
  }, cmdline::error_kind::missing_value, "missing value for -o");

  success &= tests::expect_error([]
  {
    cmdline::parser p;
    p.option("opt o").flag("a");
    p.parse({"-ao"});
  }, cmdline::error_kind::missing_value, "missing value for 'o' in -ao");

  success &= tests::expect_error([]
  {
    cmdline::parser p;
    p.option("opt o");
    p.parse({"--opt="});
  }, cmdline::error_kind::missing_value, "missing value for --opt");

  success &= tests::expect_error([]
  {
    cmdline::parser p;
    p.option("opt o");
    p.parse({"-o="});
  }, cmdline::error_kind::missing_value, "missing value for -o");
  return success;
}

static bool option_unknown_inline()
{
  bool success = true;
  success &= tests::expect_error([]
  {
    cmdline::parser p;
    p.option("opt o");
    p.parse({"--other=value"});
  }, cmdline::error_kind::bad_name, "--other is not a recognised option name");

  // flags cannot take inline values
  success &= tests::expect_error([]
  {
    cmdline::parser p;
    p.flag("flag f");
    p.parse({"-f=1"});
  }, cmdline::error_kind::bad_name, "-f is not a recognised option name");
  return success;
}

int main(int, char**)
{
  return tests::run_tests("options",
    A_TEST(option_empty_input),
    A_TEST(option_long_and_short),
    A_TEST(option_inline_values),
    A_TEST(option_value_taken_verbatim),
    A_TEST(option_trailing_in_cluster),
    A_TEST(option_two_in_cluster),
    A_TEST(option_default_value),
    A_TEST(option_missing_value),
    A_TEST(option_unknown_inline)
  );
}
