#include "test_helper.hpp"

using namespace arguably;

static bool arguments_empty_input()
{
  cmdline::parser p;
  p.parse(std::vector<std::string>{});

  bool success = true;
  success &= check::debug::a_check(!p.has_args(), "args: {}", p.args());
  success &= check::debug::a_check(p.num_args() == 0, "args: {}", p.args());
  return success;
}

static bool arguments_found()
{
  cmdline::parser p;
  p.parse({"foo", "bar"});
  return check::debug::a_check((p.args() == std::vector<std::string>{"foo", "bar"}), "args: {}", p.args());
}

static bool arguments_dash_and_numbers()
{
  cmdline::parser p;
  p.parse({"-", "-42", "plain", "-1.5", "-0"});
  return check::debug::a_check((p.args() == std::vector<std::string>{"-", "-42", "plain", "-1.5", "-0"}), "args: {}", p.args());
}

static bool arguments_end_of_options()
{
  cmdline::parser p;
  p.option("opt o");
  p.parse({"--opt=hello", "--", "--opt=ignored"});

  bool success = true;
  success &= check::debug::a_check((p.values("opt") == std::vector<std::string>{"hello"}), "values: {}", p.values("opt"));
  success &= check::debug::a_check((p.args() == std::vector<std::string>{"--opt=ignored"}), "args: {}", p.args());
  return success;
}

static bool arguments_after_sentinel_are_verbatim()
{
  cmdline::parser p;
  p.flag("flag f");
  p.command("cmd", cmdline::parser());
  p.parse({"--", "cmd", "-f", "--", "--unknown", "-"});

  bool success = true;
  success &= check::debug::a_check(!p.has_cmd(), "no command should be matched");
  success &= check::debug::a_check(!p.found("flag"), "flag should not be found");
  success &= check::debug::a_check((p.args() == std::vector<std::string>{"cmd", "-f", "--", "--unknown", "-"}), "args: {}", p.args());
  return success;
}

static bool arguments_keep_order()
{
  cmdline::parser p;
  p.flag("flag f").option("opt o");
  p.parse({"a", "-f", "b", "-o", "x", "c", "--flag", "d"});

  bool success = true;
  success &= check::debug::a_check((p.args() == std::vector<std::string>{"a", "b", "c", "d"}), "args: {}", p.args());
  success &= check::debug::a_check(p.count("flag") == 2, "flag: {}", p.count("flag"));
  return success;
}

int main(int, char**)
{
  return tests::run_tests("positionals",
    A_TEST(arguments_empty_input),
    A_TEST(arguments_found),
    A_TEST(arguments_dash_and_numbers),
    A_TEST(arguments_end_of_options),
    A_TEST(arguments_after_sentinel_are_verbatim),
    A_TEST(arguments_keep_order)
  );
}
