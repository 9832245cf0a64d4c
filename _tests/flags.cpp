#include "test_helper.hpp"

using namespace arguably;

static bool flag_empty_input()
{
  cmdline::parser p;
  p.flag("flag f");
  p.parse(std::vector<std::string>{});

  bool success = true;
  success &= check::debug::a_check(!p.found("flag"), "flag should not be found");
  success &= check::debug::a_check(p.count("flag") == 0, "count is {}", p.count("flag"));
  return success;
}

static bool flag_missing()
{
  cmdline::parser p;
  p.flag("flag f");
  p.parse({"foo", "bar"});

  bool success = true;
  success &= check::debug::a_check(!p.found("flag"), "flag should not be found");
  success &= check::debug::a_check((p.args() == std::vector<std::string>{"foo", "bar"}), "args: {}", p.args());
  return success;
}

static bool flag_long_and_short()
{
  bool success = true;
  {
    cmdline::parser p;
    p.flag("flag f");
    p.parse({"--flag"});
    success &= check::debug::a_check(p.count("flag") == 1, "--flag: count is {}", p.count("flag"));
  }
  {
    cmdline::parser p;
    p.flag("flag f");
    p.parse({"-f"});
    success &= check::debug::a_check(p.count("f") == 1, "-f: count is {}", p.count("f"));
    success &= check::debug::a_check(p.found("flag"), "-f: flag should be found through its long name");
  }
  return success;
}

static bool flag_condensed_and_mixed()
{
  cmdline::parser p;
  p.flag("flag f");
  p.parse({"-fff", "--flag"});

  bool success = true;
  success &= check::debug::a_check(p.count("flag") == 4, "count is {}", p.count("flag"));
  success &= check::debug::a_check(p.found("flag"), "flag should be found");
  success &= check::debug::a_check(p.args().empty(), "args: {}", p.args());
  return success;
}

static bool flag_cluster_of_different_flags()
{
  cmdline::parser p;
  p.flag("all a")
   .flag("brief b")
   .flag("color c");
  p.parse({"-abc", "-ca", "--brief", "pos"});

  bool success = true;
  success &= check::debug::a_check(p.count("all") == 2, "all: {}", p.count("all"));
  success &= check::debug::a_check(p.count("brief") == 2, "brief: {}", p.count("brief"));
  success &= check::debug::a_check(p.count("c") == 2, "color: {}", p.count("c"));
  success &= check::debug::a_check((p.args() == std::vector<std::string>{"pos"}), "args: {}", p.args());
  return success;
}

static bool flag_many_aliases()
{
  // every alias counts towards the same entry
  cmdline::parser p;
  p.flag("  verbose\tv   loud ");
  p.parse({"--verbose", "-vv", "--loud"});

  bool success = true;
  success &= check::debug::a_check(p.count("verbose") == 4, "verbose: {}", p.count("verbose"));
  success &= check::debug::a_check(p.count("loud") == 4, "loud: {}", p.count("loud"));
  success &= check::debug::a_check(p.count("v") == 4, "v: {}", p.count("v"));
  return success;
}

static bool flag_duplicate_alias()
{
  // last registration wins
  cmdline::parser p;
  p.flag("quiet q")
   .flag("quick q");
  p.parse({"-q", "--quiet"});

  bool success = true;
  success &= check::debug::a_check(p.count("quick") == 1, "quick: {}", p.count("quick"));
  success &= check::debug::a_check(p.count("quiet") == 1, "quiet: {}", p.count("quiet"));
  return success;
}

static bool flag_unicode_shortcut()
{
  cmdline::parser p;
  p.flag("lambda λ")
   .flag("x");
  p.parse({"-λxλ"});

  bool success = true;
  success &= check::debug::a_check(p.count("lambda") == 2, "lambda: {}", p.count("lambda"));
  success &= check::debug::a_check(p.count("x") == 1, "x: {}", p.count("x"));
  return success;
}

static bool flag_identical_registrations()
{
  // separate instances with the same registration end up in the same state
  const auto make = []
  {
    cmdline::parser p;
    p.flag("flag f").option("opt o");
    return p;
  };
  cmdline::parser a = make();
  cmdline::parser b = make();
  a.parse({"-f", "-o", "x", "y"});
  b.parse({"-f", "-o", "x", "y"});

  bool success = true;
  success &= check::debug::a_check(a.count("flag") == b.count("flag"), "flag counts differ");
  success &= check::debug::a_check(a.values("opt") == b.values("opt"), "option values differ");
  success &= check::debug::a_check(a.args() == b.args(), "args differ");
  return success;
}

int main(int, char**)
{
  return tests::run_tests("flags",
    A_TEST(flag_empty_input),
    A_TEST(flag_missing),
    A_TEST(flag_long_and_short),
    A_TEST(flag_condensed_and_mixed),
    A_TEST(flag_cluster_of_different_flags),
    A_TEST(flag_many_aliases),
    A_TEST(flag_duplicate_alias),
    A_TEST(flag_unicode_shortcut),
    A_TEST(flag_identical_registrations)
  );
}
