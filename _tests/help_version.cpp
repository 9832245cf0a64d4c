#include "test_helper.hpp"

using namespace arguably;

static cmdline::parser make_parser()
{
  cmdline::parser p;
  p.help_text("\n  Usage: foobar [--quiet] <file>\n\n")
   .version("  1.0 \n")
   .flag("quiet q");
  return p;
}

static bool help_long_and_short()
{
  bool success = true;
  success &= tests::expect_exit([] { make_parser().parse({"--help"}); }, 0, "Usage: foobar [--quiet] <file>\n");
  success &= tests::expect_exit([] { make_parser().parse({"-h"}); }, 0, "Usage: foobar [--quiet] <file>\n");
  // anything after --help is never looked at
  success &= tests::expect_exit([] { make_parser().parse({"-q", "--help", "--unknown"}); }, 0, "Usage: foobar [--quiet] <file>\n");
  // in a cluster
  success &= tests::expect_exit([] { make_parser().parse({"-qh"}); }, 0, "Usage: foobar [--quiet] <file>\n");
  return success;
}

static bool version_long_and_short()
{
  bool success = true;
  success &= tests::expect_exit([] { make_parser().parse({"--version"}); }, 0, "1.0\n");
  success &= tests::expect_exit([] { make_parser().parse({"-v"}); }, 0, "1.0\n");
  return success;
}

static bool help_and_version_unset()
{
  bool success = true;
  success &= tests::expect_error([] { cmdline::parser().parse({"--help"}); },
                                 cmdline::error_kind::bad_name, "--help is not a recognised flag or option name");
  success &= tests::expect_error([] { cmdline::parser().parse({"-h"}); },
                                 cmdline::error_kind::bad_name, "-h is not a recognised flag or option name");
  success &= tests::expect_error([] { cmdline::parser().parse({"--version"}); },
                                 cmdline::error_kind::bad_name, "--version is not a recognised flag or option name");
  success &= tests::expect_error([] { cmdline::parser().parse({"-v"}); },
                                 cmdline::error_kind::bad_name, "-v is not a recognised flag or option name");
  return success;
}

static bool registered_names_win()
{
  // -h and -v are only built-ins when not registered
  cmdline::parser p;
  p.help_text("help")
   .version("1.0")
   .flag("human h")
   .option("verbosity v");
  p.parse({"-h", "-v", "2"});

  bool success = true;
  success &= check::debug::a_check(p.found("human"), "human should be found");
  success &= check::debug::a_check(p.value("verbosity") == "2", "verbosity: {}", p.value("verbosity").value_or("[none]"));
  // --help still works
  success &= tests::expect_exit([]
  {
    cmdline::parser p;
    p.help_text("help").flag("human h");
    p.parse({"--help"});
  }, 0, "help\n");
  return success;
}

static bool help_command()
{
  const auto make = []
  {
    cmdline::parser p;
    p.help_text("Usage: app <command>")
     .enable_help_command()
     .command("boo b", cmdline::parser().help_text("  Usage: app boo  "))
     .command("far", cmdline::parser());
    return p;
  };

  bool success = true;
  success &= tests::expect_exit([&make] { make().parse({"help", "boo"}); }, 0, "Usage: app boo\n");
  success &= tests::expect_exit([&make] { make().parse({"help", "b", "ignored"}); }, 0, "Usage: app boo\n");
  // no help text: empty line
  success &= tests::expect_exit([&make] { make().parse({"help", "far"}); }, 0, "\n");
  success &= tests::expect_error([&make] { make().parse({"help"}); },
                                 cmdline::error_kind::missing_help_arg, "missing argument for the help command");
  success &= tests::expect_error([&make] { make().parse({"help", "nope"}); },
                                 cmdline::error_kind::bad_name, "'nope' is not a recognised command name");
  // only as the first argument
  {
    cmdline::parser p = make();
    p.parse({"foo", "help", "boo"});
    success &= check::debug::a_check((p.args() == std::vector<std::string>{"foo", "help", "boo"}), "args: {}", p.args());
  }
  return success;
}

static bool help_command_disabled()
{
  cmdline::parser p;
  p.command("boo", cmdline::parser().help_text("Usage: app boo"));
  p.parse({"help", "boo"});
  return check::debug::a_check((p.args() == std::vector<std::string>{"help", "boo"}), "args: {}", p.args());
}

static bool command_help()
{
  // --help in a command prints the help of the command
  bool success = true;
  success &= tests::expect_exit([]
  {
    cmdline::parser p;
    p.help_text("outer").command("cmd", cmdline::parser().help_text("inner"));
    p.parse({"cmd", "--help"});
  }, 0, "inner\n");
  return success;
}

static bool error_exit()
{
  tests::exit_capture capture;
  if (!check::debug::a_check(capture.is_valid(), "could not create the temporary files"))
    return false;
  try
  {
    cmdline::error(cmdline::error_kind::bad_name, "--foo is not a recognised flag or option name").exit();
  }
  catch (const tests::exit_called& e)
  {
    bool success = true;
    success &= check::debug::a_check(e.status == 1, "exit status: {}", e.status);
    success &= check::debug::a_check(capture.error_output() == "Error: --foo is not a recognised flag or option name.\n",
                                     "error output: `{}`", capture.error_output());
    success &= check::debug::a_check(capture.output().empty(), "help output: `{}`", capture.output());
    return success;
  }
  return false;
}

static bool error_exit_default_message()
{
  tests::exit_capture capture;
  try
  {
    cmdline::error(cmdline::error_kind::missing_help_arg).exit();
  }
  catch (const tests::exit_called& e)
  {
    bool success = true;
    success &= check::debug::a_check(e.status == 1, "exit status: {}", e.status);
    success &= check::debug::a_check(capture.error_output() == "Error: missing argument for the help command.\n",
                                     "error output: `{}`", capture.error_output());
    return success;
  }
  return false;
}

int main(int, char**)
{
  return tests::run_tests("help_version",
    A_TEST(help_long_and_short),
    A_TEST(version_long_and_short),
    A_TEST(help_and_version_unset),
    A_TEST(registered_names_win),
    A_TEST(help_command),
    A_TEST(help_command_disabled),
    A_TEST(command_help),
    A_TEST(error_exit),
    A_TEST(error_exit_default_message)
  );
}
