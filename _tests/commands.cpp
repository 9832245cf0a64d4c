#include "test_helper.hpp"

using namespace arguably;

static bool command_missing()
{
  cmdline::parser p;
  p.command("cmd", cmdline::parser());
  p.parse({"foo", "bar"});

  bool success = true;
  success &= check::debug::a_check(!p.has_cmd(), "no command should be matched");
  success &= check::debug::a_check(!p.cmd_name().has_value(), "no command name expected");
  success &= check::debug::a_check(p.cmd_parser() == nullptr, "no command parser expected");
  success &= check::debug::a_check(p.num_args() == 2, "args: {}", p.args());
  return success;
}

static bool command_found()
{
  cmdline::parser p;
  p.command("cmd", cmdline::parser().flag("x"));
  p.parse({"cmd", "-x", "pos"});

  bool success = true;
  success &= check::debug::a_check(p.cmd_name() == "cmd", "command name: {}", p.cmd_name().value_or("[none]"));
  success &= check::debug::a_check(p.args().empty(), "outer args: {}", p.args());
  const cmdline::parser* cmd = p.cmd_parser();
  if (!check::debug::a_check(cmd != nullptr, "the command parser should be available"))
    return false;
  success &= check::debug::a_check(cmd->count("x") == 1, "x: {}", cmd->count("x"));
  success &= check::debug::a_check((cmd->args() == std::vector<std::string>{"pos"}), "command args: {}", cmd->args());
  return success;
}

static bool command_alias()
{
  cmdline::parser p;
  p.command("remove rm", cmdline::parser().flag("force f"));
  p.parse({"rm", "-f"});

  bool success = true;
  success &= check::debug::a_check(p.cmd_name() == "rm", "command name: {}", p.cmd_name().value_or("[none]"));
  success &= check::debug::a_check(p.cmd_parser() != nullptr && p.cmd_parser()->found("force"), "force should be found in the command");
  return success;
}

static bool command_only_first_argument()
{
  bool success = true;
  {
    // a command name in second position is a positional argument
    cmdline::parser p;
    p.command("cmd", cmdline::parser());
    p.parse({"foo", "cmd"});
    success &= check::debug::a_check(!p.has_cmd(), "no command should be matched");
    success &= check::debug::a_check((p.args() == std::vector<std::string>{"foo", "cmd"}), "args: {}", p.args());
  }
  {
    // options before the command name count as the first argument too
    cmdline::parser p;
    p.flag("verbose v");
    p.command("cmd", cmdline::parser());
    p.parse({"-v", "cmd"});
    success &= check::debug::a_check(!p.has_cmd(), "no command should be matched");
    success &= check::debug::a_check(p.found("verbose"), "verbose should be found");
    success &= check::debug::a_check((p.args() == std::vector<std::string>{"cmd"}), "args: {}", p.args());
  }
  return success;
}

static bool command_owns_the_rest()
{
  // everything after the command belongs to the command, including `--`
  cmdline::parser p;
  p.flag("verbose v");
  p.command("build b", cmdline::parser().flag("verbose v").option("jobs j"));
  p.parse({"build", "-vj", "4", "target", "--", "-v"});

  bool success = true;
  success &= check::debug::a_check(p.count("verbose") == 0, "outer verbose: {}", p.count("verbose"));
  success &= check::debug::a_check(p.args().empty(), "outer args: {}", p.args());
  const cmdline::parser* cmd = p.cmd_parser();
  if (!check::debug::a_check(cmd != nullptr, "the command parser should be available"))
    return false;
  success &= check::debug::a_check(cmd->count("verbose") == 1, "command verbose: {}", cmd->count("verbose"));
  success &= check::debug::a_check(cmd->value("jobs") == "4", "jobs: {}", cmd->value("jobs").value_or("[none]"));
  success &= check::debug::a_check((cmd->args() == std::vector<std::string>{"target", "-v"}), "command args: {}", cmd->args());
  return success;
}

static bool command_nested()
{
  cmdline::parser p;
  p.command("remote", cmdline::parser()
    .command("add", cmdline::parser().flag("fetch f"))
    .command("remove", cmdline::parser()));
  p.parse({"remote", "add", "-f", "origin", "url"});

  bool success = true;
  const cmdline::parser* remote = p.cmd_parser();
  if (!check::debug::a_check(remote != nullptr, "remote should be matched"))
    return false;
  success &= check::debug::a_check(remote->cmd_name() == "add", "remote command: {}", remote->cmd_name().value_or("[none]"));
  const cmdline::parser* add = remote->cmd_parser();
  if (!check::debug::a_check(add != nullptr, "add should be matched"))
    return false;
  success &= check::debug::a_check(add->found("fetch"), "fetch should be found");
  success &= check::debug::a_check((add->args() == std::vector<std::string>{"origin", "url"}), "add args: {}", add->args());
  return success;
}

struct callback_record
{
  unsigned call_count = 0;
  std::string name;
  size_t flag_count = 0;
};

static void record_callback(void* user_data, const std::string& name, const cmdline::parser& cmd)
{
  callback_record& record = *static_cast<callback_record*>(user_data);
  ++record.call_count;
  record.name = name;
  record.flag_count = cmd.count("x");
}

static bool command_callback()
{
  callback_record record;
  cmdline::parser p;
  p.command("boo b", cmdline::parser().flag("x").callback(&record_callback, &record));
  p.parse({"b", "-xx"});

  bool success = true;
  success &= check::debug::a_check(record.call_count == 1, "callback called {} times", record.call_count);
  success &= check::debug::a_check(record.name == "b", "callback name: {}", record.name);
  success &= check::debug::a_check(record.flag_count == 2, "callback saw x {} times", record.flag_count);
  return success;
}

static bool command_callback_not_called_on_error()
{
  callback_record record;
  bool success = tests::expect_error([&record]
  {
    cmdline::parser p;
    p.command("boo", cmdline::parser().callback(&record_callback, &record));
    p.parse({"boo", "--unknown"});
  }, cmdline::error_kind::bad_name, "--unknown is not a recognised flag or option name");

  success &= check::debug::a_check(record.call_count == 0, "callback called {} times", record.call_count);
  return success;
}

static bool command_not_matched_on_error()
{
  cmdline::parser p;
  p.command("cmd", cmdline::parser().option("opt"));
  bool success = tests::expect_error([&p]
  {
    p.parse({"cmd", "--opt"});
  }, cmdline::error_kind::missing_value, "missing value for --opt");

  success &= check::debug::a_check(!p.has_cmd(), "the command should not be recorded");
  return success;
}

int main(int, char**)
{
  return tests::run_tests("commands",
    A_TEST(command_missing),
    A_TEST(command_found),
    A_TEST(command_alias),
    A_TEST(command_only_first_argument),
    A_TEST(command_owns_the_rest),
    A_TEST(command_nested),
    A_TEST(command_callback),
    A_TEST(command_callback_not_called_on_error),
    A_TEST(command_not_matched_on_error)
  );
}
