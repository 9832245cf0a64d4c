#include <fmt/format.h>

#include "../cmdline/cmdline.hpp"
#include "../logger/logger.hpp"

using namespace arguably;

static void cmd_boo(void*, const std::string& name, const cmdline::parser& cmd)
{
  fmt::print("{}!\n", name);
  for (const auto& it : cmd.args())
    fmt::print("arg: {}\n", it);
}

// git-style interface:
//  command_app boo [args...]
//  command_app help boo
int main(int argc, char** argv)
{
  cmdline::parser parser;
  parser.help_text("Usage: command_app <command>\n\nCommands:\n  boo    say boo\n")
        .version("1.0")
        .enable_help_command()
        .command("boo", cmdline::parser()
                          .help_text("Usage: command_app boo [--loud] [args...]")
                          .flag("loud l")
                          .callback(&cmd_boo));

  try
  {
    parser.parse(argc, argv);
  }
  catch (const cmdline::error& e)
  {
    e.exit();
  }

  if (!parser.has_cmd())
    cr::out().warn("no command given (see `help`)");
  else if (parser.cmd_parser()->found("loud"))
    fmt::print("(loudly)\n");
  return 0;
}
