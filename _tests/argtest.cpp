#include "../cmdline/cmdline.hpp"
#include "../logger/logger.hpp"

using namespace arguably;

// dumps the state of the parser after parsing the command line
// ex: argtest -q --file=foo.txt bar -- --baz
int main(int argc, char** argv)
{
  cr::get_global_logger().min_severity = cr::logger::severity::debug;

  cmdline::parser parser;
  parser.help_text("help!")
        .version("v1.0")
        .option("file f")
        .flag("quiet q");

  try
  {
    parser.parse(argc, argv);
  }
  catch (const cmdline::error& e)
  {
    cr::out().error("{}: {}", e.kind(), e.what());
    return 1;
  }

  parser.dump();
  return 0;
}
