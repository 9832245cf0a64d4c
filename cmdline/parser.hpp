//
// created by : Timothée Feuillet
// date: 2026-03-08
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

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "arg_stream.hpp"
#include "error.hpp"

namespace arguably::cmdline
{
  /// \brief declares flags, options and sub-commands, then parses the command line against them
  ///
  /// Usage:
  /// \code
  ///   cmdline::parser p;
  ///   p.help_text("Usage: foobar...")
  ///    .version("1.0")
  ///    .flag("foo f")
  ///    .option("bar b");
  ///   try { p.parse(argc, argv); }
  ///   catch (const cmdline::error& e) { e.exit(); }
  ///   if (p.found("foo")) ...
  /// \endcode
  ///
  /// Aliases are given as a single whitespace-separated string ("verbose v").
  /// Long names and single-character shortcuts share the same namespace.
  /// Registering an alias twice (in the same store) rebinds it to the last entry.
  class parser
  {
    public:
      /// \brief called after a sub-command has been successfully parsed
      /// name is the alias that was used on the command line, cmd the sub-command parser
      using callback_t = void(*)(void* user_data, const std::string& name, const parser& cmd);

      // builder:

      /// \brief enables --help (and -h, if not registered)
      parser& help_text(std::string text);
      /// \brief enables --version (and -v, if not registered)
      parser& version(std::string text);

      parser& option(std::string_view aliases);
      /// \brief the default value is returned by value() when the option is not on the command line
      parser& option(std::string_view aliases, std::string default_value);
      parser& flag(std::string_view aliases);
      /// \brief register a sub-command. cmd_parser is moved in.
      parser& command(std::string_view aliases, parser cmd_parser);

      /// \brief set the callback called when this parser is matched as a sub-command
      parser& callback(callback_t cb, void* user_data = nullptr);
      /// \brief enables the `help <command>` command
      parser& enable_help_command(bool enable = true);

      // parse:

      /// \brief parse the command line of the program (argv[0] is skipped)
      /// \throw error on the first failure
      void parse(int argc, char** argv);
      /// \brief parse the given arguments (no program name)
      void parse(std::vector<std::string> args);
      /// \brief consume the stream. Used for sub-commands (the stream is shared with the parent)
      void parse(arg_stream& stream);

      // query:
      // (all of these throw an error of kind bad_name when name isn't registered)

      /// \brief the last value of the option, or its default value, or nullopt
      std::optional<std::string> value(const std::string& name) const;
      std::vector<std::string> values(const std::string& name) const;
      /// \brief number of occurrences of a flag or an option
      size_t count(const std::string& name) const;
      bool found(const std::string& name) const { return count(name) > 0; }

      const std::vector<std::string>& args() const { return arguments; }
      bool has_args() const { return !arguments.empty(); }
      size_t num_args() const { return arguments.size(); }

      bool has_cmd() const { return command_name.has_value(); }
      const std::optional<std::string>& cmd_name() const { return command_name; }
      /// \brief the parser of the matched sub-command, nullptr if none
      const parser* cmd_parser() const;

      /// \brief log the parser state (and the one of the matched sub-command)
      void dump() const;

    private:
      using alias_map = std::unordered_map<std::string, size_t>;

      struct option_entry
      {
        std::vector<std::string> values;
        std::optional<std::string> default_value;
      };

      struct flag_entry
      {
        size_t count = 0;
      };

      static void register_aliases(alias_map& map, std::string_view aliases, size_t index);
      static std::optional<size_t> find_index(const alias_map& map, const std::string& key, size_t entry_count);
      static std::vector<std::string> aliases_of(const alias_map& map, size_t index);

      // engine:
      void handle_long(const std::string& arg, arg_stream& stream);
      void handle_short(const std::string& arg, arg_stream& stream);
      void handle_equals(const std::string& arg);
      void handle_command(const std::string& arg, arg_stream& stream);
      void handle_help_command(arg_stream& stream);

      void dump(unsigned indent) const;

    private:
      std::optional<std::string> helptext;
      std::optional<std::string> version_text;

      std::vector<option_entry> options;
      alias_map option_map;

      std::vector<flag_entry> flags;
      alias_map flag_map;

      std::vector<parser> commands;
      alias_map command_map;

      std::vector<std::string> arguments;
      std::optional<std::string> command_name;
      std::optional<size_t> command_index;

      callback_t callback_fnc = nullptr;
      void* callback_data = nullptr;
      bool auto_help_cmd = false;
  };
}
