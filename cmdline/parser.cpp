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

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "parser.hpp"
#include "exit.hpp"
#include "../container_utils.hpp"
#include "../logger/logger.hpp"

namespace arguably::cmdline
{
  parser& parser::help_text(std::string text)
  {
    helptext = std::move(text);
    return *this;
  }

  parser& parser::version(std::string text)
  {
    version_text = std::move(text);
    return *this;
  }

  parser& parser::option(std::string_view aliases)
  {
    options.push_back({});
    register_aliases(option_map, aliases, options.size() - 1);
    return *this;
  }

  parser& parser::option(std::string_view aliases, std::string default_value)
  {
    options.push_back({ {}, std::move(default_value) });
    register_aliases(option_map, aliases, options.size() - 1);
    return *this;
  }

  parser& parser::flag(std::string_view aliases)
  {
    flags.push_back({});
    register_aliases(flag_map, aliases, flags.size() - 1);
    return *this;
  }

  parser& parser::command(std::string_view aliases, parser cmd_parser)
  {
    commands.push_back(std::move(cmd_parser));
    register_aliases(command_map, aliases, commands.size() - 1);
    return *this;
  }

  parser& parser::callback(callback_t cb, void* user_data)
  {
    callback_fnc = cb;
    callback_data = user_data;
    return *this;
  }

  parser& parser::enable_help_command(bool enable)
  {
    auto_help_cmd = enable;
    return *this;
  }

  void parser::register_aliases(alias_map& map, std::string_view aliases, size_t index)
  {
    const std::vector<std::string> names = cr::split_whitespace(aliases);
    if (names.empty())
      cr::out().warn("cmdline: registering an entry without any alias, it will never be reachable");

    for (const std::string& it : names)
    {
      if (map.contains(it))
        cr::out().debug("cmdline: alias `{}` is rebound to the last registered entry", it);
      map.insert_or_assign(it, index);
    }
  }

  std::optional<size_t> parser::find_index(const alias_map& map, const std::string& key, size_t entry_count)
  {
    const auto it = map.find(key);
    if (it == map.end())
      return std::nullopt;
    check::debug::a_assert(it->second < entry_count, "cmdline: alias `{}` points to entry {} (only {} entries)", key, it->second, entry_count);
    return it->second;
  }

  std::vector<std::string> parser::aliases_of(const alias_map& map, size_t index)
  {
    std::vector<std::string> ret;
    for (const auto& it : map)
    {
      if (it.second == index)
        ret.push_back(it.first);
    }
    // longest first, so that the long name comes before its shortcut
    std::sort(ret.begin(), ret.end(), [](const std::string& a, const std::string& b)
    {
      if (a.size() != b.size()) return a.size() > b.size();
      return a < b;
    });
    return ret;
  }

  void parser::parse(int argc, char** argv)
  {
    arg_stream stream(argc, argv);
    parse(stream);
  }

  void parser::parse(std::vector<std::string> args)
  {
    arg_stream stream(std::move(args));
    parse(stream);
  }

  void parser::parse(arg_stream& stream)
  {
    // only the first argument (at this level) can be a command
    bool is_first_arg = true;

    while (stream.has_next())
    {
      std::string arg = stream.next();

      if (arg == "--")
      {
        // force everything else to be treated as positional arguments
        while (stream.has_next())
          arguments.push_back(stream.next());
        break;
      }
      else if (arg.starts_with("--"))
      {
        if (arg.find('=') != std::string::npos)
          handle_equals(arg);
        else
          handle_long(arg, stream);
      }
      else if (arg.starts_with("-"))
      {
        // `-` (stdin) and negative numbers
        if (arg.size() == 1 || std::isdigit((unsigned char)arg[1]))
          arguments.push_back(std::move(arg));
        else if (arg.find('=') != std::string::npos)
          handle_equals(arg);
        else
          handle_short(arg, stream);
      }
      else if (is_first_arg && command_map.contains(arg))
      {
        handle_command(arg, stream);
      }
      else if (is_first_arg && auto_help_cmd && arg == "help")
      {
        handle_help_command(stream);
      }
      else
      {
        arguments.push_back(std::move(arg));
      }

      is_first_arg = false;
    }
  }

  void parser::handle_long(const std::string& arg, arg_stream& stream)
  {
    const std::string key = arg.substr(2);

    if (const auto flag_index = find_index(flag_map, key, flags.size()); flag_index)
    {
      ++flags[*flag_index].count;
    }
    else if (const auto option_index = find_index(option_map, key, options.size()); option_index)
    {
      if (!stream.has_next())
        throw error(error_kind::missing_value, fmt::format("missing value for {}", arg));
      options[*option_index].values.push_back(stream.next());
    }
    else if (key == "help" && helptext)
    {
      cr::out().debug("cmdline: {}: printing the help text", arg);
      print_and_exit(*helptext);
    }
    else if (key == "version" && version_text)
    {
      cr::out().debug("cmdline: {}: printing the version text", arg);
      print_and_exit(*version_text);
    }
    else
    {
      throw error(error_kind::bad_name, fmt::format("{} is not a recognised flag or option name", arg));
    }
  }

  void parser::handle_short(const std::string& arg, arg_stream& stream)
  {
    // messages differ for -x and clusters like -abx
    const bool is_cluster = utf8::count(arg) > 2;

    for (size_t i = 1; i < arg.size();)
    {
      size_t length = utf8::sequence_length(arg, i);
      if (length == 0) length = 1;
      const std::string c = arg.substr(i, length);
      i += length;

      if (const auto flag_index = find_index(flag_map, c, flags.size()); flag_index)
      {
        ++flags[*flag_index].count;
      }
      else if (const auto option_index = find_index(option_map, c, options.size()); option_index)
      {
        if (!stream.has_next())
        {
          if (is_cluster)
            throw error(error_kind::missing_value, fmt::format("missing value for '{}' in {}", c, arg));
          throw error(error_kind::missing_value, fmt::format("missing value for {}", arg));
        }
        options[*option_index].values.push_back(stream.next());
      }
      else if (c == "h" && helptext)
      {
        cr::out().debug("cmdline: {}: printing the help text", arg);
        print_and_exit(*helptext);
      }
      else if (c == "v" && version_text)
      {
        cr::out().debug("cmdline: {}: printing the version text", arg);
        print_and_exit(*version_text);
      }
      else
      {
        if (is_cluster)
          throw error(error_kind::bad_name, fmt::format("'{}' in {} is not a recognised flag or option name", c, arg));
        throw error(error_kind::bad_name, fmt::format("{} is not a recognised flag or option name", arg));
      }
    }
  }

  void parser::handle_equals(const std::string& arg)
  {
    const size_t eq_pos = arg.find('=');
    const std::string name = arg.substr(0, eq_pos);
    std::string value = arg.substr(eq_pos + 1);

    const size_t key_start = name.find_first_not_of('-');
    const std::string key = key_start == std::string::npos ? std::string() : name.substr(key_start);

    const auto index = find_index(option_map, key, options.size());
    if (!index)
      throw error(error_kind::bad_name, fmt::format("{} is not a recognised option name", name));
    if (value.empty())
      throw error(error_kind::missing_value, fmt::format("missing value for {}", name));

    options[*index].values.push_back(std::move(value));
  }

  void parser::handle_command(const std::string& arg, arg_stream& stream)
  {
    const auto index = find_index(command_map, arg, commands.size());
    check::debug::a_assert(index.has_value(), "cmdline: command `{}` is not registered", arg);

    cr::out().debug("cmdline: entering command `{}` (remaining arguments: {})", arg, stream.remaining());
    parser& cmd = commands[*index];
    cmd.parse(stream);

    command_name = arg;
    command_index = *index;

    if (cmd.callback_fnc != nullptr)
      cmd.callback_fnc(cmd.callback_data, arg, cmd);
  }

  void parser::handle_help_command(arg_stream& stream)
  {
    if (!stream.has_next())
      throw error(error_kind::missing_help_arg);

    const std::string name = stream.next();
    const auto index = find_index(command_map, name, commands.size());
    if (!index)
      throw error(error_kind::bad_name, fmt::format("'{}' is not a recognised command name", name));

    cr::out().debug("cmdline: help {}: printing the help text of the command", name);
    print_and_exit(commands[*index].helptext.value_or(""));
  }

  std::optional<std::string> parser::value(const std::string& name) const
  {
    const auto index = find_index(option_map, name, options.size());
    if (!index)
      throw error(error_kind::bad_name, fmt::format("'{}' is not a registered option name", name));

    const option_entry& entry = options[*index];
    if (!entry.values.empty())
      return entry.values.back();
    return entry.default_value;
  }

  std::vector<std::string> parser::values(const std::string& name) const
  {
    const auto index = find_index(option_map, name, options.size());
    if (!index)
      throw error(error_kind::bad_name, fmt::format("'{}' is not a registered option name", name));
    return options[*index].values;
  }

  size_t parser::count(const std::string& name) const
  {
    if (const auto flag_index = find_index(flag_map, name, flags.size()); flag_index)
      return flags[*flag_index].count;
    if (const auto option_index = find_index(option_map, name, options.size()); option_index)
      return options[*option_index].values.size();
    throw error(error_kind::bad_name, fmt::format("'{}' is not a registered flag or option name", name));
  }

  const parser* parser::cmd_parser() const
  {
    if (!command_index)
      return nullptr;
    check::debug::a_assert(*command_index < commands.size(), "cmdline: matched command index {} is out of range", *command_index);
    return &commands[*command_index];
  }

  void parser::dump() const
  {
    dump(0);
  }

  void parser::dump(unsigned indent) const
  {
    const std::string spc(indent * 2, ' ');

    cr::out().log("{}help text: {}", spc, helptext ? "yes" : "no");
    cr::out().log("{}version: {}", spc, version_text ? *version_text : std::string("[none]"));
    for (size_t i = 0; i < flags.size(); ++i)
      cr::out().log("{}flag [{}]: count: {}", spc, fmt::join(aliases_of(flag_map, i), ", "), flags[i].count);
    for (size_t i = 0; i < options.size(); ++i)
    {
      cr::out().log("{}option [{}]: values: {}, default: {}", spc, fmt::join(aliases_of(option_map, i), ", "),
                    options[i].values, options[i].default_value ? *options[i].default_value : std::string("[none]"));
    }
    cr::out().log("{}arguments: {}", spc, arguments);

    if (const parser* cmd = cmd_parser(); cmd != nullptr)
    {
      cr::out().log("{}command: {}", spc, *command_name);
      cmd->dump(indent + 1);
    }
  }
}
