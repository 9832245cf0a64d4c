//
// created by : Timothée Feuillet
// date: 2021-12-11
//
//
// Copyright (c) 2021 Timothée Feuillet
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

#include "error.hpp"
#include "exit.hpp"
#include "arg_stream.hpp"
#include "parser.hpp"

// cmdline parsing:
//  flags (counted), options (string values, multi-valued) and nested sub-commands.
// The supported format is the following:
//
// [command] [--opts] [-abc] [params] [--] [params]
//
// --name           flag or option (an option takes the next argument as value)
// --name=value     option with an inline value (-n=value works too)
// -abc             cluster of short flags. The last one can be an option that takes the next argument
// -                positional argument (stdin), as are negative numbers (-42)
// --               everything after it is a positional argument
// command          only recognised as the first argument of a level. The rest of the command line belongs to it.
// help command     (when enabled) prints the help text of the command and exits
//
// --help/-h and --version/-v print the help/version text and exit when those are set
// (and the names are not registered as flags or options)
//
// option values are taken verbatim: `--opt --foo` gives `--foo` as the value of --opt
//
namespace arguably::cmdline
{
}
