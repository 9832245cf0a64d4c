//
// file : exception.hpp (2)
// in : file:///home/tim/projects/nsched/nsched/tools/exception.hpp
//
// created by : Timothée Feuillet on linux.site
// date: 03/08/2014 16:20:59
//
//
// Copyright (c) 2014-2016 Timothée Feuillet
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

#ifndef __N_1232091940699248471_1200439019__EXCEPTION_HPP__2___
# define __N_1232091940699248471_1200439019__EXCEPTION_HPP__2___

#include <exception>
#include <string>

namespace arguably
{
  // the base arguably exception class
  class exception : public std::exception
  {
    private:
      std::string msg;

    public:
      explicit exception(const std::string &what_arg) noexcept : msg(what_arg) {}
      explicit exception(std::string &&what_arg) noexcept : msg(std::move(what_arg)) {}
      virtual ~exception() noexcept = default;

      virtual const char *what() const noexcept
      {
        return msg.data();
      }

      const std::string& message() const noexcept
      {
        return msg;
      }
  };
} // namespace arguably

#endif /*__N_1232091940699248471_1200439019__EXCEPTION_HPP__2___*/

// kate: indent-mode cstyle; indent-width 2; replace-tabs on;
