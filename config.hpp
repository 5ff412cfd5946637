/*

    Copyright the Gapkey contributors, 2026

    This file is part of Gapkey.

    Gapkey is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    Gapkey is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with Gapkey.  If not, see <http://www.gnu.org/licenses/>.

*/

#ifndef GAPKEY_CONFIG_HPP__
#define GAPKEY_CONFIG_HPP__

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

// Define this to re-check a reorderable_container's ordered index against
// its key store after every mutation.  Slow; the tests turn it on.
//#define GAPKEY_AUDIT_REORDERABLE_CONTAINER

#ifndef ATTRIBUTE_NORETURN
    // from http://www.boost.org/doc/libs/1_48_0/boost/exception/detail/attribute_noreturn.hpp
#if defined(_MSC_VER)
#define ATTRIBUTE_NORETURN __declspec(noreturn)
#elif defined(__GNUC__)
#define ATTRIBUTE_NORETURN __attribute__((noreturn))
#else
#define ATTRIBUTE_NORETURN
#endif
#endif

// Usage: LOG << "something " << 3 << '\n';
#define LOG (::gapkey::log_stream())

namespace gapkey {

inline std::ostream& log_stream() { return std::cerr; }

// The error taxonomy.  All of these are the caller's fault, so they are
// all logic_errors.  Bad counts and bad bounds are std::invalid_argument.
struct invalid_bounds : std::invalid_argument {
  explicit invalid_bounds(std::string const& what):std::invalid_argument(what){}
};
struct element_not_found : std::logic_error {
  explicit element_not_found(std::string const& what):std::logic_error(what){}
};
struct empty_container : std::logic_error {
  explicit empty_container(std::string const& what):std::logic_error(what){}
};
struct precision_unavailable : std::logic_error {
  explicit precision_unavailable(std::string const& what):std::logic_error(what){}
};

// It's not polite for library functions to assert() because the library's users
// misused a correct library; use these for that case.
template<typename Exception = std::logic_error>
inline ATTRIBUTE_NORETURN void caller_error(const char* error) {
  // If exceptions prove worse for debugging than asserts/segfaults,
  // feel free to comment this out and use asserts/segfaults/breakpoints.
  throw Exception(error);
}
// You must provide an explanatory string so that the user of the library
// will know what *they* did wrong, and not have to interpret an assert() expression
// to find out.
template<typename Exception = std::logic_error>
inline void caller_error_if(bool cond, const char* error) {
  if(cond) {
    caller_error<Exception>(error);
  }
}
template<typename Exception = std::logic_error>
inline void caller_correct_if(bool cond, const char* error) {
  if(!cond) {
    caller_error<Exception>(error);
  }
}

} // end namespace gapkey

#endif
