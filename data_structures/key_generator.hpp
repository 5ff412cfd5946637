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

#ifndef GAPKEY_KEY_GENERATOR_HPP__
#define GAPKEY_KEY_GENERATOR_HPP__

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <boost/optional.hpp>

#include "order_key.hpp"

namespace gapkey {

// generate_keys returns count distinct order_keys, ascending, each strictly
// greater than lower and strictly less than upper (an absent bound doesn't
// constrain that side).  The keys are as short as possible, and then as
// evenly spread between the bounds as possible, with the larger gaps left
// on the low side.
//
// Throws invalid_bounds unless lower < upper when both are given.
std::vector<order_key> generate_keys(size_t count,
                                     boost::optional<order_key> const& lower,
                                     boost::optional<order_key> const& upper);

inline std::vector<order_key> initial_keys(size_t count) {
  return generate_keys(count, boost::none, boost::none);
}
inline std::vector<order_key> keys_before(order_key const& upper, size_t count = 1) {
  return generate_keys(count, boost::none, upper);
}
inline std::vector<order_key> keys_after(order_key const& lower, size_t count = 1) {
  return generate_keys(count, lower, boost::none);
}
inline std::vector<order_key> keys_between(order_key const& lower, order_key const& upper, size_t count = 1) {
  return generate_keys(count, lower, upper);
}

namespace key_generator_impl {
const uint32_t top_value = 256;
const digit_type max_digit = 255;

typedef std::bitset<top_value> digit_set;
typedef std::vector<uint64_t> digit_counts; // indexed by digit

// Marks `count` digits of [min_digit, max_digit] in `result`, spread as
// evenly as possible.  count must not exceed the size of the range.
void simple_distribute(uint64_t count, uint32_t min_digit, uint32_t max_digit, digit_set& result);

// Splits `count` among the digits of [min_digit, max_digit] in proportion to
// `weights` (indexed by digit, each nonzero), handing the truncation
// leftovers out with simple_distribute.  Adds into `result`.
void weighted_distribute(uint64_t count, uint32_t min_digit, uint32_t max_digit,
                         std::vector<uint32_t> const& weights, digit_counts& result);
} // end namespace key_generator_impl

} // end namespace gapkey

#endif
