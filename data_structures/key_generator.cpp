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

#include "key_generator.hpp"

#include <algorithm>
#include <boost/next_prior.hpp>
#include <boost/range/iterator_range.hpp>

namespace gapkey {
namespace key_generator_impl {

typedef boost::iterator_range<digit_string::const_iterator> digit_run;

void simple_distribute(uint64_t count, uint32_t min_digit, uint32_t max_digit, digit_set& result) {
  if (count == 0) return;
  assert (min_digit <= max_digit);
  const uint32_t n = max_digit - min_digit + 1;
  assert (count <= n);
  if (count == n) {
    for (uint32_t d = min_digit; d <= max_digit; ++d) { result.set(d); }
  }
  else if (count == 1) {
    result.set(min_digit + n/2);
  }
  else if (count == 2) {
    // The midpoint split would leave these two lopsided.
    result.set(min_digit + (n-1)/3);
    result.set(min_digit + (2*n-1)/3);
  }
  else {
    const uint32_t pivot = min_digit + n/2;
    result.set(pivot);
    // The right side never gets more than the left: appending after the
    // last element is more common than prepending, so keep room up there.
    const uint64_t right = (count-1)/2;
    const uint64_t left = count-1-right;
    if (right) { simple_distribute(right, pivot+1, max_digit, result); }
    if (left)  { simple_distribute(left, min_digit, pivot-1, result); }
  }
}

void weighted_distribute(uint64_t count, uint32_t min_digit, uint32_t max_digit,
                         std::vector<uint32_t> const& weights, digit_counts& result) {
  assert (min_digit <= max_digit);
  uint64_t total_weight = 0;
  for (uint32_t d = min_digit; d <= max_digit; ++d) {
    assert (weights[d] > 0);
    total_weight += weights[d];
  }
  uint64_t given = 0;
  for (uint32_t d = min_digit; d <= max_digit; ++d) {
    const uint64_t share = (count * weights[d]) / total_weight;
    result[d] += share;
    given += share;
  }
  // Each digit lost less than one to truncation, so there are fewer
  // leftovers than digits.
  digit_set leftovers;
  simple_distribute(count - given, min_digit, max_digit, leftovers);
  for (uint32_t d = min_digit; d <= max_digit; ++d) {
    if (leftovers[d]) { ++result[d]; }
  }
}

namespace {

digit_run drop_first(digit_run const& r) {
  return boost::make_iterator_range(boost::next(r.begin()), r.end());
}

// Appends to `out`, in ascending order, `count` keys of the form
// prefix + (digits) that are greater than prefix + lower and, if upper is
// given, less than prefix + *upper.
//
// An empty `lower` only means the keys must be longer than prefix.
// `upper`, if given, is nonempty, and its first digit is greater than
// lower's first digit (or it is the only bound).
void generate_codes(uint64_t count, digit_run lower, boost::optional<digit_run> upper,
                    digit_string& prefix, std::vector<order_key>& out) {
  if (count == 0) return;

  const uint32_t start_digit = lower.empty() ? 0 : lower.front();
  const uint32_t end_digit = upper ? uint32_t(upper->front()) : uint32_t(max_digit);
  const bool upper_continues = upper && (upper->size() > 1);
  // prefix + end_digit is the upper bound itself unless the bound continues.
  const uint32_t top_digit = (upper && !upper_continues) ? end_digit - 1 : end_digit;
  assert (top_digit >= start_digit);

  // Direct codes are prefix + d for d in [start_digit + 1, top_digit].
  // Longer codes are prefix + d + (more) for d in [start_digit, top_digit].
  const uint64_t num_direct_candidates = top_digit - start_digit;
  digit_set direct;
  digit_counts longer(top_value, 0);

  if (num_direct_candidates >= count) {
    simple_distribute(count, start_digit + 1, top_digit, direct);
  }
  else {
    for (uint32_t d = start_digit + 1; d <= top_digit; ++d) { direct.set(d); }

    std::vector<uint32_t> weights(top_value, top_value);
    // Under a boundary digit, only the part of the subtree on the open
    // side of the bound's next digit is usable.
    if (lower.size() > 1) {
      weights[start_digit] = top_value - lower[1];
    }
    if (upper_continues) {
      weights[end_digit] = std::max<uint32_t>((*upper)[1], 1);
    }
    weighted_distribute(count - num_direct_candidates, start_digit, top_digit, weights, longer);
  }

  for (uint32_t d = start_digit; d <= top_digit; ++d) {
    prefix.push_back(digit_type(d));
    if (direct[d]) {
      out.push_back(order_key(prefix));
    }
    if (longer[d]) {
      const digit_run sub_lower = ((d == start_digit) && !lower.empty()) ?
        drop_first(lower) : digit_run(lower.end(), lower.end());
      boost::optional<digit_run> sub_upper;
      if (upper_continues && (d == end_digit)) {
        sub_upper = drop_first(*upper);
      }
      generate_codes(longer[d], sub_lower, sub_upper, prefix, out);
    }
    prefix.pop_back();
  }
}

} // end anonymous namespace
} // end namespace key_generator_impl

std::vector<order_key> generate_keys(size_t count,
                                     boost::optional<order_key> const& lower,
                                     boost::optional<order_key> const& upper) {
  using namespace key_generator_impl;
  if (lower && upper) {
    caller_correct_if<invalid_bounds>(*lower < *upper, "generate_keys: lower bound must be less than upper bound");
  }
  std::vector<order_key> result;
  if (count == 0) return result;
  result.reserve(count);

  digit_string prefix;
  if (lower && upper) {
    prefix = common_prefix(*lower, *upper);
  }
  const digit_string no_digits;
  const digit_run lower_run = lower ?
    boost::make_iterator_range(lower->begin() + prefix.size(), lower->end()) :
    boost::make_iterator_range(no_digits.begin(), no_digits.end());
  boost::optional<digit_run> upper_run;
  if (upper) {
    upper_run = boost::make_iterator_range(upper->begin() + prefix.size(), upper->end());
  }

  generate_codes(count, lower_run, upper_run, prefix, result);
  assert (result.size() == count);
  return result;
}

} // end namespace gapkey
