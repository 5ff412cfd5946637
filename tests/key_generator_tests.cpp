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

#include <cstdlib>
#include <algorithm>

#include "../data_structures/key_generator.hpp"

#define TESTS_FILE key_generator_tests
#include "test_header.hpp"

using namespace gapkey;
using namespace gapkey::key_generator_impl;

namespace {

order_key k(digit_string digits) { return order_key(digits); }

digit_string random_digits(size_t size) {
  digit_string result;
  for (size_t i = 0; i < size; ++i) { result.push_back(digit_type(rand() % 256)); }
  if (result.back() == 0) { result.back() = digit_type(1 + rand() % 255); }
  return result;
}

// The first n digits of a key, minus any trailing zeroes (so still a key,
// and still <= the untruncated key).  boost::none if nothing is left.
boost::optional<order_key> truncated(order_key const& key, size_t n) {
  digit_string digits(key.begin(), key.begin() + std::min(n, key.size()));
  while (!digits.empty() && digits.back() == 0) { digits.pop_back(); }
  if (digits.empty()) return boost::none;
  return order_key(digits);
}

order_key concatenated(digit_string a, order_key const& b) {
  a.insert(a.end(), b.begin(), b.end());
  return order_key(a);
}

size_t longest(std::vector<order_key> const& keys) {
  size_t result = 0;
  for (order_key const& key : keys) { result = std::max(result, key.size()); }
  return result;
}

// The number of digits that n keys need at least: 255 keys fit in one
// digit (0 can't end a key), 65535 in two, etc.
size_t min_digits_for(uint64_t n) {
  size_t digits = 0;
  uint64_t capacity = 0;
  while (capacity < n) {
    capacity = capacity*256 + 255;
    ++digits;
  }
  return digits;
}

std::vector<order_key> checked_generate(size_t count,
                                        boost::optional<order_key> const& lower,
                                        boost::optional<order_key> const& upper) {
  // if this fails, the calling test is wrong
  if (lower && upper) { BOOST_REQUIRE(*lower < *upper); }

  const std::vector<order_key> keys = generate_keys(count, lower, upper);
  BOOST_REQUIRE_EQUAL(keys.size(), count);
  bool all_good = true;
  for (size_t i = 0; i < keys.size(); ++i) {
    all_good = all_good && !keys[i].digits().empty() && (keys[i].digits().back() != 0);
    if (lower) { all_good = all_good && (*lower < keys[i]); }
    if (upper) { all_good = all_good && (keys[i] < *upper); }
    // ascending, which also makes them distinct
    if (i > 0) { all_good = all_good && (keys[i-1] < keys[i]); }
    if (!all_good) {
      BOOST_ERROR("bad key " << keys[i] << " at position " << i << " of " << count);
      break;
    }
  }
  BOOST_CHECK(all_good);
  return keys;
}

} // end anonymous namespace

BOOST_AUTO_TEST_CASE( simple_distribute_spreads_evenly ) {
  digit_set one;
  simple_distribute(1, 1, 255, one);
  BOOST_CHECK_EQUAL(one.count(), 1u);
  BOOST_CHECK(one[128]);

  digit_set two;
  simple_distribute(2, 1, 255, two);
  BOOST_CHECK_EQUAL(two.count(), 2u);
  BOOST_CHECK(two[85]);
  BOOST_CHECK(two[170]);

  digit_set three;
  simple_distribute(3, 1, 255, three);
  BOOST_CHECK_EQUAL(three.count(), 3u);
  BOOST_CHECK(three[64]);
  BOOST_CHECK(three[128]);
  BOOST_CHECK(three[192]);

  // the extra one goes on the low side
  digit_set four;
  simple_distribute(4, 1, 255, four);
  BOOST_CHECK_EQUAL(four.count(), 4u);
  BOOST_CHECK(four[43]);
  BOOST_CHECK(four[85]);
  BOOST_CHECK(four[128]);
  BOOST_CHECK(four[192]);

  digit_set all;
  simple_distribute(10, 20, 29, all);
  BOOST_CHECK_EQUAL(all.count(), 10u);
  for (uint32_t d = 20; d <= 29; ++d) { BOOST_CHECK(all[d]); }

  for (uint32_t n = 1; n <= 40; ++n) {
    for (uint32_t count = 0; count <= n; ++count) {
      digit_set s;
      simple_distribute(count, 100, 100 + n - 1, s);
      BOOST_CHECK_EQUAL(s.count(), count);
      for (uint32_t d = 0; d < 100; ++d) { BOOST_CHECK(!s[d]); }
    }
  }
}

BOOST_AUTO_TEST_CASE( weighted_distribute_follows_weights ) {
  std::vector<uint32_t> weights(top_value, top_value);
  weights[0] = 1;
  weights[1] = 3;
  digit_counts counts(top_value, 0);
  weighted_distribute(10, 0, 1, weights, counts);
  // 2 and 7 by weight, and the leftover one in the middle of [0, 1]
  BOOST_CHECK_EQUAL(counts[0], 2u);
  BOOST_CHECK_EQUAL(counts[1], 8u);

  digit_counts even(top_value, 0);
  std::vector<uint32_t> flat(top_value, top_value);
  weighted_distribute(256*3 + 5, 0, 255, flat, even);
  uint64_t total = 0;
  for (uint32_t d = 0; d < top_value; ++d) {
    BOOST_CHECK(even[d] == 3 || even[d] == 4);
    total += even[d];
  }
  BOOST_CHECK_EQUAL(total, 256u*3 + 5);
}

BOOST_AUTO_TEST_CASE( generate_keys_limit_values ) {
  BOOST_CHECK(generate_keys(0, boost::none, boost::none).empty());
  BOOST_CHECK(generate_keys(0, k({5}), k({6})).empty());
  checked_generate(1, boost::none, boost::none);
  checked_generate(1, k({255}), boost::none);
  checked_generate(1, boost::none, k({1}));
  checked_generate(1, boost::none, k({0, 0, 1}));
  checked_generate(300, boost::none, k({0, 0, 1}));
  checked_generate(300, k({255, 255, 255}), boost::none);
  checked_generate(300, k({7}), k({7, 0, 0, 1}));

  BOOST_CHECK_THROW(generate_keys(1, k({6}), k({5})), invalid_bounds);
  BOOST_CHECK_THROW(generate_keys(1, k({5}), k({5})), invalid_bounds);
  BOOST_CHECK_THROW(generate_keys(0, k({5, 1}), k({5})), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE( generate_keys_documented_choices ) {
  const std::vector<order_key> one = generate_keys(1, k({5}), k({6}));
  BOOST_REQUIRE_EQUAL(one.size(), 1u);
  BOOST_CHECK_EQUAL(one[0].size(), 2u);
  BOOST_CHECK_EQUAL(one[0][0], 5);
  BOOST_CHECK_EQUAL(one[0], k({5, 128}));

  const std::vector<order_key> three = initial_keys(3);
  BOOST_REQUIRE_EQUAL(three.size(), 3u);
  BOOST_CHECK_EQUAL(three[0], k({64}));
  BOOST_CHECK_EQUAL(three[1], k({128}));
  BOOST_CHECK_EQUAL(three[2], k({192}));

  BOOST_CHECK_EQUAL(keys_after(k({128}))[0], k({192}));
  BOOST_CHECK_EQUAL(keys_before(k({128}))[0], k({64}));
  BOOST_CHECK_EQUAL(keys_between(k({64}), k({128}))[0], k({96}));
  BOOST_CHECK_EQUAL(keys_after(k({255}))[0], k({255, 128}));
  BOOST_CHECK_EQUAL(keys_before(k({1}))[0], k({0, 128}));
  // a bound that's a prefix of the other
  BOOST_CHECK_EQUAL(keys_between(k({5}), k({5, 3}))[0], k({5, 2}));
}

BOOST_AUTO_TEST_CASE( generate_keys_integrity ) {
  srand(20140321);
  const size_t num_keys = 3000 + rand() % 1000;
  const size_t key_size = 10;

  checked_generate(num_keys, boost::none, boost::none);

  const order_key c = k(random_digits(key_size));
  checked_generate(num_keys, c, boost::none);
  checked_generate(num_keys, boost::none, c);

  const order_key other = k(random_digits(key_size*6/5));
  const order_key c1 = std::min(c, other);
  const order_key c2 = std::max(c, other);
  BOOST_REQUIRE(c1 < c2);
  checked_generate(num_keys, c1, c2);

  // the lower bound is a prefix of the upper bound
  const size_t common_size = key_size/3 + rand() % (key_size/2);
  checked_generate(num_keys, truncated(c1, common_size), c1);
  checked_generate(num_keys, truncated(c1, c1.size() - 1), c1);
  // the bounds have a long common part
  const digit_string common(c1.begin(), c1.begin() + common_size);
  checked_generate(num_keys, concatenated(common, c1), concatenated(common, c2));
  const digit_string most(c1.begin(), c1.end() - 1);
  checked_generate(num_keys, concatenated(most, c1), concatenated(most, c2));
}

BOOST_AUTO_TEST_CASE( generate_keys_many_random_bounds ) {
  srand(1234);
  for (int i = 0; i < 200; ++i) {
    const order_key a = k(random_digits(1 + rand() % 4));
    const order_key b = k(random_digits(1 + rand() % 4));
    if (a == b) continue;
    checked_generate(1 + rand() % 600, std::min(a, b), std::max(a, b));
  }
}

BOOST_AUTO_TEST_CASE( generate_keys_compactness ) {
  const uint64_t counts[] = { 1, 2, 3, 100, 255, 256, 300, 1000, 65535, 65536, 70000 };
  for (uint64_t n : counts) {
    const std::vector<order_key> keys = checked_generate(n, boost::none, boost::none);
    BOOST_CHECK_EQUAL(longest(keys), min_digits_for(n));
  }

  // Between two consecutive one-digit keys, everything needs a second
  // digit, and nothing more until the second digit runs out.
  srand(99);
  const digit_type lo = digit_type(1 + rand() % 254);
  const order_key low = k({lo});
  const order_key high = k({digit_type(lo + 1)});
  std::vector<order_key> one = checked_generate(1, low, high);
  BOOST_CHECK_EQUAL(one[0].size(), 2u);
  std::vector<order_key> full = checked_generate(255, low, high);
  for (order_key const& key : full) { BOOST_CHECK_EQUAL(key.size(), 2u); }
  std::vector<order_key> lots = checked_generate(65535, low, high);
  BOOST_CHECK_EQUAL(longest(lots), 3u);
}

// Appending one key at a time after the last one halves the remaining
// room each time, so a key gains a digit about every 8 appends.
BOOST_AUTO_TEST_CASE( successive_appends_grow_slowly ) {
  const size_t max_key_size = 5;
  boost::optional<order_key> last;
  std::vector<order_key> seen;
  for (size_t i = 0; i < 7*max_key_size; ++i) {
    const order_key next = checked_generate(1, last, boost::none)[0];
    BOOST_CHECK_LE(next.size(), max_key_size);
    seen.push_back(next);
    last = next;
  }
  std::sort(seen.begin(), seen.end());
  BOOST_CHECK(std::adjacent_find(seen.begin(), seen.end()) == seen.end());
}

// Same thing, squeezing in right after a fixed key every time.
BOOST_AUTO_TEST_CASE( successive_insertions_at_one_spot_grow_slowly ) {
  const order_key fixed = k({64});
  order_key upper = k({128});
  for (size_t i = 0; i < 35; ++i) {
    upper = checked_generate(1, fixed, upper)[0];
    BOOST_CHECK_LE(upper.size(), 7u);
  }
  // and generating fresh keys makes them short again
  BOOST_CHECK_EQUAL(longest(initial_keys(36)), 1u);
}

REGISTER_TESTS // This must come last in the file.
