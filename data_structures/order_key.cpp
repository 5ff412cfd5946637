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

#include "order_key.hpp"

#include <algorithm>
#include <utility>

namespace gapkey {

namespace {
const char hex_digits[] = "0123456789abcdef";

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}

order_key::order_key(digit_string digits, boost::optional<size_t> max_size):
  digits_(std::move(digits)),
  max_size_(max_size)
{
  caller_correct_if<std::invalid_argument>(!digits_.empty(), "an order_key must not be empty");
  caller_correct_if<std::invalid_argument>(digits_.back() != 0, "an order_key must not end with a zero digit");
  caller_correct_if<std::invalid_argument>(!max_size_ || digits_.size() <= *max_size_,
    "order_key is longer than its declared max_size");
}

order_key order_key::from_padded_bytes(digit_string bytes, boost::optional<size_t> max_size) {
  while (!bytes.empty() && bytes.back() == 0) {
    bytes.pop_back();
  }
  return order_key(std::move(bytes), max_size);
}

order_key order_key::from_hex(std::string const& text) {
  digit_string digits;
  size_t i = 0;
  while (i < text.size()) {
    const size_t dot = std::min(text.find('.', i), text.size());
    caller_correct_if<std::invalid_argument>(dot > i && dot - i <= 2, "malformed order_key hex digit");
    int value = 0;
    for (size_t j = i; j < dot; ++j) {
      const int v = hex_value(text[j]);
      caller_correct_if<std::invalid_argument>(v >= 0, "malformed order_key hex digit");
      value = value*16 + v;
    }
    digits.push_back(digit_type(value));
    i = dot + 1;
    caller_error_if<std::invalid_argument>(dot + 1 == text.size(), "trailing '.' in order_key hex");
  }
  return order_key(std::move(digits));
}

digit_string order_key::right_pad(size_t target_size)const {
  caller_correct_if<std::invalid_argument>(target_size >= digits_.size(),
    "can't right_pad an order_key to less than its own size");
  digit_string result(digits_);
  result.resize(target_size, 0);
  return result;
}

digit_string order_key::right_pad()const {
  caller_correct_if<precision_unavailable>(bool(max_size_),
    "right_pad() needs an order_key with a declared max_size");
  return right_pad(*max_size_);
}

std::string order_key::to_hex()const {
  std::string result;
  result.reserve(digits_.size()*3);
  for (digit_type d : digits_) {
    if (!result.empty()) { result.push_back('.'); }
    result.push_back(hex_digits[d >> 4]);
    result.push_back(hex_digits[d & 0xf]);
  }
  return result;
}

int order_key::compare(order_key const& o)const {
  const size_t n = std::min(digits_.size(), o.digits_.size());
  for (size_t i = 0; i < n; ++i) {
    if (digits_[i] != o.digits_[i]) {
      return (digits_[i] < o.digits_[i]) ? -1 : 1;
    }
  }
  if (digits_.size() == o.digits_.size()) return 0;
  return (digits_.size() < o.digits_.size()) ? -1 : 1;
}

order_key operator+(order_key const& lhs, order_key const& rhs) {
  caller_correct_if<precision_unavailable>(bool(lhs.max_size()),
    "the left operand of an order_key concatenation needs a declared max_size");
  digit_string digits = lhs.right_pad();
  digits.insert(digits.end(), rhs.begin(), rhs.end());
  boost::optional<size_t> max_size;
  if (rhs.max_size()) {
    max_size = *lhs.max_size() + *rhs.max_size();
  }
  return order_key(std::move(digits), max_size);
}

digit_string common_prefix(order_key const& a, order_key const& b) {
  const size_t n = std::min(a.size(), b.size());
  size_t i = 0;
  while (i < n && a[i] == b[i]) { ++i; }
  return digit_string(a.begin(), a.begin() + i);
}

std::ostream& operator<<(std::ostream& os, order_key const& k) {
  return os << k.to_hex();
}

} // end namespace gapkey
