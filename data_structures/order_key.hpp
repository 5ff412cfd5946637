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

#ifndef GAPKEY_ORDER_KEY_HPP__
#define GAPKEY_ORDER_KEY_HPP__

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/functional/hash.hpp>

#include "../config.hpp"

namespace gapkey {

typedef uint8_t digit_type;
typedef std::vector<digit_type> digit_string;

// An order_key is a nonempty string of byte digits whose last digit is
// never 0.  Keys compare lexicographically, a proper prefix being smaller,
// which makes them usable directly as a sort key or as the bytes of a
// binary database column.
//
// A key may declare a maximum size, for fixed-width storage.  The maximum
// size takes no part in comparisons.
class order_key {
public:
  typedef digit_string::const_iterator const_iterator;

  explicit order_key(digit_string digits, boost::optional<size_t> max_size = boost::none);

  // Reads back a value produced by right_pad(): trailing zero digits are
  // stripped before the key is built.
  static order_key from_padded_bytes(digit_string bytes, boost::optional<size_t> max_size = boost::none);
  // Parses the dotted hex form that operator<< writes, e.g. "05.80".
  static order_key from_hex(std::string const& text);

  digit_string const& digits()const { return digits_; }
  digit_string const& bytes()const { return digits_; }
  size_t size()const { return digits_.size(); }
  digit_type operator[](size_t i)const { return digits_[i]; }
  const_iterator begin()const { return digits_.begin(); }
  const_iterator end()const { return digits_.end(); }

  boost::optional<size_t> const& max_size()const { return max_size_; }
  order_key with_max_size(size_t max_size)const { return order_key(digits_, max_size); }

  // The key's digits followed by zero digits, exactly target_size long.
  // Not an order_key: only fit for storage and display.
  digit_string right_pad(size_t target_size)const;
  // Pads to max_size(); throws precision_unavailable if there is none.
  digit_string right_pad()const;

  std::string to_hex()const;

  // <0, 0, >0 like strcmp.
  int compare(order_key const& o)const;

  bool operator< (order_key const& o)const { return compare(o) <  0; }
  bool operator> (order_key const& o)const { return compare(o) >  0; }
  bool operator<=(order_key const& o)const { return compare(o) <= 0; }
  bool operator>=(order_key const& o)const { return compare(o) >= 0; }
  bool operator==(order_key const& o)const { return digits_ == o.digits_; }
  bool operator!=(order_key const& o)const { return digits_ != o.digits_; }

private:
  digit_string digits_;
  boost::optional<size_t> max_size_;
};

// Composite key: lhs padded to its max_size, then rhs.  The result sorts
// first by lhs, then by rhs.  lhs must declare a max_size.
order_key operator+(order_key const& lhs, order_key const& rhs);

// The longest run of leading digits shared by a and b.  Assumes a <= b.
digit_string common_prefix(order_key const& a, order_key const& b);

std::ostream& operator<<(std::ostream& os, order_key const& k);

inline size_t hash_value(order_key const& k) {
  return boost::hash_range(k.begin(), k.end());
}

} // end namespace gapkey

namespace std {
  template<>
  struct hash<gapkey::order_key> {
    public:
    size_t operator()(gapkey::order_key const& k)const {
      return gapkey::hash_value(k);
    }
  };
}

#endif
