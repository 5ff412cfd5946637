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

#ifndef GAPKEY_KEY_STORE_HPP__
#define GAPKEY_KEY_STORE_HPP__

#include <functional>
#include <utility>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "order_key.hpp"

namespace gapkey {

// Where a reorderable_container keeps each element's order_key.
// The container is the only thing that should call assign().
template<typename Element>
class key_store {
public:
  virtual ~key_store() {}
  virtual size_t size()const = 0;
  virtual bool contains(Element const& e)const = 0;
  // e must be contained.
  virtual order_key key_of(Element const& e)const = 0;
  // Adds e if it isn't contained yet.
  virtual void assign(Element const& e, order_key const& k) = 0;
  // Returns whether e was contained.
  virtual bool erase(Element const& e) = 0;
  // In no particular order.
  virtual std::vector<Element> elements()const = 0;
};

// The store owns the keys; the elements know nothing about them.
template<typename Element, typename Hash = std::hash<Element>, typename Equal = std::equal_to<Element>>
class map_key_store : public key_store<Element> {
public:
  size_t size()const override { return keys_.size(); }
  bool contains(Element const& e)const override { return keys_.find(e) != keys_.end(); }
  order_key key_of(Element const& e)const override {
    auto i = keys_.find(e);
    assert (i != keys_.end());
    return i->second;
  }
  void assign(Element const& e, order_key const& k) override {
    auto i = keys_.find(e);
    if (i == keys_.end()) {
      keys_.insert(std::make_pair(e, k));
    }
    else {
      i->second = k;
    }
  }
  bool erase(Element const& e) override { return keys_.erase(e) != 0; }
  std::vector<Element> elements()const override {
    std::vector<Element> result;
    result.reserve(keys_.size());
    for (auto const& entry : keys_) { result.push_back(entry.first); }
    return result;
  }
private:
  std::unordered_map<Element, order_key, Hash, Equal> keys_;
};

// The keys live in the caller's objects and are reached through a getter
// and a setter.  This store only remembers membership.
//
// The setter is called on an element before the getter ever is, unless
// the element came in through the constructor (whose elements are
// expected to carry valid keys already).
template<typename Element, typename Hash = std::hash<Element>, typename Equal = std::equal_to<Element>>
class accessor_key_store : public key_store<Element> {
public:
  typedef std::function<order_key (Element const&)> getter_type;
  typedef std::function<void (Element const&, order_key const&)> setter_type;

  accessor_key_store(getter_type get, setter_type set, std::vector<Element> const& members = std::vector<Element>()):
    get_(get), set_(set), members_(members.begin(), members.end())
  {
    caller_correct_if<std::invalid_argument>(bool(get_) && bool(set_), "accessor_key_store needs both a getter and a setter");
  }

  size_t size()const override { return members_.size(); }
  bool contains(Element const& e)const override { return members_.find(e) != members_.end(); }
  order_key key_of(Element const& e)const override {
    assert (contains(e));
    return get_(e);
  }
  void assign(Element const& e, order_key const& k) override {
    set_(e, k);
    members_.insert(e);
  }
  bool erase(Element const& e) override { return members_.erase(e) != 0; }
  std::vector<Element> elements()const override {
    return std::vector<Element>(members_.begin(), members_.end());
  }
private:
  getter_type get_;
  setter_type set_;
  std::unordered_set<Element, Hash, Equal> members_;
};

} // end namespace gapkey

#endif
