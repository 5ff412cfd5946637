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

#ifndef GAPKEY_REORDERABLE_CONTAINER_HPP__
#define GAPKEY_REORDERABLE_CONTAINER_HPP__

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <unordered_set>
#include <utility>
#include <vector>
#include <boost/iterator/iterator_adaptor.hpp>
#include <boost/next_prior.hpp>
#include <boost/optional.hpp>

#include "../config.hpp"
#include "order_key.hpp"
#include "key_generator.hpp"
#include "key_store.hpp"

namespace gapkey {

enum initial_keys_policy {
  // give the initial elements fresh keys, in the order given
  generate_initial_keys,
  // the initial elements already carry their keys; index them as they are
  keep_existing_keys
};

// reorderable_container is a set whose elements are in an order that you
// choose: every insertion says where the new elements go relative to the
// ones already there, and you can move elements around cheaply.
// Underneath, each element has an order_key, and iterating the container
// visits the elements in key order.  The keys are opaque; only the
// container writes them.
//
// Inserting an element that is already in the container moves it.
//
// Repeated insertions at the same spot make keys longer; recompute()
// shortens them all again.
//
// Not thread-safe.  Mutating the container invalidates its iterators.
template<typename Element, typename Hash = std::hash<Element>, typename Equal = std::equal_to<Element>>
class reorderable_container {
  typedef std::map<order_key, Element> index_type;
  typedef std::unordered_set<Element, Hash, Equal> element_set;
public:
  typedef Element value_type;
  typedef key_store<Element> store_type;
  typedef map_key_store<Element, Hash, Equal> owned_store_type;
  typedef accessor_key_store<Element, Hash, Equal> accessor_store_type;
  typedef typename accessor_store_type::getter_type key_getter;
  typedef typename accessor_store_type::setter_type key_setter;

  class const_iterator : public boost::iterator_adaptor<
      const_iterator, typename index_type::const_iterator, Element const, boost::bidirectional_traversal_tag> {
  public:
    const_iterator() {}
    explicit const_iterator(typename index_type::const_iterator i):const_iterator::iterator_adaptor_(i){}
    order_key const& key()const { return this->base()->first; }
  private:
    friend class boost::iterator_core_access;
    Element const& dereference()const { return this->base()->second; }
  };
  typedef const_iterator iterator;

  reorderable_container():store_(new owned_store_type()) {}

  explicit reorderable_container(std::vector<Element> const& initial):
    store_(new owned_store_type())
  {
    std::vector<Element> elements = without_duplicates(initial);
    commit(elements, initial_keys(elements.size()));
  }

  // Keys live in the caller's objects.  With keep_existing_keys, the
  // initial elements' keys are read through get and left as they are;
  // they must all be different.
  reorderable_container(key_getter get, key_setter set,
                        std::vector<Element> const& initial = std::vector<Element>(),
                        initial_keys_policy policy = generate_initial_keys):
    store_(new accessor_store_type(get, set))
  {
    std::vector<Element> elements = without_duplicates(initial);
    if (policy == keep_existing_keys) {
      store_.reset(new accessor_store_type(get, set, elements));
      index_existing_keys();
    }
    else {
      commit(elements, initial_keys(elements.size()));
    }
  }

  // Any other kind of store.  Whatever it already holds is kept with
  // the keys it has.
  explicit reorderable_container(std::unique_ptr<store_type> store):store_(std::move(store)) {
    caller_correct_if<std::invalid_argument>(bool(store_), "reorderable_container needs a key store");
    index_existing_keys();
  }

  size_t size()const { return index_.size(); }
  bool empty()const { return index_.empty(); }
  bool contains(Element const& e)const { return store_->contains(e); }

  const_iterator begin()const { return const_iterator(index_.begin()); }
  const_iterator end()const { return const_iterator(index_.end()); }

  Element const& front()const {
    caller_correct_if<empty_container>(!index_.empty(), "front() of an empty reorderable_container");
    return index_.begin()->second;
  }
  Element const& back()const {
    caller_correct_if<empty_container>(!index_.empty(), "back() of an empty reorderable_container");
    return boost::prior(index_.end())->second;
  }

  // The elements in no particular order.  May be cheaper than iterating.
  std::vector<Element> elements()const { return store_->elements(); }

  // The sort key of e.  Stable until the next mutation of the container.
  order_key key_of(Element const& e)const {
    require_present(e, "key_of: element is not in the container");
    return store_->key_of(e);
  }

  // Puts new_elements (in that order) between start and end, which must
  // both be in the container with start before end.
  // If other elements are between start and end, the new elements go
  // right after start; use put_next_to() to say that explicitly.
  void put_between(Element const& start, Element const& end, std::vector<Element> const& new_elements) {
    caller_error_if<std::invalid_argument>(Equal()(start, end), "put_between: start and end must be different");
    require_present(start, "put_between: start is not in the container");
    require_present(end, "put_between: end is not in the container");
    const order_key start_key = store_->key_of(start);
    const order_key end_key = store_->key_of(end);
    caller_correct_if<std::invalid_argument>(start_key < end_key, "put_between: start must come before end");

    element_set moving;
    std::vector<Element> elements = without_duplicates(new_elements, &moving);
    // end may be moving too, so don't look past it.
    boost::optional<order_key> upper = nearest_unmoved_after(start_key, moving);
    if (!upper || (end_key < *upper)) {
      upper = end_key;
    }
    commit(elements, generate_keys(elements.size(), start_key, upper));
  }

  // Puts new_elements (in that order) after all the other elements, or
  // before them all if !at_last.
  void put_at_end(std::vector<Element> const& new_elements, bool at_last = true) {
    element_set moving;
    std::vector<Element> elements = without_duplicates(new_elements, &moving);
    boost::optional<order_key> bound;
    if (at_last) {
      for (auto i = index_.rbegin(); i != index_.rend(); ++i) {
        if (!moving.count(i->second)) { bound = i->first; break; }
      }
      commit(elements, generate_keys(elements.size(), bound, boost::none));
    }
    else {
      for (auto i = index_.begin(); i != index_.end(); ++i) {
        if (!moving.count(i->second)) { bound = i->first; break; }
      }
      commit(elements, generate_keys(elements.size(), boost::none, bound));
    }
  }

  // Puts new_elements (in that order) right after anchor, or right
  // before it if !after.  anchor must be in the container.
  // anchor may be among new_elements; then they all go where it was.
  void put_next_to(Element const& anchor, std::vector<Element> const& new_elements, bool after = true) {
    require_present(anchor, "put_next_to: anchor is not in the container");
    element_set moving;
    std::vector<Element> elements = without_duplicates(new_elements, &moving);
    const order_key anchor_true_key = store_->key_of(anchor);

    // If the anchor is moving, its key is about to disappear; its
    // unmoving neighbor on the other side takes its place as the bound.
    boost::optional<order_key> anchor_key = anchor_true_key;
    if (moving.count(anchor)) {
      anchor_key = after ? nearest_unmoved_before(anchor_true_key, moving)
                         : nearest_unmoved_after(anchor_true_key, moving);
    }
    boost::optional<order_key> lower;
    boost::optional<order_key> upper;
    if (after) {
      lower = anchor_key;
      upper = nearest_unmoved_after(anchor_true_key, moving);
    }
    else {
      lower = nearest_unmoved_before(anchor_true_key, moving);
      upper = anchor_key;
    }
    commit(elements, generate_keys(elements.size(), lower, upper));
  }

  // Gives every element the shortest evenly spaced keys, keeping the order.
  void recompute() {
    std::vector<Element> ordered(begin(), end());
    commit(ordered, initial_keys(ordered.size()));
  }

  // Stable: elements that compare equal keep their current order.
  template<typename Compare>
  void sort_with(Compare compare) {
    std::vector<Element> ordered(begin(), end());
    std::stable_sort(ordered.begin(), ordered.end(), compare);
    commit(ordered, initial_keys(ordered.size()));
  }
  template<typename KeyFunction>
  void sort_by(KeyFunction key_function) {
    sort_with([&key_function](Element const& a, Element const& b) { return key_function(a) < key_function(b); });
  }
  void sort() {
    sort_with(std::less<Element>());
  }

  // Like sort_with, but only for the elements strictly between start and
  // end (boost::none meaning "from the first" and "to the last").
  // The other elements keep their keys.
  template<typename Compare>
  void sort_tranche_with(boost::optional<Element> const& start, boost::optional<Element> const& end, Compare compare) {
    boost::optional<order_key> lower;
    boost::optional<order_key> upper;
    if (start) {
      require_present(*start, "sort_tranche: start is not in the container");
      lower = store_->key_of(*start);
    }
    if (end) {
      require_present(*end, "sort_tranche: end is not in the container");
      upper = store_->key_of(*end);
    }
    if (lower && upper && !(*lower < *upper)) return;

    const auto first = lower ? index_.upper_bound(*lower) : index_.begin();
    const auto last = upper ? index_.lower_bound(*upper) : index_.end();
    std::vector<Element> tranche;
    for (auto i = first; i != last; ++i) { tranche.push_back(i->second); }
    if (tranche.empty()) return;

    std::stable_sort(tranche.begin(), tranche.end(), compare);
    commit(tranche, generate_keys(tranche.size(), lower, upper));
  }
  template<typename KeyFunction>
  void sort_tranche_by(boost::optional<Element> const& start, boost::optional<Element> const& end, KeyFunction key_function) {
    sort_tranche_with(start, end,
      [&key_function](Element const& a, Element const& b) { return key_function(a) < key_function(b); });
  }
  void sort_tranche(boost::optional<Element> const& start, boost::optional<Element> const& end) {
    sort_tranche_with(start, end, std::less<Element>());
  }

  // Removes and returns the last element, or the first if !last.
  Element pop_item(bool last = true) {
    caller_correct_if<empty_container>(!index_.empty(), "pop_item: the container is empty");
    const typename index_type::iterator i = last ? boost::prior(index_.end()) : index_.begin();
    const Element result = i->second;
    store_->erase(result);
    index_.erase(i);
    audit();
    return result;
  }

  // Removes and returns up to n elements from the end (or the start if
  // !last), the outermost first.  Returns fewer if there aren't n.
  std::vector<Element> pop_items(size_t n, bool last = true) {
    std::vector<Element> result;
    while ((result.size() < n) && !index_.empty()) {
      result.push_back(pop_item(last));
    }
    return result;
  }

  // Throws element_not_found, removing nothing, unless all the elements
  // are in the container.
  void remove(std::vector<Element> const& elements) {
    for (Element const& e : elements) {
      require_present(e, "remove: element is not in the container");
    }
    discard(elements);
  }
  void remove(Element const& e) {
    remove(std::vector<Element>(1, e));
  }

  // Like remove(), but elements that aren't there are ignored.
  void discard(std::vector<Element> const& elements) {
    for (Element const& e : elements) {
      if (store_->contains(e)) {
        index_.erase(store_->key_of(e));
        store_->erase(e);
      }
    }
    audit();
  }
  void discard(Element const& e) {
    discard(std::vector<Element>(1, e));
  }

private:
  std::unique_ptr<store_type> store_;
  index_type index_;

  void require_present(Element const& e, const char* error)const {
    caller_correct_if<element_not_found>(store_->contains(e), error);
  }

  static std::vector<Element> without_duplicates(std::vector<Element> const& elements, element_set* seen_out = nullptr) {
    element_set seen;
    std::vector<Element> result;
    result.reserve(elements.size());
    for (Element const& e : elements) {
      if (seen.insert(e).second) { result.push_back(e); }
    }
    if (seen_out) { seen_out->swap(seen); }
    return result;
  }

  boost::optional<order_key> nearest_unmoved_after(order_key const& k, element_set const& moving)const {
    for (auto i = index_.upper_bound(k); i != index_.end(); ++i) {
      if (!moving.count(i->second)) return i->first;
    }
    return boost::none;
  }
  boost::optional<order_key> nearest_unmoved_before(order_key const& k, element_set const& moving)const {
    auto i = index_.lower_bound(k);
    while (i != index_.begin()) {
      --i;
      if (!moving.count(i->second)) return i->first;
    }
    return boost::none;
  }

  void index_existing_keys() {
    index_.clear();
    for (Element const& e : store_->elements()) {
      const bool inserted = index_.insert(std::make_pair(store_->key_of(e), e)).second;
      caller_correct_if<std::invalid_argument>(inserted, "two elements of a reorderable_container share an order_key");
    }
    audit();
  }

  // The keys were all computed before this is called, so a bad request
  // never leaves the container half-changed.  The store is written first;
  // if it throws (a caller's setter may), the elements already written get
  // their old keys back and the index is never touched.
  // Old keys all leave the index first: a moving element's new key may be
  // another moving element's old one.
  void commit(std::vector<Element> const& elements, std::vector<order_key> const& keys) {
    assert (elements.size() == keys.size());
    std::vector<boost::optional<order_key>> old_keys;
    old_keys.reserve(elements.size());
    for (Element const& e : elements) {
      if (store_->contains(e)) { old_keys.push_back(store_->key_of(e)); }
      else                     { old_keys.push_back(boost::none); }
    }

    size_t assigned = 0;
    try {
      for (; assigned < elements.size(); ++assigned) {
        store_->assign(elements[assigned], keys[assigned]);
      }
    }
    catch (...) {
      for (size_t i = 0; i < assigned; ++i) {
        if (old_keys[i]) { store_->assign(elements[i], *old_keys[i]); }
        else             { store_->erase(elements[i]); }
      }
      throw;
    }

    for (boost::optional<order_key> const& k : old_keys) {
      if (k) { index_.erase(*k); }
    }
    for (size_t i = 0; i < elements.size(); ++i) {
      const bool inserted = index_.insert(std::make_pair(keys[i], elements[i])).second;
      assert (inserted);
      (void)inserted;
    }
    audit();
  }

  void audit()const {
#ifdef GAPKEY_AUDIT_REORDERABLE_CONTAINER
    if (index_.size() != store_->size()) {
      LOG << "reorderable_container: index has " << index_.size() << " keys but the store has "
          << store_->size() << " elements\n";
    }
    assert (index_.size() == store_->size());
    for (auto const& entry : index_) {
      assert (store_->contains(entry.second));
      const order_key stored = store_->key_of(entry.second);
      if (stored != entry.first) {
        LOG << "reorderable_container: indexed at " << entry.first << " but stored as " << stored << '\n';
      }
      assert (stored == entry.first);
    }
#endif
  }
};

} // end namespace gapkey

#endif
