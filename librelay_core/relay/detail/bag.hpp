// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace relay::detail {

/// An ordered collection of values that can be removed individually by the
/// token returned from `insert`. Iterating a bag visits values in insertion
/// order.
template <class T>
class bag {
public:
  // -- member types -----------------------------------------------------------

  using token = uint64_t;

  struct entry {
    token key;
    T value;
  };

  using value_type = T;

  // -- modifiers --------------------------------------------------------------

  /// Appends `x` and returns a token for removing it again.
  token insert(T x) {
    auto key = next_token_++;
    entries_.push_back(entry{key, std::move(x)});
    return key;
  }

  /// Removes the value for `key`. Returns `false` if no such value exists.
  bool erase(token key) {
    auto i = find(key);
    if (i == entries_.end())
      return false;
    entries_.erase(i);
    return true;
  }

  /// Removes the value for `key` and returns it.
  std::optional<T> extract(token key) {
    auto i = find(key);
    if (i == entries_.end())
      return std::nullopt;
    std::optional<T> result{std::move(i->value)};
    entries_.erase(i);
    return result;
  }

  void clear() noexcept {
    entries_.clear();
  }

  // -- properties -------------------------------------------------------------

  bool empty() const noexcept {
    return entries_.empty();
  }

  size_t size() const noexcept {
    return entries_.size();
  }

  /// Returns a copy of all values in insertion order.
  std::vector<T> values() const {
    std::vector<T> result;
    result.reserve(entries_.size());
    for (auto& x : entries_)
      result.push_back(x.value);
    return result;
  }

  /// Moves all values out of the bag and leaves it empty.
  std::vector<T> take_values() {
    std::vector<T> result;
    result.reserve(entries_.size());
    for (auto& x : entries_)
      result.push_back(std::move(x.value));
    entries_.clear();
    return result;
  }

  template <class F>
  void for_each(F&& f) const {
    for (auto& x : entries_)
      f(x.value);
  }

private:
  typename std::vector<entry>::iterator find(token key) {
    // Tokens grow monotonically, so entries_ is always sorted by key.
    auto pred = [](const entry& x, token y) { return x.key < y; };
    auto i = std::lower_bound(entries_.begin(), entries_.end(), key, pred);
    if (i != entries_.end() && i->key != key)
      return entries_.end();
    return i;
  }

  token next_token_ = 0;
  std::vector<entry> entries_;
};

} // namespace relay::detail
