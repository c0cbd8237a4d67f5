// This file is part of relay, a library for composable event streams. See the
// file LICENSE in the main distribution directory for license terms and
// copyright.

#pragma once

#include <tuple>
#include <utility>
#include <vector>

#include "relay/producer.hpp"

namespace relay::detail {

template <class E, class... Ts>
producer<std::tuple<Ts...>, E>
fold_combine_latest(producer<std::tuple<Ts...>, E> acc) {
  return acc;
}

template <class E, class... Ts, class U, class... Us>
auto fold_combine_latest(producer<std::tuple<Ts...>, E> acc,
                         producer<U, E> next, producer<Us, E>... tail) {
  using pair_type = std::pair<std::tuple<Ts...>, U>;
  auto joined = acc.combine_latest_with(std::move(next))
                  .map([](const pair_type& x) {
                    return std::tuple_cat(x.first, std::make_tuple(x.second));
                  });
  return fold_combine_latest(std::move(joined), std::move(tail)...);
}

template <class E, class... Ts>
producer<std::tuple<Ts...>, E> fold_zip(producer<std::tuple<Ts...>, E> acc) {
  return acc;
}

template <class E, class... Ts, class U, class... Us>
auto fold_zip(producer<std::tuple<Ts...>, E> acc, producer<U, E> next,
              producer<Us, E>... tail) {
  using pair_type = std::pair<std::tuple<Ts...>, U>;
  auto joined = acc.zip_with(std::move(next)).map([](const pair_type& x) {
    return std::tuple_cat(x.first, std::make_tuple(x.second));
  });
  return fold_zip(std::move(joined), std::move(tail)...);
}

template <class T, class E>
producer<std::tuple<T>, E> as_tuple_producer(const producer<T, E>& x) {
  return x.map([](const T& value) { return std::make_tuple(value); });
}

template <class T, class E>
producer<std::vector<T>, E> as_vector_producer(const producer<T, E>& x) {
  return x.map([](const T& value) { return std::vector<T>{value}; });
}

template <class T>
std::vector<T> append_to_vector(const std::pair<std::vector<T>, T>& x) {
  auto result = x.first;
  result.push_back(x.second);
  return result;
}

} // namespace relay::detail

namespace relay {

/// Combines the latest values of all inputs into a tuple whenever one of
/// them emits, once each input emitted at least one value. Completes after
/// all inputs completed.
template <class T1, class T2, class E, class... Ts>
producer<std::tuple<T1, T2, Ts...>, E>
combine_latest(producer<T1, E> x1, producer<T2, E> x2, producer<Ts, E>... xs) {
  return detail::fold_combine_latest(detail::as_tuple_producer(x1),
                                     std::move(x2), std::move(xs)...);
}

/// Combines the latest values of all producers in `xs` into a vector.
/// Returns `empty()` if `xs` is empty.
template <class T, class E>
producer<std::vector<T>, E>
combine_latest(const std::vector<producer<T, E>>& xs) {
  using output_type = producer<std::vector<T>, E>;
  if (xs.empty())
    return output_type::empty();
  auto result = detail::as_vector_producer(xs.front());
  for (auto i = xs.begin() + 1; i != xs.end(); ++i)
    result = result.combine_latest_with(*i).map(
      detail::append_to_vector<T>);
  return result;
}

/// Combines the n-th values of all inputs into a tuple. Completes as soon as
/// one input completed and has no buffered values.
template <class T1, class T2, class E, class... Ts>
producer<std::tuple<T1, T2, Ts...>, E>
zip(producer<T1, E> x1, producer<T2, E> x2, producer<Ts, E>... xs) {
  return detail::fold_zip(detail::as_tuple_producer(x1), std::move(x2),
                          std::move(xs)...);
}

/// Combines the n-th values of all producers in `xs` into a vector. Returns
/// `empty()` if `xs` is empty.
template <class T, class E>
producer<std::vector<T>, E> zip(const std::vector<producer<T, E>>& xs) {
  using output_type = producer<std::vector<T>, E>;
  if (xs.empty())
    return output_type::empty();
  auto result = detail::as_vector_producer(xs.front());
  for (auto i = xs.begin() + 1; i != xs.end(); ++i)
    result = result.zip_with(*i).map(detail::append_to_vector<T>);
  return result;
}

} // namespace relay
