//===- clext/FlagReconciler.h - Keyed union and difference ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Merge and difference primitives over sequences whose elements are
// identified by a key, typically a flag's long name. Both operations are
// stable: surviving elements keep their relative input order.
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_FLAGRECONCILER_H
#define CLEXT_FLAGRECONCILER_H

#include <functional>
#include <iterator>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace clext {

/// Projection returning its argument, for sequences that are their own keys.
struct IdentityKey {
  template <typename T> const T &operator()(const T &V) const { return V; }
};

template <typename KeyFn, typename T>
using ReconcileKeyTy = std::decay_t<std::invoke_result_t<KeyFn &, const T &>>;

/// Collect the keys of \p Elements into a set.
template <typename T, typename KeyFn>
std::unordered_set<ReconcileKeyTy<KeyFn, T>>
collectKeys(KeyFn Key, const std::vector<T> &Elements) {
  std::unordered_set<ReconcileKeyTy<KeyFn, T>> Keys;
  for (const T &E : Elements)
    Keys.insert(std::invoke(Key, E));
  return Keys;
}

/// Return every element of \p Primary followed by the elements of
/// \p Secondary whose key does not occur in \p Primary. On a key collision the
/// primary element wins and the secondary one is dropped.
template <typename T, typename KeyFn>
std::vector<T> unionLeftBy(KeyFn Key, std::vector<T> Primary,
                           const std::vector<T> &Secondary) {
  const auto PrimaryKeys = collectKeys(Key, Primary);
  for (const T &E : Secondary)
    if (!PrimaryKeys.count(std::invoke(Key, E)))
      Primary.push_back(E);
  return Primary;
}

/// Return the elements of \p Candidates whose key does not occur in
/// \p ExcludeKeys.
template <typename T, typename KeyFn, typename KeyRange>
std::vector<T> diffBy(KeyFn Key, const std::vector<T> &Candidates,
                      const KeyRange &ExcludeKeys) {
  const std::unordered_set<ReconcileKeyTy<KeyFn, T>> Excluded(
      std::begin(ExcludeKeys), std::end(ExcludeKeys));
  std::vector<T> Result;
  for (const T &E : Candidates)
    if (!Excluded.count(std::invoke(Key, E)))
      Result.push_back(E);
  return Result;
}

} // end namespace clext

#endif // CLEXT_FLAGRECONCILER_H
