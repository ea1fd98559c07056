//===-- Support.cpp - String helpers --------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/Support.h"

#include <algorithm>

using namespace clext;

std::pair<std::string_view, std::string_view> clext::split(std::string_view S,
                                                           char Sep) {
  auto Pos = S.find(Sep);
  if (Pos == std::string_view::npos)
    return {S, {}};
  return {S.substr(0, Pos), S.substr(Pos + 1)};
}

// Ported from llvm/ADT/edit_distance.h, replacements allowed.
unsigned clext::editDistance(std::string_view From, std::string_view To,
                             unsigned MaxEditDistance) {
  size_t m = From.size(), n = To.size();

  if (MaxEditDistance) {
    size_t AbsDiff = m > n ? m - n : n - m;
    if (AbsDiff > MaxEditDistance)
      return MaxEditDistance + 1;
  }

  std::vector<unsigned> Row(n + 1);
  for (unsigned i = 1; i <= n; ++i)
    Row[i] = i;

  for (size_t y = 1; y <= m; ++y) {
    Row[0] = static_cast<unsigned>(y);
    unsigned BestThisRow = Row[0];

    unsigned Previous = static_cast<unsigned>(y - 1);
    for (size_t x = 1; x <= n; ++x) {
      unsigned OldRow = Row[x];
      Row[x] = std::min(Previous + (From[y - 1] == To[x - 1] ? 0u : 1u),
                        std::min(Row[x - 1], Row[x]) + 1);
      Previous = OldRow;
      BestThisRow = std::min(BestThisRow, Row[x]);
    }

    if (MaxEditDistance && BestThisRow > MaxEditDistance)
      return MaxEditDistance + 1;
  }

  return Row[n];
}

std::string clext::findNearest(std::string_view Name,
                               const std::vector<std::string_view> &Candidates,
                               unsigned MaxEditDistance) {
  std::string_view Best;
  unsigned BestDistance = MaxEditDistance + 1;
  for (std::string_view Candidate : Candidates) {
    unsigned Distance = editDistance(Name, Candidate, MaxEditDistance);
    if (Distance < BestDistance) {
      Best = Candidate;
      BestDistance = Distance;
    }
  }
  return std::string(Best);
}
