//===- clext/Debug.h - Developer tracing ------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Runtime-switchable debug output. Wrap tracing statements in CLEXT_DEBUG so
// they cost a single flag check when tracing is off:
//
//   CLEXT_DEBUG(dbgs() << "applying '" << Ext.getName() << "'\n");
//
// Tracing starts enabled when the CLEXT_DEBUG environment variable is set to
// 1, true, on or yes.
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_DEBUG_H
#define CLEXT_DEBUG_H

#include <ostream>

namespace clext {

bool isDebugEnabled();
void setDebugEnabled(bool Enabled);

/// Stream for debug output. Always stderr.
std::ostream &dbgs();

} // end namespace clext

#define CLEXT_DEBUG(X)                                                         \
  do {                                                                         \
    if (::clext::isDebugEnabled()) {                                           \
      X;                                                                       \
    }                                                                          \
  } while (false)

#endif // CLEXT_DEBUG_H
