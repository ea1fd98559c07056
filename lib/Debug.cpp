//===-- Debug.cpp - Developer tracing -------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/Debug.h"

#include <cstdlib>
#include <iostream>
#include <string_view>

using namespace clext;

static bool parseDebugEnv() {
  const char *Val = std::getenv("CLEXT_DEBUG");
  if (!Val)
    return false;
  std::string_view V(Val);
  return V == "1" || V == "true" || V == "on" || V == "yes";
}

static bool &debugFlag() {
  static bool Flag = parseDebugEnv();
  return Flag;
}

bool clext::isDebugEnabled() { return debugFlag(); }

void clext::setDebugEnabled(bool Enabled) { debugFlag() = Enabled; }

std::ostream &clext::dbgs() { return std::cerr; }
