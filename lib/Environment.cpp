//===-- Environment.cpp - Environment variable lookup ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/Environment.h"

#include <cstdlib>

using namespace clext;

void Environment::anchor() {}

std::optional<std::string>
ProcessEnvironment::lookup(std::string_view Name) const {
  const std::string Key(Name);
  const char *Val = std::getenv(Key.c_str());
  if (!Val)
    return std::nullopt;
  return std::string(Val);
}

const ProcessEnvironment &ProcessEnvironment::get() {
  static ProcessEnvironment Env;
  return Env;
}

std::optional<std::string> MapEnvironment::lookup(std::string_view Name) const {
  auto I = Vars.find(Name);
  if (I == Vars.end())
    return std::nullopt;
  return I->second;
}
