//===- clext/Environment.h - Environment variable lookup --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_ENVIRONMENT_H
#define CLEXT_ENVIRONMENT_H

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace clext {

/// Read-only view of environment variables handed to postprocess steps.
/// A variable set to the empty string is present with an empty value.
class Environment {
  // Out of line virtual function to provide home for the class.
  virtual void anchor();

public:
  virtual ~Environment() = default;

  virtual std::optional<std::string> lookup(std::string_view Name) const = 0;
};

/// The environment of the running process.
class ProcessEnvironment : public Environment {
public:
  std::optional<std::string> lookup(std::string_view Name) const override;

  static const ProcessEnvironment &get();
};

/// A fixed table of variables.
class MapEnvironment : public Environment {
  std::map<std::string, std::string, std::less<>> Vars;

public:
  MapEnvironment() = default;
  MapEnvironment(
      std::initializer_list<std::pair<const std::string, std::string>> IL)
      : Vars(IL) {}

  void set(std::string Name, std::string Value) {
    Vars[std::move(Name)] = std::move(Value);
  }

  std::optional<std::string> lookup(std::string_view Name) const override;
};

} // end namespace clext

#endif // CLEXT_ENVIRONMENT_H
