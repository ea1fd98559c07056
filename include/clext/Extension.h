//===- clext/Extension.h - Command extensions and their pipeline -*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// An Extension augments a command in two phases. The structural phase
// rewrites the command definition before help is rendered or arguments are
// parsed. The postprocess phase rewrites or validates the parsed arguments
// afterwards and may reject them with a user-facing error.
//
// An ExtensionPipeline orders extensions by ascending priority, keeping
// declaration order among equal priorities, and runs both phases in that
// order.
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_EXTENSION_H
#define CLEXT_EXTENSION_H

#include "clext/Command.h"
#include "clext/Environment.h"
#include "clext/Support.h"

#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace clext {

class Extension {
public:
  /// Checks that the extension can be applied to a command. A failure means
  /// the program's command definition is wrong.
  using ValidateFnTy = std::function<Error(const Command &C)>;
  using ExtendFnTy = std::function<Command(Command C)>;
  /// \p Final is the fully extended command the arguments were parsed
  /// against.
  using PostprocessFnTy = std::function<Expected<ParsedArguments>(
      const Command &Final, ParsedArguments Args, const Environment &Env)>;

  /// Priority of extensions that do not ask for a specific position.
  static constexpr int DefaultPriority = -100;

  Extension(std::string Name, ExtendFnTy Extend,
            PostprocessFnTy Postprocess = nullptr,
            int Priority = DefaultPriority);

  const std::string &getName() const { return Name; }
  int getPriority() const { return Priority; }

  Extension &setPriority(int P) {
    Priority = P;
    return *this;
  }
  Extension &setValidate(ValidateFnTy V) {
    Validate = std::move(V);
    return *this;
  }

  bool hasPostprocess() const { return static_cast<bool>(Postprocess); }

  Error validate(const Command &C) const;

  /// Validate \p C and apply the structural transform to it.
  Expected<Command> tryExtend(Command C) const;

  /// As tryExtend, but a validation failure is a fatal error.
  Command extend(Command C) const;

  /// Apply the postprocess transform. Extensions without one return \p Args
  /// unchanged.
  Expected<ParsedArguments> postprocess(const Command &Final,
                                        ParsedArguments Args,
                                        const Environment &Env) const;

private:
  std::string Name;
  int Priority;
  ValidateFnTy Validate;
  ExtendFnTy Extend;
  PostprocessFnTy Postprocess;
};

class ExtensionPipeline {
  std::vector<Extension> Extensions;

public:
  ExtensionPipeline() = default;
  explicit ExtensionPipeline(std::vector<Extension> Exts);
  ExtensionPipeline(std::initializer_list<Extension> IL)
      : ExtensionPipeline(std::vector<Extension>(IL)) {}

  /// Insert \p E after every extension whose priority is not greater.
  ExtensionPipeline &add(Extension E);

  /// The extensions in the order both phases visit them.
  const std::vector<Extension> &extensions() const { return Extensions; }
  bool empty() const { return Extensions.empty(); }
  size_t size() const { return Extensions.size(); }

  /// Fold every structural transform over \p C, stopping at the first
  /// extension that rejects the command it is given.
  Expected<Command> tryApplyStructural(Command C) const;

  /// As tryApplyStructural, but a rejected command is a fatal error.
  Command applyStructural(Command C) const;

  /// Fold every postprocess transform over \p Args. The first failure is
  /// returned and no later extension runs.
  Expected<ParsedArguments> applyPostprocess(const Command &Final,
                                             ParsedArguments Args,
                                             const Environment &Env) const;

  /// As above, reading variables from the process environment.
  Expected<ParsedArguments> applyPostprocess(const Command &Final,
                                             ParsedArguments Args) const;
};

} // end namespace clext

#endif // CLEXT_EXTENSION_H
