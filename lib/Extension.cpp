//===-- Extension.cpp - Command extensions and their pipeline -------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/Extension.h"
#include "clext/Debug.h"

#include <algorithm>

using namespace clext;

//===----------------------------------------------------------------------===//
// Extension implementation
//

Extension::Extension(std::string Name, ExtendFnTy Extend,
                     PostprocessFnTy Postprocess, int Priority)
    : Name(std::move(Name)), Priority(Priority), Extend(std::move(Extend)),
      Postprocess(std::move(Postprocess)) {}

Error Extension::validate(const Command &C) const {
  if (!Validate)
    return Error::success();
  if (Error Err = Validate(C))
    return createStringError("extension '" + Name + "' cannot be applied to '" +
                             C.getName() + "': " + toString(std::move(Err)));
  return Error::success();
}

Expected<Command> Extension::tryExtend(Command C) const {
  if (Error Err = validate(C))
    return std::move(Err);
  if (!Extend)
    return std::move(C);
  return Extend(std::move(C));
}

Command Extension::extend(Command C) const {
  return cantFail(tryExtend(std::move(C)));
}

Expected<ParsedArguments> Extension::postprocess(const Command &Final,
                                                 ParsedArguments Args,
                                                 const Environment &Env) const {
  if (!Postprocess)
    return std::move(Args);
  return Postprocess(Final, std::move(Args), Env);
}

//===----------------------------------------------------------------------===//
// ExtensionPipeline implementation
//

ExtensionPipeline::ExtensionPipeline(std::vector<Extension> Exts)
    : Extensions(std::move(Exts)) {
  std::stable_sort(Extensions.begin(), Extensions.end(),
                   [](const Extension &A, const Extension &B) {
                     return A.getPriority() < B.getPriority();
                   });
}

ExtensionPipeline &ExtensionPipeline::add(Extension E) {
  auto I = std::upper_bound(Extensions.begin(), Extensions.end(),
                            E.getPriority(),
                            [](int Priority, const Extension &Other) {
                              return Priority < Other.getPriority();
                            });
  Extensions.insert(I, std::move(E));
  return *this;
}

Expected<Command> ExtensionPipeline::tryApplyStructural(Command C) const {
  for (const Extension &Ext : Extensions) {
    CLEXT_DEBUG(dbgs() << "[pipeline] extend '" << C.getName() << "' with '"
                       << Ext.getName() << "' (priority "
                       << Ext.getPriority() << ")\n");
    Expected<Command> Next = Ext.tryExtend(std::move(C));
    if (!Next)
      return Next.takeError();
    C = std::move(*Next);
  }
  return std::move(C);
}

Command ExtensionPipeline::applyStructural(Command C) const {
  return cantFail(tryApplyStructural(std::move(C)));
}

Expected<ParsedArguments>
ExtensionPipeline::applyPostprocess(const Command &Final, ParsedArguments Args,
                                    const Environment &Env) const {
  for (const Extension &Ext : Extensions) {
    if (!Ext.hasPostprocess())
      continue;
    CLEXT_DEBUG(dbgs() << "[pipeline] postprocess '" << Final.getName()
                       << "' with '" << Ext.getName() << "'\n");
    Expected<ParsedArguments> Next =
        Ext.postprocess(Final, std::move(Args), Env);
    if (!Next) {
      Error Err = Next.takeError();
      CLEXT_DEBUG(dbgs() << "[pipeline] '" << Ext.getName()
                         << "' failed: " << Err.message() << "\n");
      return std::move(Err);
    }
    Args = std::move(*Next);
  }
  return std::move(Args);
}

Expected<ParsedArguments>
ExtensionPipeline::applyPostprocess(const Command &Final,
                                    ParsedArguments Args) const {
  return applyPostprocess(Final, std::move(Args), ProcessEnvironment::get());
}
