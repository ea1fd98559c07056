//===- clext/Dispatch.h - Running an extended command -----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_DISPATCH_H
#define CLEXT_DISPATCH_H

#include "clext/Command.h"
#include "clext/Environment.h"
#include "clext/Extension.h"

#include <ostream>

namespace clext {

/// Run one parsed invocation of \p Root, which must be the result of
/// \p Pipeline's structural phase.
///
/// Args.SubCommandPath selects the command to run. When it selects \p Root
/// itself, the pipeline's postprocess phase runs first and a failure is
/// reported on \p Errs as "<name>: error: <message>". A parsed --help or
/// --version flag prints help or the version banner instead of running the
/// handler; --version on a command without a version is an error.
///
/// Returns the process exit code.
int dispatch(const Command &Root, const ExtensionPipeline &Pipeline,
             ParsedArguments Args, std::ostream &OS, std::ostream &Errs,
             const Environment &Env);

/// As above, printing to stdout/stderr and reading the process environment.
int dispatch(const Command &Root, const ExtensionPipeline &Pipeline,
             ParsedArguments Args);

} // end namespace clext

#endif // CLEXT_DISPATCH_H
