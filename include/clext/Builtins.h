//===- clext/Builtins.h - Stock extensions ----------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Ready-made extensions. A typical program combines several of them:
//
//   ExtensionPipeline Pipeline{
//       author("Jane Doe"),
//       defaultValues({{"level", "info"}}),
//       require({"token"}),
//       envVars(),
//       versionSubCommand(),
//       helpSubCommand(),
//   };
//   Command Final = Pipeline.applyStructural(std::move(Root));
//
// Extensions naming flags or needing a version reject commands that lack
// them. Through ExtensionPipeline::applyStructural that rejection is a fatal
// error; tryApplyStructural returns it instead.
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_BUILTINS_H
#define CLEXT_BUILTINS_H

#include "clext/Extension.h"

#include <string>
#include <utility>
#include <vector>

namespace clext {

/// Environment values must be in place before defaults fill the gaps, and
/// both before required flags are checked. The help subcommand comes last so
/// the help it prints shows every annotation made before it.
inline constexpr int EnvVarsPriority = -150;
inline constexpr int RequirePriority = -50;
inline constexpr int HelpPriority = 0;

/// Prepend "<Name>\n" to the command description.
Extension author(std::string Name);

/// Append a DESCRIPTION section holding \p Text to the further information
/// shown at the end of the help text.
Extension longDescription(std::string Text);

/// Add a "help" subcommand printing the help of the command it was added to,
/// or of the subcommand named by its positional arguments.
Extension helpSubCommand();

/// Add a "version" subcommand printing the command's version banner. The
/// command must have a version.
Extension versionSubCommand();

using DefaultValueList = std::vector<std::pair<std::string, std::string>>;

/// Give each named flag a default value, used when the user did not supply
/// one. Every name must refer to an existing flag.
Extension defaultValues(DefaultValueList Pairs);

/// Reject invocations that leave any of the named flags unset, unless help or
/// version output was requested. Every name must refer to an existing flag.
Extension require(std::vector<std::string> LongNames);

/// Fill flags bound to an environment variable from that variable when the
/// user did not supply them.
Extension envVars();

} // end namespace clext

#endif // CLEXT_BUILTINS_H
