//===- clext/SubCommandBuilder.h - Self-referential children ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Inserting a subcommand whose run handler needs the parent it ends up in.
// Commands are values, so the child cannot hold a reference to a parent that
// does not exist yet. Instead the child is appended with a placeholder
// handler, the real handler is built from the resulting parent, and the
// placeholder is then swapped out in place:
//
//   Command Root = appendSelfReferentialSubCommand(
//       std::move(Root), Command("help", "Display available options"),
//       [](const Command &Parent) -> Command::RunHandlerTy {
//         return [Parent](const ParsedArguments &, std::ostream &OS) {
//           Parent.printHelp(OS);
//           return 0;
//         };
//       });
//
// The parent handed to the factory already lists the child, but it reflects
// the tree as of this insertion only. Anything added to the tree afterwards
// is not visible through it.
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_SUBCOMMANDBUILDER_H
#define CLEXT_SUBCOMMANDBUILDER_H

#include "clext/Command.h"

#include <functional>

namespace clext {

using HandlerFactoryTy =
    std::function<Command::RunHandlerTy(const Command &Parent)>;

/// Append \p Child to \p Parent's subcommands with a run handler produced by
/// \p MakeHandler from the parent that contains the child. Any handler
/// already set on \p Child is replaced. The parent reference passed to
/// \p MakeHandler is only valid for the duration of the call; handlers must
/// capture a copy.
Command appendSelfReferentialSubCommand(Command Parent, Command Child,
                                        const HandlerFactoryTy &MakeHandler);

} // end namespace clext

#endif // CLEXT_SUBCOMMANDBUILDER_H
