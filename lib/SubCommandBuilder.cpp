//===-- SubCommandBuilder.cpp - Self-referential children -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/SubCommandBuilder.h"
#include "clext/Debug.h"

using namespace clext;

static int placeholderHandler(const ParsedArguments &, std::ostream &) {
  return 0;
}

Command clext::appendSelfReferentialSubCommand(
    Command Parent, Command Child, const HandlerFactoryTy &MakeHandler) {
  Child.setRunHandler(placeholderHandler);

  const size_t Index = Parent.subCommands().size();
  Parent.addSubCommand(Child);

  Command::RunHandlerTy Handler = MakeHandler(Parent);
  Child.setRunHandler(std::move(Handler));
  Parent.subCommands()[Index] = std::move(Child);

  CLEXT_DEBUG(dbgs() << "[subcommand] bound '" << Parent.getName() << " "
                     << Parent.subCommands()[Index].getName()
                     << "' at index " << Index << "\n");
  return Parent;
}
