//===-- Dispatch.cpp - Running an extended command ------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/Dispatch.h"
#include "clext/Debug.h"
#include "clext/Support.h"

using namespace clext;

static void reportUnknownSubCommand(const Command &Root, const Command &Parent,
                                    std::string_view Name,
                                    std::ostream &Errs) {
  Errs << Root.getName() << ": Unknown subcommand '" << Name << "'.  Try: '"
       << Root.getName() << " --help'\n";

  std::vector<std::string_view> Candidates;
  for (const Command &Sub : Parent.subCommands())
    Candidates.push_back(Sub.getName());
  std::string Nearest = findNearest(Name, Candidates);
  if (Nearest.empty())
    return;
  Errs << Root.getName() << ": Did you mean '" << Nearest << "'?\n";
}

int clext::dispatch(const Command &Root, const ExtensionPipeline &Pipeline,
                    ParsedArguments Args, std::ostream &OS, std::ostream &Errs,
                    const Environment &Env) {
  const Command *Target = &Root;
  for (const std::string &Name : Args.SubCommandPath) {
    const Command *Sub = Target->findSubCommand(Name);
    if (!Sub) {
      reportUnknownSubCommand(Root, *Target, Name, Errs);
      return 1;
    }
    Target = Sub;
  }

  CLEXT_DEBUG(dbgs() << "[dispatch] selected '" << Target->getName()
                     << "'\n");

  if (Target == &Root) {
    Expected<ParsedArguments> Final =
        Pipeline.applyPostprocess(Root, std::move(Args), Env);
    if (!Final) {
      Errs << Root.getName() << ": error: " << toString(Final.takeError())
           << "\n";
      return 1;
    }
    Args = std::move(*Final);
  }

  if (Args.hasFlag(HelpFlagName)) {
    Target->printHelp(OS);
    return 0;
  }
  // Required flags were not checked for a --version request, so the handler
  // must not run even when there is no version to print.
  if (Args.hasFlag(VersionFlagName)) {
    if (!Target->getVersion()) {
      Errs << Root.getName() << ": error: '" << Target->getName()
           << "' has no version\n";
      return 1;
    }
    Target->printVersion(OS);
    return 0;
  }
  return Target->run(Args, OS);
}

int clext::dispatch(const Command &Root, const ExtensionPipeline &Pipeline,
                    ParsedArguments Args) {
  return dispatch(Root, Pipeline, std::move(Args), outs(), errs(),
                  ProcessEnvironment::get());
}
