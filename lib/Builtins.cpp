//===-- Builtins.cpp - Stock extensions -----------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/Builtins.h"
#include "clext/Debug.h"
#include "clext/FlagReconciler.h"
#include "clext/SubCommandBuilder.h"

#include <memory>

using namespace clext;

// Every name in \p Names must be a flag of \p C.
static Error checkFlagsExist(const Command &C,
                             const std::vector<std::string> &Names) {
  for (const std::string &Name : Names)
    if (!C.findFlag(Name))
      return createStringError("no flag named '--" + Name + "'");
  return Error::success();
}

static Error checkNoSubCommand(const Command &C, std::string_view Name) {
  if (C.findSubCommand(Name))
    return createStringError("a subcommand named '" + std::string(Name) +
                             "' already exists");
  return Error::success();
}

//===----------------------------------------------------------------------===//
// Description annotations
//

Extension clext::author(std::string Name) {
  return Extension("author", [Name](Command C) {
    C.setDescription(Name + "\n" + C.getDescription());
    return C;
  });
}

// Render "<Title>:" followed by the lines of \p Text indented by two spaces.
static std::string renderSection(std::string_view Title,
                                 std::string_view Text) {
  std::string Out(Title);
  Out += ":";
  while (!Text.empty()) {
    auto [Line, Rest] = split(Text, '\n');
    Out += "\n";
    if (!Line.empty()) {
      Out += "  ";
      Out += Line;
    }
    Text = Rest;
  }
  return Out;
}

Extension clext::longDescription(std::string Text) {
  return Extension("long-description", [Text](Command C) {
    std::string Section = renderSection("DESCRIPTION", Text);
    const std::optional<std::string> &Existing = C.getFurtherInformation();
    if (!Existing || Existing->empty()) {
      C.setFurtherInformation(std::move(Section));
      return C;
    }
    std::string Joined = *Existing;
    while (!Joined.empty() && Joined.back() == '\n')
      Joined.pop_back();
    C.setFurtherInformation(Joined + "\n\n" + Section);
    return C;
  });
}

//===----------------------------------------------------------------------===//
// Self-referential subcommands
//

static Command::RunHandlerTy makeHelpHandler(const Command &Parent) {
  auto Snapshot = std::make_shared<const Command>(Parent);
  return [Snapshot](const ParsedArguments &Args, std::ostream &OS) {
    const Command *Target = Snapshot.get();
    for (const std::string &Name : Args.Positionals) {
      const Command *Sub = Target->findSubCommand(Name);
      if (!Sub) {
        OS << Snapshot->getName() << ": Unknown subcommand '" << Name
           << "'.  Try: '" << Snapshot->getName() << " help'\n";
        std::vector<std::string_view> Candidates;
        for (const Command &S : Target->subCommands())
          Candidates.push_back(S.getName());
        std::string Nearest = findNearest(Name, Candidates);
        if (!Nearest.empty())
          OS << Snapshot->getName() << ": Did you mean '" << Nearest
             << "'?\n";
        return 1;
      }
      Target = Sub;
    }
    Target->printHelp(OS);
    return 0;
  };
}

Extension clext::helpSubCommand() {
  Extension Ext(
      "help-subcommand",
      [](Command C) {
        return appendSelfReferentialSubCommand(
            std::move(C),
            Command("help", "Display help for this command or a subcommand"),
            makeHelpHandler);
      },
      nullptr, HelpPriority);
  Ext.setValidate(
      [](const Command &C) { return checkNoSubCommand(C, "help"); });
  return Ext;
}

static Command::RunHandlerTy makeVersionHandler(const Command &Parent) {
  auto Snapshot = std::make_shared<const Command>(Parent);
  return [Snapshot](const ParsedArguments &, std::ostream &OS) {
    Snapshot->printVersion(OS);
    return 0;
  };
}

Extension clext::versionSubCommand() {
  Extension Ext("version-subcommand", [](Command C) {
    return appendSelfReferentialSubCommand(
        std::move(C), Command("version", "Display the version of this program"),
        makeVersionHandler);
  });
  Ext.setValidate([](const Command &C) -> Error {
    if (!C.getVersion())
      return createStringError("the command has no version");
    return checkNoSubCommand(C, "version");
  });
  return Ext;
}

//===----------------------------------------------------------------------===//
// Flag value sources and validation
//

Extension clext::defaultValues(DefaultValueList Pairs) {
  std::vector<std::string> Names;
  for (const auto &P : Pairs)
    Names.push_back(P.first);

  Extension Ext(
      "default-values",
      [Pairs](Command C) {
        for (const auto &[Name, Value] : Pairs)
          if (Flag *F = C.findFlag(Name))
            F->Description += " [Default: `" + Value + "`]";
        return C;
      },
      [Pairs](const Command &Final, ParsedArguments Args,
              const Environment &) -> Expected<ParsedArguments> {
        std::vector<ParsedFlag> Defaults;
        for (const auto &[Name, Value] : Pairs) {
          const Flag *F = Final.findFlag(Name);
          Defaults.emplace_back(F ? *F : Flag(Name, ""), Value,
                                FlagSource::Default);
        }
        Args.Flags =
            unionLeftBy(parsedFlagName, std::move(Args.Flags), Defaults);
        return std::move(Args);
      });
  Ext.setValidate([Names](const Command &C) {
    return checkFlagsExist(C, Names);
  });
  return Ext;
}

Extension clext::require(std::vector<std::string> LongNames) {
  Extension Ext(
      "require",
      [LongNames](Command C) {
        for (const std::string &Name : LongNames)
          if (Flag *F = C.findFlag(Name))
            F->Description = "[Required] " + F->Description;
        return C;
      },
      [LongNames](const Command &, ParsedArguments Args,
                  const Environment &) -> Expected<ParsedArguments> {
        if (Args.requestsHelpOrVersion())
          return std::move(Args);
        std::vector<std::string> Missing = diffBy(
            IdentityKey(), LongNames, collectKeys(parsedFlagName, Args.Flags));
        if (!Missing.empty())
          return createStringError("for the --" + Missing.front() +
                                   " option: must be specified at least once!");
        return std::move(Args);
      },
      RequirePriority);
  Ext.setValidate([LongNames](const Command &C) {
    return checkFlagsExist(C, LongNames);
  });
  return Ext;
}

Extension clext::envVars() {
  return Extension(
      "env-vars",
      [](Command C) {
        for (Flag &F : C.flags())
          if (F.hasEnvVar())
            F.Description += " [env: " + *F.EnvVar + "]";
        return C;
      },
      [](const Command &Final, ParsedArguments Args,
         const Environment &Env) -> Expected<ParsedArguments> {
        std::vector<ParsedFlag> FromEnv;
        for (const Flag &F : Final.flags()) {
          if (!F.hasEnvVar())
            continue;
          if (std::optional<std::string> Value = Env.lookup(*F.EnvVar)) {
            CLEXT_DEBUG(dbgs() << "[env-vars] --" << F.LongName << " from "
                               << *F.EnvVar << "\n");
            FromEnv.emplace_back(F, std::move(*Value), FlagSource::EnvVar);
          }
        }
        Args.Flags =
            unionLeftBy(parsedFlagName, std::move(Args.Flags), FromEnv);
        return std::move(Args);
      },
      EnvVarsPriority);
}
