//===-- Command.cpp - Command tree values ---------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "clext/Command.h"
#include "clext/Support.h"

#include <algorithm>

using namespace clext;

std::string_view clext::getFlagSourceName(FlagSource Source) {
  switch (Source) {
  case FlagSource::UserProvided:
    return "user";
  case FlagSource::Default:
    return "default";
  case FlagSource::EnvVar:
    return "env";
  }
  return "unknown";
}

//===----------------------------------------------------------------------===//
// ParsedArguments implementation
//

const ParsedFlag *ParsedArguments::lookup(std::string_view LongName) const {
  auto I = std::find_if(Flags.begin(), Flags.end(), [&](const ParsedFlag &PF) {
    return PF.getName() == LongName;
  });
  return I == Flags.end() ? nullptr : &*I;
}

std::optional<std::string>
ParsedArguments::getValue(std::string_view LongName) const {
  if (const ParsedFlag *PF = lookup(LongName))
    return PF->Value;
  return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Command implementation
//

Command &Command::addFlag(Flag F) {
  if (findFlag(F.LongName))
    report_fatal_error("Command '" + Name + "' already has a flag named '--" +
                       F.LongName + "'");
  Flags.push_back(std::move(F));
  return *this;
}

const Flag *Command::findFlag(std::string_view LongName) const {
  for (const Flag &F : Flags)
    if (F.LongName == LongName)
      return &F;
  return nullptr;
}

Flag *Command::findFlag(std::string_view LongName) {
  for (Flag &F : Flags)
    if (F.LongName == LongName)
      return &F;
  return nullptr;
}

Command &Command::addSubCommand(Command Sub) {
  SubCommands.push_back(std::move(Sub));
  return *this;
}

const Command *Command::findSubCommand(std::string_view SubName) const {
  for (const Command &Sub : SubCommands)
    if (Sub.getName() == SubName)
      return &Sub;
  return nullptr;
}

// Width of "  --name=<value>" for one flag.
static size_t getFlagWidth(const Flag &F) {
  size_t Len = 4 + F.LongName.size();
  if (!F.isSwitch())
    Len += F.ValueName.size() + 3;
  return Len;
}

// Print a possibly multi-line description. The first line continues the
// current line; the rest are indented to \p Indent.
static void printDescription(std::ostream &OS, std::string_view Text,
                             size_t Indent) {
  auto [First, Rest] = split(Text, '\n');
  OS << " - " << First << "\n";
  while (!Rest.empty()) {
    auto [Line, Remaining] = split(Rest, '\n');
    indent(OS, Indent + 3);
    OS << Line << "\n";
    Rest = Remaining;
  }
}

void Command::printHelp(std::ostream &OS) const {
  if (!Description.empty())
    OS << "OVERVIEW: " << Description << "\n\n";

  OS << "USAGE: " << Name;
  if (!SubCommands.empty())
    OS << " [subcommand]";
  OS << " [options]";

  if (!SubCommands.empty()) {
    size_t MaxSubLen = 0;
    for (const Command &Sub : SubCommands)
      MaxSubLen = std::max(MaxSubLen, Sub.getName().size());

    OS << "\n\n";
    OS << "SUBCOMMANDS:\n\n";
    for (const Command &Sub : SubCommands) {
      OS << "  " << Sub.getName();
      if (!Sub.getDescription().empty()) {
        indent(OS, MaxSubLen - Sub.getName().size());
        OS << " - " << split(Sub.getDescription(), '\n').first;
      }
      OS << "\n";
    }
    OS << "\n";
    OS << "  Type \"" << Name
       << " <subcommand> --help\" to get more help on a specific "
          "subcommand";
  }

  OS << "\n\n";

  if (!Flags.empty()) {
    size_t MaxArgLen = 0;
    for (const Flag &F : Flags)
      MaxArgLen = std::max(MaxArgLen, getFlagWidth(F));

    OS << "OPTIONS:\n";
    for (const Flag &F : Flags) {
      OS << "  --" << F.LongName;
      if (!F.isSwitch())
        OS << "=<" << F.ValueName << '>';
      indent(OS, MaxArgLen - getFlagWidth(F));
      printDescription(OS, F.Description, MaxArgLen);
    }
  }

  if (FurtherInformation && !FurtherInformation->empty()) {
    if (!Flags.empty())
      OS << "\n";
    OS << *FurtherInformation << "\n";
  }
}

void Command::printVersion(std::ostream &OS) const {
  if (!Version)
    report_fatal_error("Command '" + Name + "' has no version to print");
  OS << Name << " version " << *Version << "\n";
}

int Command::run(const ParsedArguments &Args, std::ostream &OS) const {
  if (!RunHandler) {
    printHelp(OS);
    return 0;
  }
  return RunHandler(Args, OS);
}
