//===- clext/Command.h - Command tree values --------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Value types describing a command line program: the command tree with its
// flags, and the parsed arguments produced for one invocation of it. All of
// them are plain values; extensions derive new copies instead of mutating a
// shared tree.
//
//===----------------------------------------------------------------------===//

#ifndef CLEXT_COMMAND_H
#define CLEXT_COMMAND_H

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clext {

/// Long names of the flags that request help or version output instead of
/// running a command.
inline constexpr std::string_view HelpFlagName = "help";
inline constexpr std::string_view VersionFlagName = "version";

//===----------------------------------------------------------------------===//
//
struct Flag {
  std::string LongName;    // The flag name without dashes (ex: "level")
  std::string Description; // The descriptive text shown by help
  std::optional<std::string> EnvVar; // Variable that may supply the value
  std::string ValueName; // Value placeholder for help, empty for switches

  Flag() = default;
  Flag(std::string LongName, std::string Description,
       std::optional<std::string> EnvVar = std::nullopt,
       std::string ValueName = "value")
      : LongName(std::move(LongName)), Description(std::move(Description)),
        EnvVar(std::move(EnvVar)), ValueName(std::move(ValueName)) {}

  bool hasEnvVar() const { return EnvVar.has_value(); }
  bool isSwitch() const { return ValueName.empty(); }
};

/// Where the value of a parsed flag came from.
enum class FlagSource { UserProvided, Default, EnvVar };

std::string_view getFlagSourceName(FlagSource Source);

struct ParsedFlag {
  Flag TheFlag;
  std::string Value;
  FlagSource Source = FlagSource::UserProvided;

  ParsedFlag() = default;
  ParsedFlag(Flag F, std::string Value,
             FlagSource Source = FlagSource::UserProvided)
      : TheFlag(std::move(F)), Value(std::move(Value)), Source(Source) {}

  const std::string &getName() const { return TheFlag.LongName; }
};

/// Key projection used to reconcile parsed flags by long name.
inline const std::string &parsedFlagName(const ParsedFlag &PF) {
  return PF.getName();
}

//===----------------------------------------------------------------------===//
//
struct ParsedArguments {
  std::vector<ParsedFlag> Flags;
  std::vector<std::string> Positionals;
  // Names of the nested subcommands selected by the parser, outermost first.
  std::vector<std::string> SubCommandPath;

  const ParsedFlag *lookup(std::string_view LongName) const;
  bool hasFlag(std::string_view LongName) const {
    return lookup(LongName) != nullptr;
  }
  std::optional<std::string> getValue(std::string_view LongName) const;

  /// True when the user asked for --help or --version.
  bool requestsHelpOrVersion() const {
    return hasFlag(HelpFlagName) || hasFlag(VersionFlagName);
  }
};

//===----------------------------------------------------------------------===//
//
class Command {
public:
  // Invoked when this command is selected. Returns the process exit code.
  using RunHandlerTy =
      std::function<int(const ParsedArguments &Args, std::ostream &OS)>;

  Command() = default;
  explicit Command(std::string Name, std::string Description = "")
      : Name(std::move(Name)), Description(std::move(Description)) {}

  const std::string &getName() const { return Name; }
  void setName(std::string S) { Name = std::move(S); }

  const std::string &getDescription() const { return Description; }
  void setDescription(std::string S) { Description = std::move(S); }

  const std::optional<std::string> &getFurtherInformation() const {
    return FurtherInformation;
  }
  void setFurtherInformation(std::optional<std::string> S) {
    FurtherInformation = std::move(S);
  }

  const std::optional<std::string> &getVersion() const { return Version; }
  void setVersion(std::optional<std::string> S) { Version = std::move(S); }

  const std::vector<Flag> &flags() const { return Flags; }
  std::vector<Flag> &flags() { return Flags; }

  /// Append \p F. Long names are unique within a command; adding a second
  /// flag with the same long name is a fatal error.
  Command &addFlag(Flag F);

  const Flag *findFlag(std::string_view LongName) const;
  Flag *findFlag(std::string_view LongName);

  const std::vector<Command> &subCommands() const { return SubCommands; }
  std::vector<Command> &subCommands() { return SubCommands; }

  Command &addSubCommand(Command Sub);
  const Command *findSubCommand(std::string_view SubName) const;

  const RunHandlerTy &getRunHandler() const { return RunHandler; }
  void setRunHandler(RunHandlerTy H) { RunHandler = std::move(H); }
  bool hasRunHandler() const { return static_cast<bool>(RunHandler); }

  /// Print the help text for this command.
  void printHelp(std::ostream &OS) const;

  /// Print "<name> version <version>". The command must have a version.
  void printVersion(std::ostream &OS) const;

  /// Invoke the run handler, or print help when there is none.
  int run(const ParsedArguments &Args, std::ostream &OS) const;

private:
  std::string Name;
  std::string Description;
  std::optional<std::string> FurtherInformation;
  std::vector<Flag> Flags;
  std::vector<Command> SubCommands;
  std::optional<std::string> Version;
  RunHandlerTy RunHandler;
};

} // end namespace clext

#endif // CLEXT_COMMAND_H
