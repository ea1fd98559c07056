//===- clext/test/ExtensionPipelineTest.cpp - Pipeline ordering tests -----===//

#include "clext/Extension.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace clext;
using ::testing::ElementsAre;

namespace {

// Structural-only extension appending \p Suffix to the description.
Extension appendToDescription(std::string Name, std::string Suffix,
                              int Priority) {
  return Extension(
      std::move(Name),
      [Suffix](Command C) {
        C.setDescription(C.getDescription() + Suffix);
        return C;
      },
      nullptr, Priority);
}

// Postprocess-only extension recording its name into \p Trace.
Extension traceStep(std::string Name, std::vector<std::string> &Trace,
                    int Priority = Extension::DefaultPriority) {
  return Extension(
      Name, nullptr,
      [Name, &Trace](const Command &, ParsedArguments Args,
                     const Environment &) -> Expected<ParsedArguments> {
        Trace.push_back(Name);
        return std::move(Args);
      },
      Priority);
}

std::vector<std::string> namesOf(const ExtensionPipeline &Pipeline) {
  std::vector<std::string> Names;
  for (const Extension &Ext : Pipeline.extensions())
    Names.push_back(Ext.getName());
  return Names;
}

TEST(ExtensionPipelineTest, StructuralMatchesManualApplication) {
  Extension E1 = appendToDescription("e1", "-one", 0);
  Extension E2 = appendToDescription("e2", "-two", 5);

  ExtensionPipeline Pipeline{E2, E1};
  Command Base("tool", "base");

  Command Piped = Pipeline.applyStructural(Base);
  Command Manual = E2.extend(E1.extend(Base));
  EXPECT_EQ(Piped.getDescription(), "base-one-two");
  EXPECT_EQ(Piped.getDescription(), Manual.getDescription());
}

TEST(ExtensionPipelineTest, EqualPrioritiesKeepDeclarationOrder) {
  ExtensionPipeline Pipeline{
      appendToDescription("a", "a", 1), appendToDescription("b", "b", 0),
      appendToDescription("c", "c", 1), appendToDescription("d", "d", 0)};

  EXPECT_THAT(namesOf(Pipeline), ElementsAre("b", "d", "a", "c"));
  EXPECT_EQ(Pipeline.applyStructural(Command("tool")).getDescription(),
            "bdac");
}

TEST(ExtensionPipelineTest, AddInsertsAfterEqualPriorities) {
  ExtensionPipeline Pipeline;
  EXPECT_TRUE(Pipeline.empty());
  Pipeline.add(appendToDescription("late", "", 10))
      .add(appendToDescription("first", "", -5))
      .add(appendToDescription("default", "", Extension::DefaultPriority))
      .add(appendToDescription("first-again", "", -5));

  EXPECT_EQ(Pipeline.size(), 4u);
  EXPECT_THAT(namesOf(Pipeline),
              ElementsAre("default", "first", "first-again", "late"));
}

TEST(ExtensionPipelineTest, EmptyPipelineIsIdentity) {
  ExtensionPipeline Pipeline;
  Command Base("tool", "base");
  EXPECT_EQ(Pipeline.applyStructural(Base).getDescription(), "base");

  ParsedArguments Args;
  Args.Positionals = {"x"};
  Expected<ParsedArguments> Out =
      Pipeline.applyPostprocess(Base, Args, MapEnvironment());
  ASSERT_TRUE(static_cast<bool>(Out));
  EXPECT_THAT(Out->Positionals, ElementsAre("x"));
}

TEST(ExtensionPipelineTest, PostprocessRunsInPipelineOrder) {
  std::vector<std::string> Trace;
  ExtensionPipeline Pipeline{traceStep("late", Trace, 3),
                             traceStep("early", Trace, -3),
                             traceStep("middle", Trace)};

  Expected<ParsedArguments> Out = Pipeline.applyPostprocess(
      Command("tool"), ParsedArguments(), MapEnvironment());
  ASSERT_TRUE(static_cast<bool>(Out));
  EXPECT_THAT(Trace, ElementsAre("middle", "early", "late"));
}

TEST(ExtensionPipelineTest, PostprocessThreadsTheAccumulator) {
  auto AddPositional = [](std::string Value) {
    return Extension(
        "add-" + Value, nullptr,
        [Value](const Command &, ParsedArguments Args,
                const Environment &) -> Expected<ParsedArguments> {
          Args.Positionals.push_back(Value);
          return std::move(Args);
        });
  };
  ExtensionPipeline Pipeline{AddPositional("a"), AddPositional("b")};

  Expected<ParsedArguments> Out = Pipeline.applyPostprocess(
      Command("tool"), ParsedArguments(), MapEnvironment());
  ASSERT_TRUE(static_cast<bool>(Out));
  EXPECT_THAT(Out->Positionals, ElementsAre("a", "b"));
}

TEST(ExtensionPipelineTest, PostprocessShortCircuitsOnFailure) {
  int LaterCalls = 0;
  Extension Failing(
      "failing", nullptr,
      [](const Command &, ParsedArguments,
         const Environment &) -> Expected<ParsedArguments> {
        return createStringError("rejected");
      },
      0);
  Extension Later(
      "later", nullptr,
      [&LaterCalls](const Command &, ParsedArguments Args,
                    const Environment &) -> Expected<ParsedArguments> {
        ++LaterCalls;
        return std::move(Args);
      },
      0);

  ExtensionPipeline Pipeline{Failing, Later};
  Expected<ParsedArguments> Out = Pipeline.applyPostprocess(
      Command("tool"), ParsedArguments(), MapEnvironment());
  ASSERT_FALSE(static_cast<bool>(Out));
  EXPECT_EQ(toString(Out.takeError()), "rejected");
  EXPECT_EQ(LaterCalls, 0);
}

TEST(ExtensionPipelineTest, PostprocessReceivesTheFinalCommand) {
  const Command *Seen = nullptr;
  ExtensionPipeline Pipeline{Extension(
      "observer", nullptr,
      [&Seen](const Command &Final, ParsedArguments Args,
              const Environment &) -> Expected<ParsedArguments> {
        Seen = &Final;
        return std::move(Args);
      })};

  Command Final = Pipeline.applyStructural(Command("tool"));
  ASSERT_TRUE(static_cast<bool>(
      Pipeline.applyPostprocess(Final, ParsedArguments(), MapEnvironment())));
  EXPECT_EQ(Seen, &Final);
}

TEST(ExtensionPipelineTest, PostprocessReceivesTheEnvironment) {
  std::string Seen;
  ExtensionPipeline Pipeline{Extension(
      "env-reader", nullptr,
      [&Seen](const Command &, ParsedArguments Args,
              const Environment &Env) -> Expected<ParsedArguments> {
        Seen = Env.lookup("NAME").value_or("<unset>");
        return std::move(Args);
      })};

  MapEnvironment Env = {{"NAME", "value"}};
  ASSERT_TRUE(static_cast<bool>(
      Pipeline.applyPostprocess(Command("tool"), ParsedArguments(), Env)));
  EXPECT_EQ(Seen, "value");
}

TEST(ExtensionPipelineTest, TryApplyStructuralStopsAtFirstRejection) {
  int Applied = 0;
  Extension Rejecting("rejecting", [&Applied](Command C) {
    ++Applied;
    return C;
  });
  Rejecting.setValidate([](const Command &) -> Error {
    return createStringError("not today");
  });
  Extension After("after", [&Applied](Command C) {
    ++Applied;
    return C;
  });

  ExtensionPipeline Pipeline{Rejecting, After};
  Expected<Command> Out = Pipeline.tryApplyStructural(Command("tool"));
  ASSERT_FALSE(static_cast<bool>(Out));
  EXPECT_EQ(toString(Out.takeError()),
            "extension 'rejecting' cannot be applied to 'tool': not today");
  EXPECT_EQ(Applied, 0);
}

TEST(ExtensionPipelineTest, ValidationSeesEarlierEdits) {
  Extension AddFlag("add-flag", [](Command C) {
    C.addFlag(Flag("level", "Log level"));
    return C;
  });
  Extension NeedsFlag("needs-flag", [](Command C) { return C; });
  NeedsFlag.setValidate([](const Command &C) -> Error {
    if (!C.findFlag("level"))
      return createStringError("no level");
    return Error::success();
  });

  ExtensionPipeline Good{AddFlag, NeedsFlag};
  EXPECT_TRUE(static_cast<bool>(Good.tryApplyStructural(Command("tool"))));

  ExtensionPipeline Bad{NeedsFlag.setPriority(-1000), AddFlag};
  EXPECT_FALSE(static_cast<bool>(Bad.tryApplyStructural(Command("tool"))));
}

TEST(ExtensionPipelineDeathTest, ApplyStructuralAbortsOnRejection) {
  Extension Rejecting("rejecting", [](Command C) { return C; });
  Rejecting.setValidate([](const Command &) -> Error {
    return createStringError("not today");
  });
  ExtensionPipeline Pipeline{Rejecting};
  EXPECT_DEATH(Pipeline.applyStructural(Command("tool")),
               "FATAL ERROR: extension 'rejecting' cannot be applied");
}

} // anonymous namespace
