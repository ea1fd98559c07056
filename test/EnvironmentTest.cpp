//===- clext/test/EnvironmentTest.cpp - Environment lookup tests ----------===//

#include "clext/Builtins.h"
#include "clext/Environment.h"

#include <cstdlib>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace clext;

namespace {

class TempEnvVar {
public:
  TempEnvVar(const char *name, const char *value) : name(name) {
    const char *old_value = getenv(name);
    EXPECT_EQ(nullptr, old_value) << old_value;
    setenv(name, value, true);
  }

  ~TempEnvVar() { unsetenv(name); }

private:
  const char *const name;
};

TEST(EnvironmentTest, MapEnvironmentLookup) {
  MapEnvironment Env = {{"API_KEY", "xyz"}, {"EMPTY", ""}};
  EXPECT_EQ(Env.lookup("API_KEY"), "xyz");
  EXPECT_EQ(Env.lookup("MISSING"), std::nullopt);
  EXPECT_EQ(Env.lookup("EMPTY"), "");

  Env.set("MISSING", "now-set");
  EXPECT_EQ(Env.lookup("MISSING"), "now-set");
}

TEST(EnvironmentTest, ProcessEnvironmentLookup) {
  TempEnvVar Var("CLEXT_ENVIRONMENT_TEST_VAR", "hello");
  EXPECT_EQ(ProcessEnvironment::get().lookup("CLEXT_ENVIRONMENT_TEST_VAR"),
            "hello");
  EXPECT_EQ(ProcessEnvironment::get().lookup("CLEXT_ENVIRONMENT_TEST_UNSET"),
            std::nullopt);
}

TEST(EnvironmentTest, ProcessEnvironmentKeepsEmptyValues) {
  TempEnvVar Var("CLEXT_ENVIRONMENT_TEST_EMPTY", "");
  EXPECT_EQ(ProcessEnvironment::get().lookup("CLEXT_ENVIRONMENT_TEST_EMPTY"),
            "");
}

TEST(EnvironmentTest, PostprocessReadsProcessEnvironmentByDefault) {
  TempEnvVar Var("CLEXT_ENVIRONMENT_TEST_TOKEN", "secret");

  Command Root("tool");
  Root.addFlag(
      Flag("token", "Access token", std::string("CLEXT_ENVIRONMENT_TEST_TOKEN")));
  ExtensionPipeline Pipeline{envVars()};
  Command Final = Pipeline.applyStructural(Root);

  Expected<ParsedArguments> Args =
      Pipeline.applyPostprocess(Final, ParsedArguments());
  ASSERT_TRUE(static_cast<bool>(Args));
  ASSERT_NE(Args->lookup("token"), nullptr);
  EXPECT_EQ(Args->lookup("token")->Value, "secret");
  EXPECT_EQ(Args->lookup("token")->Source, FlagSource::EnvVar);
}

} // anonymous namespace
