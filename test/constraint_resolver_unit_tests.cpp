#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "constraint_resolver.hpp"
#include "catalog_fixture.hpp"

namespace cudalis::test {

using ::testing::ElementsAre;

class ConstraintResolverTest : public ::testing::Test {
protected:
  compatibility_catalog catalog = resolver_catalog();
  constraint_resolver resolver{ catalog };

  static constraint exact(std::string_view text)
  {
    return text == "cpu" ? constraint::cpu_only() : constraint::exact(v(text));
  }
};

TEST_F(ConstraintResolverTest, UnspecifiedCudaResolvesToGreatest)
{
  auto triple = resolver.resolve(exact("3.8.5"), exact("1.7.1"), constraint::unspecified());
  ASSERT_TRUE(triple.has_value()) << triple.error().describe();
  EXPECT_EQ(triple->python, v("3.8.5"));
  EXPECT_EQ(triple->torch, v("1.7.1"));
  ASSERT_TRUE(triple->cuda.has_value());
  EXPECT_EQ(*triple->cuda, v("11.0"));
}

TEST_F(ConstraintResolverTest, AbsentCombinationNamesTheCudaConstraint)
{
  auto triple = resolver.resolve(exact("3.8.5"), exact("1.7.1"), exact("12.0"));
  ASSERT_FALSE(triple.has_value());
  EXPECT_TRUE(triple.error().is(errc::NO_COMPATIBLE_VERSION));
  EXPECT_THAT(triple.error().constraints, ElementsAre("cuda"));
}

TEST_F(ConstraintResolverTest, VersionMissingFromCatalogIsUnknown)
{
  auto triple = resolver.resolve(constraint::unspecified(), exact("9.9"), constraint::unspecified());
  ASSERT_FALSE(triple.has_value());
  EXPECT_TRUE(triple.error().is(errc::UNKNOWN_VERSION));
  EXPECT_THAT(triple.error().constraints, ElementsAre("torch"));
}

TEST_F(ConstraintResolverTest, UnderspecifiedPicksGreatestTuple)
{
  auto triple = resolver.resolve(constraint_set{});
  ASSERT_TRUE(triple.has_value());
  EXPECT_EQ(triple->python, v("3.10"));
  EXPECT_EQ(triple->torch, v("1.7.1"));
  EXPECT_TRUE(triple->is_cpu_only());

  // Same input, same answer
  EXPECT_EQ(*triple, *resolver.resolve(constraint_set{}));
}

TEST_F(ConstraintResolverTest, PartialVersionMatchesCatalogEntries)
{
  auto triple = resolver.resolve(exact("3.8"), constraint::unspecified(), exact("10.2"));
  ASSERT_TRUE(triple.has_value());
  EXPECT_EQ(triple->python, v("3.8.5"));
  EXPECT_EQ(*triple->cuda, v("10.2"));
}

TEST_F(ConstraintResolverTest, LatestNarrowsItsComponentFirst)
{
  auto triple = resolver.resolve(constraint::unspecified(), constraint::latest(), constraint::unspecified());
  ASSERT_TRUE(triple.has_value());
  EXPECT_EQ(triple->torch, v("2.0.0"));
  EXPECT_EQ(triple->python, v("3.9"));
  EXPECT_EQ(*triple->cuda, v("12.0"));
}

TEST_F(ConstraintResolverTest, CpuOnlyIsAValidResolution)
{
  auto triple = resolver.resolve(exact("3.8.5"), constraint::unspecified(), exact("cpu"));
  ASSERT_TRUE(triple.has_value());
  EXPECT_TRUE(triple->is_cpu_only());
  EXPECT_EQ(triple->to_string(), "python 3.8.5, torch 1.7.1, cuda cpu");
}

TEST_F(ConstraintResolverTest, ResolutionSatisfiesEveryConstraint)
{
  const std::vector<constraint_set> inputs = {
    { exact("3.8.5"), constraint::unspecified(), constraint::unspecified() },
    { constraint::latest(), constraint::latest(), constraint::latest() },
    { constraint::unspecified(), exact("2.0"), constraint::unspecified() },
    { exact("3.10"), exact("1.7.1"), exact("cpu") },
  };
  for (const auto &input: inputs) {
    auto triple = resolver.resolve(input);
    ASSERT_TRUE(triple.has_value()) << input.python.to_string() << " " << input.torch.to_string() << " " << input.cuda.to_string();
    EXPECT_TRUE(input.python.satisfied_by(triple->python));
    EXPECT_TRUE(input.torch.satisfied_by(triple->torch));
    EXPECT_TRUE(input.cuda.satisfied_by(triple->cuda));
  }
}

TEST_F(ConstraintResolverTest, PlatformCanBeTheNarrowingConstraint)
{
  auto arm_catalog = compatibility_catalog::from_entries({ entry("3.10", "2.1", "11.8", { "linux-x86_64" }), entry("3.10", "2.1", "cpu") }).value();
  constraint_resolver arm_resolver(arm_catalog, "linux-aarch64");

  auto cuda = arm_resolver.resolve(constraint::unspecified(), constraint::unspecified(), exact("11.8"));
  ASSERT_FALSE(cuda.has_value());
  EXPECT_TRUE(cuda.error().is(errc::NO_COMPATIBLE_VERSION));
  EXPECT_THAT(cuda.error().constraints, ElementsAre("cuda", "platform linux-aarch64"));

  auto any = arm_resolver.resolve(constraint_set{});
  ASSERT_TRUE(any.has_value());
  EXPECT_TRUE(any->is_cpu_only());
}

TEST_F(ConstraintResolverTest, EveryOverNarrowingConstraintIsNamed)
{
  // Dropping either python or torch alone finds an entry
  auto triple = resolver.resolve(exact("3.10"), exact("2.0"), constraint::unspecified());
  ASSERT_FALSE(triple.has_value());
  EXPECT_TRUE(triple.error().is(errc::NO_COMPATIBLE_VERSION));
  EXPECT_THAT(triple.error().constraints, ElementsAre("python", "torch"));
}

} // namespace cudalis::test
