#include <gtest/gtest.h>
#include "version.hpp"

namespace cudalis::test {

TEST(VersionTest, ParsesPartialVersions)
{
  auto parsed = version::parse("11.0");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->size(), 2u);
  EXPECT_EQ(parsed->major(), 11u);
  EXPECT_EQ(parsed->minor(), 0u);
  EXPECT_EQ(parsed->patch(), 0u);
}

TEST(VersionTest, StripsPrefixAndLocalLabel)
{
  auto parsed = version::parse("v1.7.1+cu110");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->to_string(), "1.7.1");
}

TEST(VersionTest, RejectsMalformedText)
{
  for (const auto *text: { "", "1..2", "1.2.", "a.b", "1.2.3.4", "3.8-rc1" }) {
    auto parsed = version::parse(text);
    ASSERT_FALSE(parsed.has_value()) << text;
    EXPECT_TRUE(parsed.error().is(errc::INVALID_ARGUMENT));
  }
}

TEST(VersionTest, OrdersNumerically)
{
  EXPECT_LT(version::parse("3.9").value(), version::parse("3.10").value());
  EXPECT_LT(version::parse("1.13.1").value(), version::parse("2.0").value());
  EXPECT_EQ(version::parse("11.0").value(), version::parse("11.0.0").value());
}

TEST(VersionTest, MatchesByPrefix)
{
  const auto full = version::parse("3.8.5").value();
  EXPECT_TRUE(full.matches(version::parse("3.8").value()));
  EXPECT_TRUE(full.matches(version::parse("3").value()));
  EXPECT_FALSE(full.matches(version::parse("3.9").value()));
  EXPECT_FALSE(full.matches(version::parse("3.8.6").value()));
}

TEST(VersionTest, WheelTags)
{
  EXPECT_EQ(version::parse("3.10.4").value().python_tag(), "cp310");
  EXPECT_EQ(version::parse("11.8").value().cuda_tag(), "cu118");
  EXPECT_EQ(accelerator_tag(std::nullopt), "cpu");
  EXPECT_EQ(accelerator_tag(version{ 12, 1 }), "cu121");
}

TEST(VersionTest, CpuOrdersBelowCuda)
{
  EXPECT_EQ(compare_cuda(std::nullopt, version{ 9, 2 }), std::strong_ordering::less);
  EXPECT_EQ(compare_cuda(std::nullopt, std::nullopt), std::strong_ordering::equal);
  EXPECT_EQ(compare_cuda(version{ 11, 0 }, version{ 10, 2 }), std::strong_ordering::greater);
}

} // namespace cudalis::test
