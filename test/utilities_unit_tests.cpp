#include "utilities.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {
    TEST(UtilitiesTest, YamlScalarsStayStrings) {
        const auto json = cudalis::yaml_to_json(YAML::Load(R"(
python: [3.8, 3.10]
cuda: 11.0
empty:
)"));
        EXPECT_EQ(json["python"], nlohmann::json::array({ "3.8", "3.10" }));
        EXPECT_EQ(json["cuda"], "11.0");
        EXPECT_TRUE(json["empty"].is_null());
    }

    TEST(UtilitiesTest, Fnv1aMatchesReferenceValues) {
        EXPECT_EQ(cudalis::fnv1a_hash(""), 0xcbf29ce484222325ULL);
        EXPECT_EQ(cudalis::fnv1a_hash("a"), 0xaf63dc4c8601ec8cULL);
        EXPECT_EQ(cudalis::to_hex(0xaf63dc4c8601ec8cULL), "af63dc4c8601ec8c");
        EXPECT_EQ(cudalis::to_hex(1), "0000000000000001");
    }

    TEST(UtilitiesTest, ShellQuoteEscapesSingleQuotes) {
        EXPECT_EQ(cudalis::shell_quote("plain"), "'plain'");
        EXPECT_EQ(cudalis::shell_quote("it's"), "'it'\\''s'");
        EXPECT_EQ(cudalis::shell_quote("$HOME && rm"), "'$HOME && rm'");
    }

    TEST(UtilitiesTest, RenderReportsTemplateErrors) {
        inja::Environment env;
        auto rendered = cudalis::try_render(env, "torch=={{ torch }}", { { "torch", "2.1" } });
        ASSERT_TRUE(rendered.has_value());
        EXPECT_EQ(*rendered, "torch==2.1");

        auto broken = cudalis::try_render(env, "{% if %}", {});
        ASSERT_FALSE(broken.has_value());
        EXPECT_TRUE(broken.error().is(cudalis::errc::UNSUPPORTED_PLATFORM));
    }

    TEST(UtilitiesTest, ExecStreamsLines) {
        std::vector<std::string> lines;
        const auto retcode = cudalis::exec("printf", "'one\\ntwo'", [&](std::string &line) {
            lines.push_back(line);
        });
        EXPECT_EQ(retcode, 0);
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0], "one\n");
        EXPECT_EQ(lines[1], "two");
    }

    TEST(UtilitiesTest, ExecReportsExitCode) {
        std::vector<std::string> lines;
        const auto retcode = cudalis::exec("sh", "-c 'echo failed; exit 3'", [&](std::string &line) {
            lines.push_back(line);
        });
        EXPECT_EQ(retcode, 3);
        ASSERT_EQ(lines.size(), 1u);
        EXPECT_EQ(lines[0], "failed\n");
    }
}
