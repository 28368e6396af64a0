#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "workspace.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    // Create temporary test directory structure
    test_dir = fs::temp_directory_path() / "cudalis_test";
    fs::create_directories(test_dir / "home");
    fs::create_directories(test_dir / "project");

    workspace               = std::make_unique<cudalis::workspace>();
    workspace->cudalis_home = test_dir / "home";
  }

  void TearDown() override
  {
    fs::remove_all(test_dir);
  }

  void write(const fs::path &file, const std::string &content)
  {
    std::ofstream config_file(file);
    config_file << content;
  }

  fs::path test_dir;
  std::unique_ptr<cudalis::workspace> workspace;
};

TEST_F(WorkspaceTest, DefaultsWithoutConfiguration)
{
  auto result = workspace->init(test_dir / "project");
  EXPECT_TRUE(result) << "Workspace initialization failed";

  EXPECT_EQ(workspace->configuration.engine, cudalis::default_engine);
  EXPECT_EQ(workspace->configuration.repository, cudalis::default_repository);
  EXPECT_FALSE(workspace->configuration.catalog.has_value());
  EXPECT_FALSE(workspace->configuration.verbose);
  EXPECT_EQ(workspace->log_file(), test_dir / "home" / cudalis::log_filename);
}

TEST_F(WorkspaceTest, ProjectConfigurationOverridesHome)
{
  write(test_dir / "home" / cudalis::config_filename, R"(
engine: podman
repository: home/torch
verbose: true
)");
  write(test_dir / "project" / cudalis::project_config_filename, R"(
repository: project/torch
catalog: catalogs/torch.yaml
)");

  auto result = workspace->init(test_dir / "project");
  ASSERT_TRUE(result) << result.error().describe();

  EXPECT_EQ(workspace->configuration.engine, "podman");
  EXPECT_EQ(workspace->configuration.repository, "project/torch");
  EXPECT_TRUE(workspace->configuration.verbose);
  ASSERT_TRUE(workspace->configuration.catalog.has_value());
  EXPECT_EQ(*workspace->configuration.catalog, (test_dir / "project" / "catalogs" / "torch.yaml").lexically_normal());
}

TEST_F(WorkspaceTest, PathEntriesArePrependedToPath)
{
  write(test_dir / "home" / cudalis::config_filename, R"(
path:
  - /opt/cudalis/bin
)");

  ASSERT_TRUE(workspace->init(test_dir / "project"));
  const std::string path = std::getenv("PATH");
  EXPECT_TRUE(path.starts_with("/opt/cudalis/bin" + cudalis::host_os_path_seperator));
}

TEST_F(WorkspaceTest, MalformedConfigurationIsReported)
{
  write(test_dir / "home" / cudalis::config_filename, "verbose: [not, a, bool]\n");

  auto result = workspace->init(test_dir / "project");
  ASSERT_FALSE(result);
  EXPECT_TRUE(result.error().is(cudalis::errc::CONFIGURATION_ERROR));
}

TEST_F(WorkspaceTest, EmptyEngineIsRejected)
{
  write(test_dir / "project" / cudalis::project_config_filename, "engine: \"\"\n");

  auto result = workspace->init(test_dir / "project");
  ASSERT_FALSE(result);
  EXPECT_TRUE(result.error().is(cudalis::errc::CONFIGURATION_ERROR));
}

TEST_F(WorkspaceTest, HomeFollowsEnvironment)
{
  setenv("CUDALIS_HOME", (test_dir / "elsewhere").c_str(), 1);
  EXPECT_EQ(cudalis::workspace::get_cudalis_home(), test_dir / "elsewhere");
  unsetenv("CUDALIS_HOME");
  EXPECT_NE(cudalis::workspace::get_cudalis_home(), test_dir / "elsewhere");
}
