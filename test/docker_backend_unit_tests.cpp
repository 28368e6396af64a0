#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "docker_backend.hpp"
#include "catalog_fixture.hpp"
#include <map>

namespace cudalis::test {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

// Records every engine invocation and fails the ones matching a prefix
class FakeEngine {
public:
  docker_backend::command_runner runner()
  {
    return [this](const std::string &engine, const std::string &arguments, line_handler handler) {
      commands.push_back(engine + " " + arguments);
      for (const auto &[prefix, output]: outputs)
        if (arguments.starts_with(prefix)) {
          std::string line = output;
          handler(line);
        }
      for (const auto &prefix: failing)
        if (arguments.starts_with(prefix))
          return 1;
      return 0;
    };
  }

  docker_backend::interactive_runner interactive()
  {
    return [this](const std::string &engine, const std::string &arguments) {
      commands.push_back(engine + " " + arguments);
      return 0;
    };
  }

  std::vector<std::string> commands;
  std::vector<std::string> failing;
  std::map<std::string, std::string> outputs;
};

class DockerBackendTest : public ::testing::Test {
protected:
  FakeEngine engine;
  docker_backend backend{ { "podman", "cache", false }, engine.runner(), engine.interactive() };
};

TEST_F(DockerBackendTest, BaseImageIsPulledAndTagged)
{
  const build_step step{ build_step::kind::BASE_IMAGE, { { "image", "ubuntu:22.04" } } };
  const auto result = backend.apply_step(step, { "k1", "", 0 });
  EXPECT_TRUE(result.success);
  EXPECT_THAT(engine.commands, ElementsAre("podman pull 'ubuntu:22.04'", "podman tag 'ubuntu:22.04' 'cache:k1'"));
}

TEST_F(DockerBackendTest, CommandRunsInASetupContainerAndIsCommitted)
{
  const build_step step{ build_step::kind::TORCH, { { "command", "pip install 'torch==2.1'" } } };
  const auto result = backend.apply_step(step, { "k2", "k1", 1 });
  EXPECT_TRUE(result.success);
  EXPECT_THAT(engine.commands, ElementsAre("podman rm -f 'cudalis_setup_k2'",
                                           "podman run --name 'cudalis_setup_k2' -e DEBIAN_FRONTEND=noninteractive 'cache:k1' bash -lc 'pip install '\\''torch==2.1'\\'''",
                                           "podman commit 'cudalis_setup_k2' 'cache:k2'",
                                           "podman rm -f 'cudalis_setup_k2'"));
}

TEST_F(DockerBackendTest, FailedCommandIsNotCommitted)
{
  engine.failing.push_back("run ");
  engine.outputs["run "] = "E: Unable to locate package\n";

  const build_step step{ build_step::kind::SYSTEM_PACKAGES, { { "command", "apt-get install -y nothing" } } };
  const auto result = backend.apply_step(step, { "k2", "k1", 1 });
  EXPECT_FALSE(result.success);
  EXPECT_THAT(result.diagnostic, HasSubstr("returned 1"));
  EXPECT_THAT(result.diagnostic, HasSubstr("E: Unable to locate package"));
  for (const auto &c: engine.commands)
    EXPECT_THAT(c, ::testing::Not(HasSubstr("commit")));
  EXPECT_EQ(engine.commands.back(), "podman rm -f 'cudalis_setup_k2'");
}

TEST_F(DockerBackendTest, CommandStepNeedsAParent)
{
  const build_step step{ build_step::kind::TORCH, { { "command", "true" } } };
  EXPECT_FALSE(backend.apply_step(step, { "k1", "", 0 }).success);
  EXPECT_TRUE(engine.commands.empty());
}

TEST_F(DockerBackendTest, MalformedStepIsReported)
{
  const build_step step{ build_step::kind::BASE_IMAGE, { { "name", "ubuntu" } } };
  const auto result = backend.apply_step(step, { "k1", "", 0 });
  EXPECT_FALSE(result.success);
  EXPECT_THAT(result.diagnostic, HasSubstr("base_image"));
}

TEST_F(DockerBackendTest, FreezeTagsTheImageReference)
{
  const build_step step{ build_step::kind::FREEZE, { { "image_reference", "cudalis:3.10-pytorch2.1-cpu" } } };
  EXPECT_TRUE(backend.apply_step(step, { "k6", "k5", 5 }).success);
  EXPECT_THAT(engine.commands, ElementsAre("podman tag 'cache:k5' 'cudalis:3.10-pytorch2.1-cpu'", "podman tag 'cache:k5' 'cache:k6'"));
}

TEST_F(DockerBackendTest, CacheLookupInspectsTheKeyImage)
{
  engine.failing.push_back("image inspect --format \"{{.Id}}\" 'cache:missing'");
  EXPECT_TRUE(backend.is_cached({ "present", "", 0 }));
  EXPECT_FALSE(backend.is_cached({ "missing", "", 0 }));
}

TEST_F(DockerBackendTest, RunImageAttachesGpusForCudaBuilds)
{
  const build_plan cuda{ resolved_triple{ entry("3.10", "2.1", "11.8") }, {}, "cudalis:3.10-pytorch2.1-11.8" };
  const build_plan cpu{ resolved_triple{ entry("3.10", "2.1", "cpu") }, {}, "cudalis:3.10-pytorch2.1-cpu" };
  EXPECT_EQ(backend.run_image(cuda), 0);
  EXPECT_EQ(backend.run_image(cpu), 0);
  EXPECT_THAT(engine.commands, ElementsAre("podman run -it --rm --gpus all 'cudalis:3.10-pytorch2.1-11.8' bash -l", "podman run -it --rm 'cudalis:3.10-pytorch2.1-cpu' bash -l"));
}

TEST_F(DockerBackendTest, RemoveCachedDeletesEveryCachedLayer)
{
  const build_plan plan{ resolved_triple{ entry("3.10", "2.1", "cpu") },
                         { { build_step::kind::BASE_IMAGE, { { "image", "ubuntu:22.04" } } }, { build_step::kind::FREEZE, { { "image_reference", "cudalis:x" } } } },
                         "cudalis:x" };
  const auto keys = plan.cache_keys();
  EXPECT_EQ(backend.remove_cached(plan), 0);

  size_t removed = 0;
  for (const auto &c: engine.commands)
    if (c.starts_with("podman rmi "))
      ++removed;
  EXPECT_EQ(removed, keys.size());
  EXPECT_EQ(engine.commands.back(), "podman rmi 'cache:" + keys.back() + "'");
}

} // namespace cudalis::test
