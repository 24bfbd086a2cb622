#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/build/image_builder.hpp"
#include "internal/build/step_executor.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/image/image_registry.hpp"
#include "internal/image/image_source.hpp"
#include "internal/layer/layer_store.hpp"
#include "internal/util/path.hpp"

namespace dockyard::testing {

/*
  Step executor that never forks. By default a command writes its own text
  to <workdir>/.ran; commands containing "exit 1" fail. Tests may install a
  handler to script other results.
*/
class FakeStepExecutor final : public build::StepExecutor {
 public:
  using Handler = std::function<build::RunResult(const build::RunRequest&)>;

  build::RunResult Run(const build::RunRequest& request) override {
    Handler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      commands_.push_back(request.command);
      handler = handler_;
    }
    if (handler) return handler(request);

    build::RunResult result;
    if (request.command.find("exit 1") != std::string::npos) {
      result.exit_status = 1;
      result.output      = "step failed: " + request.command;
      return result;
    }
    result.delta.upserts.emplace(util::JoinContainerPath(request.workdir, ".ran"), request.command);
    return result;
  }

  void Kill() override {
    ++kills_;
  }

  void SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
  }

  std::vector<std::string> commands() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
  }

  std::size_t runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_.size();
  }

  int kills() const {
    return kills_;
  }

 private:
  mutable std::mutex       mutex_;
  std::vector<std::string> commands_;
  Handler                  handler_;
  std::atomic<int>         kills_{0};
};

// Builder wired to in-memory stores, with alpine:3 and node:20 available.
struct BuildFixture {
  std::shared_ptr<db::memory::MemoryRepository> repo     = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<layer::LayerStore>            layers   = std::make_shared<layer::LayerStore>(repo);
  std::shared_ptr<image::MemoryImageSource>     source   = std::make_shared<image::MemoryImageSource>();
  std::shared_ptr<image::ImageRegistry>         images   = std::make_shared<image::ImageRegistry>(repo, layers, source);
  std::shared_ptr<FakeStepExecutor>             executor = std::make_shared<FakeStepExecutor>();
  std::shared_ptr<build::ImageBuilder>          builder  = std::make_shared<build::ImageBuilder>(layers, images, executor);

  BuildFixture() {
    image::BaseImage alpine;
    alpine.reference = "alpine:3";
    alpine.rootfs.Write("/etc/os-release", "alpine 3");
    alpine.rootfs.Write("/bin/sh", "#!sh");
    alpine.metadata.env["PATH"] = "/usr/bin:/bin";
    alpine.metadata.command     = {"/bin/sh"};
    source->Add(alpine);

    image::BaseImage node;
    node.reference = "node:20";
    node.rootfs.Write("/usr/local/bin/node", "node 20");
    node.metadata.env["NODE_VERSION"] = "20";
    node.metadata.command             = {"node"};
    source->Add(node);
  }
};

} // namespace dockyard::testing
