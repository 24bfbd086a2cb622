#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/build/build_context.hpp"
#include "internal/build/step_executor.hpp"
#include "internal/image/image_registry.hpp"
#include "internal/layer/layer_store.hpp"
#include "internal/model/build_step.hpp"
#include "internal/model/image.hpp"

namespace dockyard::build {

// Checked between steps; a run step already executing is not interrupted.
class CancellationToken {
 public:
  void Cancel() {
    cancelled_ = true;
  }

  bool IsCancelled() const {
    return cancelled_;
  }

 private:
  std::atomic<bool> cancelled_{false};
};

struct BuildEvent {
  std::size_t     index = 0;
  model::StepKind kind  = model::StepKind::kRun;
  std::string     step;
  std::string     fingerprint;
  bool            cached = false;
};

struct BuildRequest {
  std::string                        tag;
  model::BuildPlan                   plan;
  std::string                        base_reference; // used when the plan has no from-base step
  std::map<std::string, std::string> args;

  std::shared_ptr<const BuildContext>     context;
  std::shared_ptr<const CancellationToken> cancel;

  // bound on every wait: base image pull and layer write locks
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};

  std::function<void(const BuildEvent&)> on_event;
};

struct BuildReport {
  model::Image            image;
  std::vector<BuildEvent> events;
  std::size_t             cached_steps   = 0;
  std::size_t             executed_steps = 0;
};

/*
  Builds images step by step on top of the layer store.

  Every step except declare-arg produces a layer. A step whose fingerprint
  already exists under the current parent is a cache hit and is not
  executed. The image is published only after the last step succeeds, so
  a failed or cancelled build leaves no image behind.

  Failures: util::BuildError (missing base image, missing copy source,
  nonzero run status), util::BuildCancelled, util::Timeout.
*/
class ImageBuilder {
 public:
  ImageBuilder(std::shared_ptr<layer::LayerStore> layers, std::shared_ptr<image::ImageRegistry> registry, std::shared_ptr<StepExecutor> executor);

  BuildReport Build(const BuildRequest& request);

  // Kills run steps in flight for every build.
  void KillRunningSteps();

 private:
  class Session;

  std::shared_ptr<layer::LayerStore>    layers_;
  std::shared_ptr<image::ImageRegistry> registry_;
  std::shared_ptr<StepExecutor>         executor_;
};

} // namespace dockyard::build
