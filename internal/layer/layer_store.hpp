#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/layer/layer.hpp"
#include "internal/layer/rootfs.hpp"

namespace dockyard::layer {

struct PutOptions {
  // defaults to the store's lock timeout
  std::optional<std::chrono::milliseconds> lock_timeout;

  // take a root reference on the returned layer atomically with the lookup,
  // so a concurrent GcUnreferenced cannot collect it first
  bool retain = false;
};

struct PutResult {
  LayerRef layer;
  bool     created = false;
};

/*
  Content-addressable layer store.

  - Layers are keyed by fingerprint and never mutated.
  - Put is idempotent: an existing fingerprint returns the stored layer.
  - Writes are serialized per fingerprint. Waiting for that lock is bounded
    by a timeout and fails with util::Timeout.
  - Root references (Retain/Release) are held by published images and
    in-progress builds; GcUnreferenced removes every layer not reachable
    from a root.

  The repository holds the durable copy; Hydrate() rebuilds the index.
*/
class LayerStore {
 public:
  using Producer = std::function<model::FsDelta()>;

  explicit LayerStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds lock_timeout = std::chrono::seconds(30));

  void Hydrate();

  LayerRef Find(const std::string& fingerprint) const;
  LayerRef Get(const std::string& fingerprint) const;
  bool     Contains(const std::string& fingerprint) const;

  PutResult Put(const std::string& parent, model::FsDelta delta, const std::string& fingerprint, const PutOptions& options = {});

  // produce runs only when the fingerprint is absent, under its write lock,
  // so concurrent identical builds run a step once and share the layer.
  PutResult GetOrCreate(const std::string& parent, const std::string& fingerprint, const Producer& produce, const PutOptions& options = {});

  void        Retain(const std::string& fingerprint);
  void        Release(const std::string& fingerprint);
  std::size_t RefCount(const std::string& fingerprint) const;

  std::size_t GcUnreferenced();

  // Layers from the base up to top.
  std::vector<LayerRef> Chain(const std::string& top) const;
  RootFs                Flatten(const std::string& top) const;

  std::size_t size() const;

 private:
  LayerRef                          FindAndMaybeRetain(const std::string& fingerprint, const std::string& parent, bool retain);
  std::shared_ptr<std::timed_mutex> WriteLock(const std::string& fingerprint);

  std::shared_ptr<db::Repository> repository_;
  std::chrono::milliseconds       lock_timeout_;

  mutable std::shared_mutex                    mutex_;
  std::unordered_map<std::string, LayerRef>    layers_;
  std::unordered_map<std::string, std::size_t> roots_;

  std::mutex                                                         write_locks_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> write_locks_;
};

} // namespace dockyard::layer
