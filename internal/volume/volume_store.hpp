#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace dockyard::volume {

struct Volume {
  std::string     id;
  bool            anonymous = false;
  std::size_t     refcount  = 0;
  util::TimePoint created_at;
};

struct AcquireResult {
  std::string id;
  bool        created = false;
};

/*
  Durable volumes and their contents.

  Named volumes are keyed by name and created on first use. Anonymous
  volumes get a generated id. Releasing a volume never deletes it: removal
  is always explicit (Remove, GcUnreferenced). Reference counts are
  in-process; after Hydrate every volume starts unreferenced.
*/
class VolumeStore {
 public:
  explicit VolumeStore(std::shared_ptr<db::Repository> repository);

  void Hydrate();

  AcquireResult AcquireNamed(const std::string& name);
  std::string   CreateAnonymous();
  void          AcquireExisting(const std::string& id); // util::NotFound
  void          Release(const std::string& id);

  // util::InvalidState while referenced; false when absent.
  bool Remove(const std::string& id);

  std::size_t GcUnreferenced(bool include_named = false);

  std::optional<Volume> Get(const std::string& id) const;
  bool                  Exists(const std::string& id) const;
  std::vector<Volume>   List() const;

  // Paths are relative to the volume root.
  std::optional<std::string>         ReadFile(const std::string& id, const std::string& path) const;
  void                               WriteFile(const std::string& id, const std::string& path, const std::string& content);
  bool                               RemoveFile(const std::string& id, const std::string& path);
  std::map<std::string, std::string> ListFiles(const std::string& id) const;
  bool                               IsEmpty(const std::string& id) const;

  // Copies files into an empty volume; a volume with content is left alone.
  bool Seed(const std::string& id, const std::map<std::string, std::string>& files);

 private:
  void   Create(const std::string& id, bool anonymous);
  void   DeleteLocked(const std::string& id);
  Volume& GetLocked(const std::string& id);

  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex            mutex_;
  std::map<std::string, Volume> volumes_;
};

} // namespace dockyard::volume
