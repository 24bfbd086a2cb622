#include "internal/build/fingerprint.hpp"

#include "internal/util/digest.hpp"

namespace dockyard::build {

namespace {

void HashMap(util::Sha256& hasher, const std::map<std::string, std::string>& entries) {
  hasher.UpdateField(std::to_string(entries.size()));
  for (const auto& [key, value] : entries) hasher.UpdateField(key).UpdateField(value);
}

} // namespace

std::string ContentDigest(const std::map<std::string, std::string>& files) {
  util::Sha256 hasher;
  for (const auto& [path, content] : files) hasher.UpdateField(path).UpdateField(content);
  return hasher.Finish();
}

std::string StepFingerprint(const model::BuildStep& step, const StepInputs& inputs) {
  util::Sha256 hasher;
  hasher.UpdateField(inputs.parent).UpdateField(inputs.branch).UpdateField(model::ToString(step.kind));

  hasher.UpdateField(std::to_string(step.operands.size()));
  for (const auto& operand : step.operands) hasher.UpdateField(operand);
  HashMap(hasher, step.values);
  HashMap(hasher, inputs.args);

  hasher.UpdateField(inputs.content_digest);
  return hasher.Finish();
}

} // namespace dockyard::build
