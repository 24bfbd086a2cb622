#pragma once

#include <map>
#include <string>

#include "internal/model/build_step.hpp"

namespace dockyard::build {

/*
  Layer fingerprints.

  A step's fingerprint covers its parent layer, the branch it was reached
  through, the step itself after argument substitution and, for copy steps,
  the digest of the files it brings in. Run steps also cover the bound
  build args since the command sees them.

  Kind, every operand, every key and every value are hashed as separate
  length-prefixed fields, so two steps share a fingerprint only when they
  are field-for-field identical. Equal fingerprints therefore imply equal
  deltas, and a change at step N leaves steps before N untouched.
*/

// destination path -> content; hashed in path order, never mtimes.
std::string ContentDigest(const std::map<std::string, std::string>& files);

struct StepInputs {
  std::string                        parent;
  std::string                        branch; // empty outside conditionals
  std::map<std::string, std::string> args;   // run steps only
  std::string                        content_digest;
};

std::string StepFingerprint(const model::BuildStep& step, const StepInputs& inputs);

} // namespace dockyard::build
