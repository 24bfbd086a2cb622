#include "internal/model/build_step.hpp"

#include <sstream>
#include <stdexcept>

namespace dockyard::model {

namespace {

struct KindName {
  StepKind         kind;
  std::string_view name;
};

constexpr KindName kKindNames[] = {
    {StepKind::kFromBase, "from-base"}, {StepKind::kDeclareArg, "declare-arg"}, {StepKind::kSetWorkdir, "set-workdir"},
    {StepKind::kCopy, "copy"},          {StepKind::kRun, "run"},                {StepKind::kSetEnv, "set-env"},
    {StepKind::kExpose, "expose"},      {StepKind::kSetCommand, "set-command"}, {StepKind::kConditional, "conditional"},
};

void RenderPlan(std::ostringstream& out, const BuildPlan& plan) {
  out << '[';
  for (std::size_t i = 0; i < plan.size(); ++i) {
    if (i) out << "; ";
    out << Render(plan[i]);
  }
  out << ']';
}

} // namespace

std::string_view ToString(StepKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.kind == kind) return entry.name;
  }
  return "unknown";
}

StepKind ParseStepKind(std::string_view name) {
  for (const auto& entry : kKindNames) {
    if (entry.name == name) return entry.kind;
  }
  throw std::invalid_argument("unknown build step kind: " + std::string(name));
}

std::string Render(const BuildStep& step) {
  std::ostringstream out;
  out << ToString(step.kind);

  if (step.kind == StepKind::kConditional) {
    out << " if " << step.when.arg << "==" << step.when.equals << " then ";
    RenderPlan(out, step.then_steps);
    out << " else ";
    RenderPlan(out, step.else_steps);
    return out.str();
  }

  for (const auto& operand : step.operands) out << ' ' << operand;
  for (const auto& [key, value] : step.values) out << ' ' << key << '=' << value;
  return out.str();
}

BuildStep FromBase(std::string reference) {
  BuildStep step;
  step.kind     = StepKind::kFromBase;
  step.operands = {std::move(reference)};
  return step;
}

BuildStep DeclareArg(std::string name, std::string default_value) {
  BuildStep step;
  step.kind     = StepKind::kDeclareArg;
  step.operands = {std::move(name)};
  if (!default_value.empty()) step.operands.push_back(std::move(default_value));
  return step;
}

BuildStep SetWorkdir(std::string path) {
  BuildStep step;
  step.kind     = StepKind::kSetWorkdir;
  step.operands = {std::move(path)};
  return step;
}

BuildStep Copy(std::vector<std::string> sources, std::string destination) {
  BuildStep step;
  step.kind     = StepKind::kCopy;
  step.operands = std::move(sources);
  step.operands.push_back(std::move(destination));
  return step;
}

BuildStep Run(std::string command) {
  BuildStep step;
  step.kind     = StepKind::kRun;
  step.operands = {std::move(command)};
  return step;
}

BuildStep SetEnv(std::map<std::string, std::string> values) {
  BuildStep step;
  step.kind   = StepKind::kSetEnv;
  step.values = std::move(values);
  return step;
}

BuildStep Expose(std::vector<std::string> ports) {
  BuildStep step;
  step.kind     = StepKind::kExpose;
  step.operands = std::move(ports);
  return step;
}

BuildStep SetCommand(std::vector<std::string> argv) {
  BuildStep step;
  step.kind     = StepKind::kSetCommand;
  step.operands = std::move(argv);
  return step;
}

BuildStep Conditional(ArgPredicate when, BuildPlan then_steps, BuildPlan else_steps) {
  BuildStep step;
  step.kind       = StepKind::kConditional;
  step.when       = std::move(when);
  step.then_steps = std::move(then_steps);
  step.else_steps = std::move(else_steps);
  return step;
}

} // namespace dockyard::model
