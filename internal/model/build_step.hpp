#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dockyard::model {

enum class StepKind {
  kFromBase,
  kDeclareArg,
  kSetWorkdir,
  kCopy,
  kRun,
  kSetEnv,
  kExpose,
  kSetCommand,
  kConditional,
};

std::string_view ToString(StepKind kind);

// Accepts the dashed names used in deployment files ("set-workdir").
// Throws std::invalid_argument for unknown kinds.
StepKind ParseStepKind(std::string_view name);

// Predicate of a conditional step: arg == equals.
struct ArgPredicate {
  std::string arg;
  std::string equals;
};

/*
  One instruction of a build plan. Operand layout per kind:

    from-base    operands[0] = image reference
    declare-arg  operands[0] = name, operands[1] = default (optional)
    set-workdir  operands[0] = path
    copy         operands[0..n-2] = context sources, operands[n-1] = destination
    run          operands joined by ' ' = shell command
    set-env      values = assignments
    expose       operands = container ports
    set-command  operands = argv
    conditional  when, then_steps, else_steps
*/
struct BuildStep {
  StepKind                           kind = StepKind::kRun;
  std::vector<std::string>           operands;
  std::map<std::string, std::string> values;

  ArgPredicate           when;
  std::vector<BuildStep> then_steps;
  std::vector<BuildStep> else_steps;
};

using BuildPlan = std::vector<BuildStep>;

// Canonical one-line form: "<kind> <operands...> <k=v...>".
std::string Render(const BuildStep& step);

BuildStep FromBase(std::string reference);
BuildStep DeclareArg(std::string name, std::string default_value = {});
BuildStep SetWorkdir(std::string path);
BuildStep Copy(std::vector<std::string> sources, std::string destination);
BuildStep Run(std::string command);
BuildStep SetEnv(std::map<std::string, std::string> values);
BuildStep Expose(std::vector<std::string> ports);
BuildStep SetCommand(std::vector<std::string> argv);
BuildStep Conditional(ArgPredicate when, BuildPlan then_steps, BuildPlan else_steps = {});

} // namespace dockyard::model
