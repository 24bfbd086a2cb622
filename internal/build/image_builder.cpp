#include "internal/build/image_builder.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <optional>

#include "internal/build/fingerprint.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path.hpp"
#include "internal/util/time.hpp"

namespace dockyard::build {

using dockyard::model::StepKind;
using dockyard::observability::BoolField;
using dockyard::observability::IntField;
using dockyard::observability::StringField;

namespace {

using Lookup = std::function<std::optional<std::string>(const std::string&)>;

bool HasGlob(std::string_view value) {
  return value.find_first_of("*?[") != std::string_view::npos;
}

// Expands $NAME and ${NAME}; unknown names expand to nothing, "\$" is a literal '$'.
std::string Substitute(std::string_view input, const Lookup& lookup) {
  std::string out;
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    if (c == '\\' && i + 1 < input.size() && input[i + 1] == '$') {
      out += '$';
      ++i;
      continue;
    }
    if (c != '$' || i + 1 >= input.size()) {
      out += c;
      continue;
    }

    std::string name;
    if (input[i + 1] == '{') {
      const auto close = input.find('}', i + 2);
      if (close == std::string_view::npos) {
        out += c;
        continue;
      }
      name = std::string(input.substr(i + 2, close - i - 2));
      i    = close;
    } else {
      std::size_t end = i + 1;
      while (end < input.size() && (std::isalnum(static_cast<unsigned char>(input[end])) || input[end] == '_')) ++end;
      if (end == i + 1) {
        out += c;
        continue;
      }
      name = std::string(input.substr(i + 1, end - i - 1));
      i    = end - 1;
    }

    if (auto value = lookup(name)) out += *value;
  }
  return out;
}

uint16_t ParsePort(const std::string& raw) {
  const auto text = raw.substr(0, raw.find('/'));
  if (text.empty() || text.size() > 5 || text.find_first_not_of("0123456789") != std::string::npos) {
    throw util::BuildError("invalid exposed port: '" + raw + "'");
  }
  const auto value = std::stoul(text);
  if (value == 0 || value > 65535) throw util::BuildError("exposed port out of range: " + raw);
  return static_cast<uint16_t>(value);
}

std::string BaseNameOf(const std::string& relative) {
  return relative.substr(relative.rfind('/') + 1);
}

std::string Tail(const std::string& output, std::size_t max_bytes = 512) {
  return output.size() <= max_bytes ? output : "..." + output.substr(output.size() - max_bytes);
}

std::string JoinOperands(const std::vector<std::string>& operands) {
  std::string out;
  for (const auto& operand : operands) {
    if (!out.empty()) out += ' ';
    out += operand;
  }
  return out;
}

} // namespace

/*
  State of one Build call. Holds a root reference on the current top layer
  so layer GC cannot collect a chain that is still being extended.
*/
class ImageBuilder::Session {
 public:
  Session(ImageBuilder& builder, const BuildRequest& request) : builder_(builder), request_(request) {
  }

  ~Session() {
    if (!current_.empty()) builder_.layers_->Release(current_);
  }

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  BuildReport Run();

 private:
  void Walk(const model::BuildPlan& steps, std::size_t start, const std::string& label);
  void Execute(const model::BuildStep& step, const std::string& label);

  model::BuildStep                   Resolve(const model::BuildStep& step) const;
  std::map<std::string, std::string> SelectCopySources(const model::BuildStep& step) const;
  model::FsDelta                     Produce(const model::BuildStep& step, const std::map<std::string, std::string>& copy_files);
  void                               ApplyMetadata(const model::BuildStep& step);

  std::optional<std::string> LookupVariable(const std::string& name) const;
  std::string                Sub(const std::string& value) const;

  void Advance(const std::string& fingerprint);
  void Emit(BuildEvent event);
  void CheckCancelled() const;

  ImageBuilder&       builder_;
  const BuildRequest& request_;
  std::string         tag_;

  std::map<std::string, std::string> args_;
  model::ImageMetadata               metadata_;
  layer::RootFs                      working_;
  std::string                        current_;

  BuildReport report_;
  std::size_t index_ = 0;
};

BuildReport ImageBuilder::Session::Run() {
  if (request_.tag.empty()) throw std::invalid_argument("build tag must not be empty");
  tag_ = model::NormalizeReference(request_.tag);

  const auto& plan  = request_.plan;
  std::size_t start = 0;
  std::string base  = request_.base_reference;
  if (!plan.empty() && plan.front().kind == StepKind::kFromBase) {
    if (plan.front().operands.empty()) throw util::BuildError("from-base step without an image reference");
    base  = Substitute(plan.front().operands.front(), [this](const std::string& name) -> std::optional<std::string> {
      auto it = request_.args.find(name);
      if (it == request_.args.end()) return std::nullopt;
      return it->second;
    });
    start = 1;
  }
  if (base.empty()) throw util::BuildError("build of " + tag_ + " has no base image");

  CheckCancelled();

  image::PullResult pulled;
  try {
    pulled = builder_.registry_->Pull(base, request_.timeout);
  } catch (const util::NotFound& e) {
    throw util::BuildError("missing base image " + base + ": " + e.what());
  }

  builder_.layers_->Retain(pulled.image.top());
  current_  = pulled.image.top();
  metadata_ = pulled.image.metadata;
  working_  = builder_.layers_->Flatten(current_);
  Emit({index_++, StepKind::kFromBase, "from-base " + pulled.image.reference, current_, !pulled.fetched});

  Walk(plan, start, "");

  model::Image image;
  image.reference = tag_;
  for (const auto& layer : builder_.layers_->Chain(current_)) image.layers.push_back(layer->fingerprint);
  image.metadata   = metadata_;
  image.created_at = util::Now();

  CheckCancelled();
  builder_.registry_->Publish(image);

  report_.image = std::move(image);
  DOCKYARD_LOG_INFO("image built", {StringField("image", tag_), IntField("cached", static_cast<std::int64_t>(report_.cached_steps)),
                                    IntField("executed", static_cast<std::int64_t>(report_.executed_steps))});
  return std::move(report_);
}

void ImageBuilder::Session::Walk(const model::BuildPlan& steps, std::size_t start, const std::string& label) {
  for (std::size_t i = start; i < steps.size(); ++i) {
    const auto& step = steps[i];
    switch (step.kind) {
      case StepKind::kFromBase:
        throw util::BuildError("from-base is only allowed as the first step");

      case StepKind::kDeclareArg: {
        if (step.operands.empty()) throw util::BuildError("declare-arg step without a name");
        const auto& name  = step.operands.front();
        auto        bound = request_.args.find(name);
        if (bound != request_.args.end()) {
          args_[name] = bound->second;
        } else {
          args_[name] = step.operands.size() > 1 ? Sub(step.operands[1]) : std::string();
        }
        break;
      }

      case StepKind::kConditional: {
        // undeclared args are still visible to predicates
        std::string value;
        if (auto declared = args_.find(step.when.arg); declared != args_.end()) {
          value = declared->second;
        } else if (auto bound = request_.args.find(step.when.arg); bound != request_.args.end()) {
          value = bound->second;
        }
        const bool taken = value == step.when.equals;

        // the chosen branch and the value that chose it are part of every
        // fingerprint inside the branch
        auto branch = "if " + step.when.arg + "==" + step.when.equals + " (" + step.when.arg + "=" + value + ")" + (taken ? " then" : " else");
        if (!label.empty()) branch = label + " / " + branch;

        DOCKYARD_LOG_DEBUG("conditional step", {StringField("arg", step.when.arg), StringField("value", value), BoolField("taken", taken)});
        Walk(taken ? step.then_steps : step.else_steps, 0, branch);
        break;
      }

      default:
        Execute(step, label);
        break;
    }
  }
}

void ImageBuilder::Session::Execute(const model::BuildStep& step, const std::string& label) {
  CheckCancelled();

  const auto resolved = Resolve(step);
  auto       rendered = model::Render(resolved);
  if (!label.empty()) rendered = "[" + label + "] " + rendered;

  StepInputs inputs;
  inputs.parent = current_;
  inputs.branch = label;
  // args are visible to the command, so they key its layer
  if (resolved.kind == StepKind::kRun) inputs.args = args_;

  std::map<std::string, std::string> copy_files;
  if (resolved.kind == StepKind::kCopy) {
    copy_files            = SelectCopySources(resolved);
    inputs.content_digest = ContentDigest(copy_files);
  }

  const auto fingerprint = StepFingerprint(resolved, inputs);
  auto       put         = builder_.layers_->GetOrCreate(
      current_, fingerprint, [&] { return Produce(resolved, copy_files); }, layer::PutOptions{request_.timeout, true});

  Advance(fingerprint);
  working_.Apply(put.layer->delta);
  ApplyMetadata(resolved);

  Emit({index_++, resolved.kind, rendered, fingerprint, !put.created});
}

model::BuildStep ImageBuilder::Session::Resolve(const model::BuildStep& step) const {
  model::BuildStep resolved = step;
  switch (step.kind) {
    case StepKind::kSetWorkdir:
      if (step.operands.size() != 1) throw util::BuildError("set-workdir takes exactly one path");
      resolved.operands.front() = Sub(step.operands.front());
      if (resolved.operands.front().empty()) throw util::BuildError("set-workdir path is empty");
      break;
    case StepKind::kCopy:
      if (step.operands.size() < 2) throw util::BuildError("copy step needs at least one source and a destination");
      for (auto& operand : resolved.operands) operand = Sub(operand);
      if (resolved.operands.back().empty()) throw util::BuildError("copy destination is empty");
      break;
    case StepKind::kExpose:
      for (auto& operand : resolved.operands) operand = Sub(operand);
      break;
    case StepKind::kSetEnv:
      for (auto& [key, value] : resolved.values) value = Sub(value);
      break;
    case StepKind::kRun:
      if (step.operands.empty()) throw util::BuildError("run step without a command");
      break;
    default:
      break;
  }

  if (resolved.kind == StepKind::kExpose) {
    for (const auto& port : resolved.operands) ParsePort(port);
  }
  return resolved;
}

std::map<std::string, std::string> ImageBuilder::Session::SelectCopySources(const model::BuildStep& step) const {
  if (!request_.context) throw util::BuildError("copy step requires a build context");
  if (step.operands.size() < 2) throw util::BuildError("copy step needs at least one source and a destination");

  const auto& destination_operand = step.operands.back();
  const auto  destination         = util::JoinContainerPath(metadata_.workdir, destination_operand);
  const bool  into_directory      = destination_operand.back() == '/' || destination_operand == "." || step.operands.size() > 2;

  const auto                         files = request_.context->ListFiles();
  std::map<std::string, std::string> out;

  for (std::size_t i = 0; i + 1 < step.operands.size(); ++i) {
    const auto& raw    = step.operands[i];
    const auto  source = util::NormalizeRelativePath(raw);

    if (HasGlob(source)) {
      bool matched = false;
      for (const auto& file : files) {
        if (::fnmatch(source.c_str(), file.c_str(), FNM_PATHNAME) != 0) continue;
        out[util::JoinContainerPath(destination, BaseNameOf(file))] = request_.context->ReadFile(file);
        matched = true;
      }
      if (!matched) DOCKYARD_LOG_DEBUG("copy pattern matched nothing", {StringField("pattern", raw)});
      continue;
    }

    if (!source.empty() && std::binary_search(files.begin(), files.end(), source)) {
      const auto target = into_directory ? util::JoinContainerPath(destination, BaseNameOf(source)) : destination;
      out[target]       = request_.context->ReadFile(source);
      continue;
    }

    // directory: its contents land below the destination
    const auto prefix = source.empty() ? std::string() : source + "/";
    bool       found  = false;
    for (const auto& file : files) {
      if (file.compare(0, prefix.size(), prefix) != 0) continue;
      out[util::JoinContainerPath(destination, file.substr(prefix.size()))] = request_.context->ReadFile(file);
      found = true;
    }
    if (!found) throw util::BuildError("copy source not found in build context: " + raw);
  }

  if (out.empty()) throw util::BuildError("copy step matched no files");
  return out;
}

model::FsDelta ImageBuilder::Session::Produce(const model::BuildStep& step, const std::map<std::string, std::string>& copy_files) {
  model::FsDelta delta;
  switch (step.kind) {
    case StepKind::kCopy:
      delta.upserts = copy_files;
      break;

    case StepKind::kRun: {
      RunRequest run;
      run.command = JoinOperands(step.operands);
      run.workdir = metadata_.workdir;
      run.env     = args_;
      for (const auto& [key, value] : metadata_.env) run.env[key] = value;
      run.rootfs = &working_;

      auto result = builder_.executor_->Run(run);
      if (result.exit_status != 0) {
        std::string message = "run step `" + run.command + "` exited with status " + std::to_string(result.exit_status);
        if (!result.output.empty()) message += ": " + Tail(result.output);
        throw util::BuildError(message);
      }
      delta = std::move(result.delta);
      break;
    }

    default:
      break;
  }
  return delta;
}

void ImageBuilder::Session::ApplyMetadata(const model::BuildStep& step) {
  switch (step.kind) {
    case StepKind::kSetWorkdir:
      metadata_.workdir = util::JoinContainerPath(metadata_.workdir, step.operands.front());
      break;
    case StepKind::kSetEnv:
      for (const auto& [key, value] : step.values) metadata_.env[key] = value;
      break;
    case StepKind::kExpose:
      for (const auto& operand : step.operands) {
        const auto port = ParsePort(operand);
        if (std::find(metadata_.exposed_ports.begin(), metadata_.exposed_ports.end(), port) == metadata_.exposed_ports.end()) {
          metadata_.exposed_ports.push_back(port);
        }
      }
      break;
    case StepKind::kSetCommand:
      metadata_.command = step.operands;
      break;
    default:
      break;
  }
}

std::optional<std::string> ImageBuilder::Session::LookupVariable(const std::string& name) const {
  if (auto it = metadata_.env.find(name); it != metadata_.env.end()) return it->second;
  if (auto it = args_.find(name); it != args_.end()) return it->second;
  return std::nullopt;
}

std::string ImageBuilder::Session::Sub(const std::string& value) const {
  return Substitute(value, [this](const std::string& name) { return LookupVariable(name); });
}

void ImageBuilder::Session::Advance(const std::string& fingerprint) {
  // GetOrCreate already retained the new top
  auto previous = std::move(current_);
  current_      = fingerprint;
  if (!previous.empty()) builder_.layers_->Release(previous);
}

void ImageBuilder::Session::Emit(BuildEvent event) {
  if (event.cached) {
    ++report_.cached_steps;
  } else {
    ++report_.executed_steps;
  }

  DOCKYARD_LOG_INFO("build step", {StringField("image", tag_), IntField("index", static_cast<std::int64_t>(event.index)),
                                   StringField("kind", model::ToString(event.kind)), StringField("fingerprint", event.fingerprint),
                                   BoolField("cached", event.cached)});

  if (request_.on_event) request_.on_event(event);
  report_.events.push_back(std::move(event));
}

void ImageBuilder::Session::CheckCancelled() const {
  if (request_.cancel && request_.cancel->IsCancelled()) {
    throw util::BuildCancelled("build of " + tag_ + " cancelled");
  }
}

ImageBuilder::ImageBuilder(std::shared_ptr<layer::LayerStore> layers, std::shared_ptr<image::ImageRegistry> registry,
                           std::shared_ptr<StepExecutor> executor)
    : layers_(std::move(layers)), registry_(std::move(registry)), executor_(std::move(executor)) {
}

BuildReport ImageBuilder::Build(const BuildRequest& request) {
  Session session(*this, request);
  return session.Run();
}

void ImageBuilder::KillRunningSteps() {
  executor_->Kill();
}

} // namespace dockyard::build
