#include "capability_descriptor.hpp"
#include "exception/errors.hpp"

#include <fmt/core.h>
#include <algorithm>

namespace plugrt::framework
{
  std::string_view to_string(FailurePolicy policy)
  {
    return policy == FailurePolicy::FailOpen ? "fail-open" : "fail-closed";
  }

  CapabilityDescriptor::CapabilityDescriptor(std::string name, std::string version, std::string description)
    : name_(std::move(name)),
      version_(std::move(version)),
      description_(std::move(description))
  {
  }

  CapabilityDescriptor& CapabilityDescriptor::support(Stage stage, FailurePolicy policy)
  {
    if (supports(stage))
    {
      throw ConfigurationError(fmt::format("plugin '{}' declares stage {} twice", name_, to_string(stage)));
    }
    stages_.push_back(StageSupport{stage, policy});
    return *this;
  }

  bool CapabilityDescriptor::supports(Stage stage) const
  {
    return failure_policy(stage).has_value();
  }

  std::optional<FailurePolicy> CapabilityDescriptor::failure_policy(Stage stage) const
  {
    auto it = std::find_if(stages_.begin(), stages_.end(), [stage](const StageSupport& s)
    {
      return s.stage == stage;
    });
    if (it == stages_.end())
    {
      return std::nullopt;
    }
    return it->failure_policy;
  }

  void CapabilityDescriptor::validate() const
  {
    if (name_.empty())
    {
      throw ConfigurationError("plugin descriptor has an empty name");
    }
    if (stages_.empty())
    {
      throw ConfigurationError(fmt::format("plugin '{}' declares no stages", name_));
    }
  }

  bool CapabilityDescriptor::operator==(const CapabilityDescriptor& other) const
  {
    return name_ == other.name_ &&
      version_ == other.version_ &&
      description_ == other.description_ &&
      stages_ == other.stages_;
  }
}
