#ifndef PLUGRT_FRAMEWORK_CAPABILITY_CAPABILITY_DESCRIPTOR_HPP_
#define PLUGRT_FRAMEWORK_CAPABILITY_CAPABILITY_DESCRIPTOR_HPP_

#include "exchange/envelope.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plugrt::framework
{
  // What the runtime answers when a stage handler fails or times out.
  enum class FailurePolicy
  {
    FailClosed, // short-circuit with 500
    FailOpen // continue with the original envelope
  };

  std::string_view to_string(FailurePolicy policy);

  struct StageSupport
  {
    Stage stage = Stage::Request;
    FailurePolicy failure_policy = FailurePolicy::FailClosed;

    bool operator==(const StageSupport& other) const
    {
      return stage == other.stage && failure_policy == other.failure_policy;
    }
  };

  /**
   * @brief Static identity and stage set of a plugin.
   *
   * Built once when the runtime starts and never changed afterwards. The host reads it
   * through the Describe call to decide which stages to route to the plugin.
   */
  class CapabilityDescriptor
  {
  public:
    CapabilityDescriptor() = default;
    CapabilityDescriptor(std::string name, std::string version, std::string description = {});

    /**
     * @brief Declares participation in a stage.
     * @throws ConfigurationError if the stage is already declared.
     */
    CapabilityDescriptor& support(Stage stage, FailurePolicy policy = FailurePolicy::FailClosed);

    const std::string& name() const { return name_; }
    const std::string& version() const { return version_; }
    const std::string& description() const { return description_; }
    const std::vector<StageSupport>& stages() const { return stages_; }

    bool supports(Stage stage) const;
    std::optional<FailurePolicy> failure_policy(Stage stage) const;

    /**
     * @throws ConfigurationError if no stage is declared or the name is empty.
     */
    void validate() const;

    bool operator==(const CapabilityDescriptor& other) const;

  private:
    std::string name_;
    std::string version_;
    std::string description_;
    std::vector<StageSupport> stages_;
  };
}

#endif // PLUGRT_FRAMEWORK_CAPABILITY_CAPABILITY_DESCRIPTOR_HPP_
