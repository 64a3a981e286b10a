#pragma once

#include <mcp_relay/auth/auth_gate.hpp>
#include <mcp_relay/config/app_config.hpp>
#include <mcp_relay/core/result.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_relay {

enum class Effect {
    Allow,
    Deny,
};

// Facts about the call beyond who/what/which, visible to rule conditions.
struct PolicyContext {
    std::string session;
    nlohmann::json arguments = nlohmann::json::object();
};

using PolicyCondition = std::function<bool(const PolicyContext&)>;

// ---------------------------------------------------------------------------
// PolicyRule — (principal, action, resource, condition, effect).
//
// Patterns: "*" matches everything, "abc*" is a prefix match, anything else
// matches exactly. A principal pattern "perm:<name>" matches principals that
// hold permission <name>. An empty condition always holds.
// ---------------------------------------------------------------------------
struct PolicyRule {
    std::string principal = "*";
    std::string action = "*";
    std::string resource = "*";
    PolicyCondition condition;
    Effect effect = Effect::Deny;
};

struct PolicyDecision {
    Effect effect = Effect::Deny;
    std::optional<std::size_t> rule_index;  // nullopt: implicit default deny

    [[nodiscard]] bool Allowed() const noexcept { return effect == Effect::Allow; }
};

[[nodiscard]] bool MatchPattern(std::string_view pattern, std::string_view value);

// ---------------------------------------------------------------------------
// PolicyEngine — first-match-wins evaluation over an immutable rule set.
//
// Evaluate takes a snapshot of the current rule set, so a concurrent Reload
// swaps the whole set and an evaluation sees either the old or the new one.
// ---------------------------------------------------------------------------
class PolicyEngine {
public:
    explicit PolicyEngine(std::vector<PolicyRule> rules = {});

    [[nodiscard]] PolicyDecision Evaluate(const Principal& principal,
                                          std::string_view action,
                                          std::string_view resource,
                                          const PolicyContext& context) const;

    void Reload(std::vector<PolicyRule> rules);

    [[nodiscard]] std::size_t RuleCount() const;

private:
    using RuleSet = std::vector<PolicyRule>;

    [[nodiscard]] std::shared_ptr<const RuleSet> Snapshot() const;

    mutable std::mutex mutex_;
    std::shared_ptr<const RuleSet> rules_;
};

/// Compile configured rules. A rule's `when` map becomes a condition that
/// requires each named argument to equal the given value.
[[nodiscard]] Result<std::vector<PolicyRule>, Error> BuildPolicyRules(
    const std::vector<PolicyRuleConfig>& configs);

/// Rule set installed when no policy is configured: any authenticated
/// principal may do anything.
[[nodiscard]] std::vector<PolicyRule> AllowAllPolicy();

/// The rule set a control plane configuration asks for: its compiled
/// `policy` section, or AllowAllPolicy() when the section is absent.
/// Used at startup and again on SIGHUP.
[[nodiscard]] Result<std::vector<PolicyRule>, Error> PolicyRulesFor(
    const ControlPlaneConfig& config);

} // namespace mcp_relay
