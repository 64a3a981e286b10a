#include <mcp_relay/auth/policy_engine.hpp>

namespace mcp_relay {

namespace {

constexpr std::string_view kPermissionPrefix = "perm:";

bool MatchPrincipal(const std::string& pattern, const Principal& principal) {
    std::string_view p(pattern);
    if (p.substr(0, kPermissionPrefix.size()) == kPermissionPrefix) {
        return principal.HasPermission(std::string(p.substr(kPermissionPrefix.size())));
    }
    return MatchPattern(p, principal.name);
}

// Arguments are compared by their string form: strings as-is, everything
// else by its JSON dump ("true", "42", ...).
std::string ArgumentText(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // anonymous namespace

bool MatchPattern(std::string_view pattern, std::string_view value) {
    if (pattern == "*") return true;
    if (!pattern.empty() && pattern.back() == '*') {
        auto prefix = pattern.substr(0, pattern.size() - 1);
        return value.substr(0, prefix.size()) == prefix;
    }
    return pattern == value;
}

PolicyEngine::PolicyEngine(std::vector<PolicyRule> rules)
    : rules_(std::make_shared<const RuleSet>(std::move(rules))) {}

std::shared_ptr<const PolicyEngine::RuleSet> PolicyEngine::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_;
}

PolicyDecision PolicyEngine::Evaluate(const Principal& principal,
                                      std::string_view action,
                                      std::string_view resource,
                                      const PolicyContext& context) const {
    auto rules = Snapshot();
    for (std::size_t i = 0; i < rules->size(); ++i) {
        const auto& rule = (*rules)[i];
        if (!MatchPrincipal(rule.principal, principal)) continue;
        if (!MatchPattern(rule.action, action)) continue;
        if (!MatchPattern(rule.resource, resource)) continue;
        if (rule.condition && !rule.condition(context)) continue;
        return PolicyDecision{rule.effect, i};
    }
    return PolicyDecision{Effect::Deny, std::nullopt};
}

void PolicyEngine::Reload(std::vector<PolicyRule> rules) {
    auto fresh = std::make_shared<const RuleSet>(std::move(rules));
    std::lock_guard<std::mutex> lock(mutex_);
    rules_ = std::move(fresh);
}

std::size_t PolicyEngine::RuleCount() const {
    return Snapshot()->size();
}

Result<std::vector<PolicyRule>, Error> BuildPolicyRules(
    const std::vector<PolicyRuleConfig>& configs) {
    std::vector<PolicyRule> rules;
    rules.reserve(configs.size());

    for (std::size_t i = 0; i < configs.size(); ++i) {
        const auto& config = configs[i];
        PolicyRule rule;
        rule.principal = config.principal;
        rule.action = config.action;
        rule.resource = config.resource;

        if (config.effect == "allow") {
            rule.effect = Effect::Allow;
        } else if (config.effect == "deny") {
            rule.effect = Effect::Deny;
        } else {
            return Result<std::vector<PolicyRule>, Error>::Err(
                MakeError(ErrorCategory::Config, "BuildPolicyRules",
                          "Policy rule #" + std::to_string(i + 1) +
                              ": effect must be 'allow' or 'deny', got '" +
                              config.effect + "'"));
        }

        if (!config.when.empty()) {
            auto required = config.when;
            rule.condition = [required](const PolicyContext& context) {
                if (!context.arguments.is_object()) return false;
                for (const auto& [name, value] : required) {
                    auto it = context.arguments.find(name);
                    if (it == context.arguments.end()) return false;
                    if (ArgumentText(*it) != value) return false;
                }
                return true;
            };
        }
        rules.push_back(std::move(rule));
    }
    return Result<std::vector<PolicyRule>, Error>::Ok(std::move(rules));
}

std::vector<PolicyRule> AllowAllPolicy() {
    PolicyRule rule;
    rule.effect = Effect::Allow;
    return {rule};
}

Result<std::vector<PolicyRule>, Error> PolicyRulesFor(const ControlPlaneConfig& config) {
    if (config.has_policy) return BuildPolicyRules(config.policy);
    return Result<std::vector<PolicyRule>, Error>::Ok(AllowAllPolicy());
}

} // namespace mcp_relay
