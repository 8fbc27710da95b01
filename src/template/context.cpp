/// @file context.cpp
/// @brief Validation and evaluation contexts

#include <crowd_engine/template/context.hpp>
#include <crowd_engine/template/node.hpp>
#include <crowd_engine/core/log.hpp>

#include <fmt/format.h>

namespace crowd_template {

// =============================================================================
// ValidationReport
// =============================================================================

std::vector<ValidationIssue> ValidationReport::for_node(const std::string& node_id) const {
    std::vector<ValidationIssue> out;
    for (const auto& issue : issues) {
        if (issue.node_id == node_id) {
            out.push_back(issue);
        }
    }
    return out;
}

std::string ValidationReport::summary() const {
    std::string out;
    for (const auto& issue : issues) {
        out += fmt::format("{} ({}): {}\n", issue.node_id, issue.node_type, issue.message);
    }
    return out;
}

// =============================================================================
// ValidationContext
// =============================================================================

bool ValidationContext::check(const INode& node) {
    if (auto it = results_.find(&node); it != results_.end()) {
        return it->second;
    }
    if (in_progress_.count(&node) > 0) {
        report(node, "node is part of a cycle");
        return false;
    }

    in_progress_.insert(&node);
    const bool ok = node.validate(*this);
    in_progress_.erase(&node);

    results_[&node] = ok;
    return ok;
}

void ValidationContext::report(const INode& node, const std::string& message) {
    crowd_core::template_logger()->warn("Validation: {} ({}): {}", node.id(), node.type_name(), message);
    report_.issues.push_back(ValidationIssue{node.id(), node.type_name(), message});
}

bool ValidationContext::require_string(const INode& node, const std::string& key) {
    const std::string value = node.settings().get_string(key);
    if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
        report(node, fmt::format("setting '{}' must not be empty", key));
        return false;
    }
    return true;
}

bool ValidationContext::require_object(const INode& node, const std::string& key) {
    const std::string name = node.settings().get_string(key);
    if (!backend_.has_object(name)) {
        report(node, fmt::format("setting '{}' references unknown object '{}'", key, name));
        return false;
    }
    return true;
}

bool ValidationContext::require_mesh(const INode& node, const std::string& key) {
    const std::string name = node.settings().get_string(key);
    if (!backend_.has_mesh(name)) {
        report(node, fmt::format("setting '{}' references unknown mesh '{}'", key, name));
        return false;
    }
    return true;
}

bool ValidationContext::require_object_group(const INode& node, const std::string& key) {
    const std::string name = node.settings().get_string(key);
    if (!backend_.has_object_group(name)) {
        report(node, fmt::format("setting '{}' references unknown group '{}'", key, name));
        return false;
    }
    return true;
}

// =============================================================================
// EvaluationContext
// =============================================================================

void EvaluationContext::begin_build() {
    stats_ = BuildStats{};
    prepared_groups_.clear();
}

void EvaluationContext::record_drop(const INode& node, DropReason reason) {
    stats_.record_drop(reason);
    crowd_core::template_logger()->debug("{} ({}) dropped branch: {}",
                                         node.id(), node.type_name(), drop_reason_name(reason));
}

void EvaluationContext::warn(const INode& node, const std::string& message) {
    ++stats_.warnings;
    crowd_core::template_logger()->warn("{} ({}): {}", node.id(), node.type_name(), message);
}

std::optional<bool> EvaluationContext::prepared_group(const std::string& name) const {
    auto it = prepared_groups_.find(name);
    if (it == prepared_groups_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void EvaluationContext::mark_group_prepared(const std::string& name, bool usable) {
    prepared_groups_[name] = usable;
}

} // namespace crowd_template
