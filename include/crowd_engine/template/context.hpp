#pragma once

/// @file context.hpp
/// @brief Validation and evaluation contexts

#include "backend.hpp"
#include "random.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace crowd_template {

// =============================================================================
// Validation
// =============================================================================

/// @brief A configuration problem found on one node
struct ValidationIssue {
    std::string node_id;
    std::string node_type;
    std::string message;
};

/// @brief All configuration problems of a graph
struct ValidationReport {
    std::vector<ValidationIssue> issues;

    [[nodiscard]] bool ok() const { return issues.empty(); }
    [[nodiscard]] std::size_t size() const { return issues.size(); }

    /// Issues reported against one node
    [[nodiscard]] std::vector<ValidationIssue> for_node(const std::string& node_id) const;

    /// One line per issue
    [[nodiscard]] std::string summary() const;
};

/// @brief State of one validation pass
///
/// Each node is checked at most once per pass; the result is memoized so a
/// node shared by several parents reports its issues once.
class ValidationContext {
public:
    explicit ValidationContext(const ISceneBackend& backend) : backend_(backend) {}

    [[nodiscard]] const ISceneBackend& backend() const { return backend_; }

    /// Validate node (memoized)
    bool check(const INode& node);

    /// Record an issue against node
    void report(const INode& node, const std::string& message);

    // Setting reference checks; each reports on failure
    bool require_string(const INode& node, const std::string& key);
    bool require_object(const INode& node, const std::string& key);
    bool require_mesh(const INode& node, const std::string& key);
    bool require_object_group(const INode& node, const std::string& key);

    [[nodiscard]] const ValidationReport& issues() const { return report_; }
    [[nodiscard]] ValidationReport take_report() { return std::move(report_); }

private:
    const ISceneBackend& backend_;
    ValidationReport report_;
    std::unordered_map<const INode*, bool> results_;
    std::unordered_set<const INode*> in_progress_;
};

// =============================================================================
// Evaluation
// =============================================================================

/// @brief Capabilities and counters of one build
class EvaluationContext {
public:
    EvaluationContext(ISceneBackend& backend, RandomSource& random)
        : backend_(backend), random_(random) {}

    [[nodiscard]] ISceneBackend& backend() { return backend_; }
    [[nodiscard]] RandomSource& random() { return random_; }
    [[nodiscard]] BuildStats& stats() { return stats_; }
    [[nodiscard]] const BuildStats& stats() const { return stats_; }

    /// Clear counters and prepared groups
    void begin_build();

    /// Count a dropped branch
    void record_drop(const INode& node, DropReason reason);

    /// Count and log a non-fatal problem
    void warn(const INode& node, const std::string& message);

    // Agent groups prepared in this build: true if usable, false if dropped
    [[nodiscard]] std::optional<bool> prepared_group(const std::string& name) const;
    void mark_group_prepared(const std::string& name, bool usable);

private:
    ISceneBackend& backend_;
    RandomSource& random_;
    BuildStats stats_;
    std::unordered_map<std::string, bool> prepared_groups_;
};

} // namespace crowd_template
