#pragma once

#include "fplaunch/config_store.hpp"
#include "fplaunch/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fplaunch {

// Longest alias chain followed before resolution gives up
constexpr int kMaxAliasHops = 16;

enum class AliasVerdict {
    Ok,
    Collision,
    Cycle
};

inline const char* alias_verdict_to_string(AliasVerdict v) {
    switch (v) {
        case AliasVerdict::Ok: return "OK";
        case AliasVerdict::Collision: return "COLLISION";
        case AliasVerdict::Cycle: return "CYCLE";
        default: return "CYCLE";
    }
}

// ============================================================================
// Alias Graph
// ============================================================================

/**
 * Names live in an arena; each node has at most one outgoing edge
 * (alias -> target). All walks are bounded by kMaxAliasHops.
 */
class AliasGraph {
public:
    AliasGraph() = default;
    explicit AliasGraph(const std::vector<AliasRecord>& records);

    // Target of `alias` when it is an alias
    std::optional<std::string> targetOf(const std::string& alias) const;

    void setEdge(const std::string& alias, const std::string& target);
    bool removeEdge(const std::string& alias);

    // True when adding alias -> target would close a loop
    bool wouldCycle(const std::string& alias, const std::string& target) const;

    /**
     * Decide whether alias -> target may be added. `is_wrapper` reports names
     * already installed as wrappers. Cycles are refused even with `force`.
     */
    AliasVerdict check(const std::string& alias, const std::string& target, bool force,
                       const std::function<bool(const std::string&)>& is_wrapper) const;

    // Follow edges to a name that is not an alias
    Result<std::string> resolve(const std::string& name) const;

    // Records ordered by alias name
    std::vector<AliasRecord> records() const;

private:
    size_t intern(const std::string& name);
    std::optional<size_t> find(const std::string& name) const;

    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::optional<size_t>> edges_;
};

// ============================================================================
// Alias Resolver
// ============================================================================

class AliasResolver {
public:
    using WrapperCheck = std::function<bool(const std::string&)>;

    // Without a check, a name counts as a wrapper when <bin_dir>/<name> exists
    explicit AliasResolver(ConfigStore& store, WrapperCheck is_wrapper = {});

    AliasResolver(const AliasResolver&) = delete;
    AliasResolver& operator=(const AliasResolver&) = delete;

    /**
     * @brief Record alias -> target
     *
     * Both names are validated. A collision with an existing wrapper or a
     * different alias is refused unless `force`, which replaces the old
     * record and logs a warning. A cycle is always refused. On success the
     * record is persisted and, when possible, <bin_dir>/<alias> is linked
     * to the target's wrapper.
     */
    Result<void> createAlias(const std::string& alias, const std::string& target,
                             bool force = false);

    Result<void> removeAlias(const std::string& alias);

    Result<std::string> resolve(const std::string& name) const;

    std::vector<AliasRecord> records() const { return graph_.records(); }

    // Re-read the alias file
    void reload();

private:
    ConfigStore& store_;
    WrapperCheck is_wrapper_;
    AliasGraph graph_;
};

} // namespace fplaunch
