#include "fplaunch/alias_resolver.hpp"
#include "fplaunch/platform.hpp"
#include "fplaunch/safety.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace fplaunch {

// ============================================================================
// AliasGraph
// ============================================================================

AliasGraph::AliasGraph(const std::vector<AliasRecord>& records) {
    for (const auto& record : records) {
        setEdge(record.alias, record.target);
    }
}

size_t AliasGraph::intern(const std::string& name) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        return it->second;
    }
    size_t node = names_.size();
    names_.push_back(name);
    edges_.push_back(std::nullopt);
    index_[name] = node;
    return node;
}

std::optional<size_t> AliasGraph::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> AliasGraph::targetOf(const std::string& alias) const {
    auto node = find(alias);
    if (!node || !edges_[*node]) return std::nullopt;
    return names_[*edges_[*node]];
}

void AliasGraph::setEdge(const std::string& alias, const std::string& target) {
    size_t from = intern(alias);
    size_t to = intern(target);
    edges_[from] = to;
}

bool AliasGraph::removeEdge(const std::string& alias) {
    auto node = find(alias);
    if (!node || !edges_[*node]) return false;
    edges_[*node] = std::nullopt;
    return true;
}

bool AliasGraph::wouldCycle(const std::string& alias, const std::string& target) const {
    if (alias == target) return true;

    auto start = find(target);
    if (!start) return false;

    std::optional<size_t> current = start;
    for (int hop = 0; hop <= kMaxAliasHops && current; ++hop) {
        if (names_[*current] == alias) return true;
        current = edges_[*current];
    }
    // Still walking after the hop limit: treat as a loop
    return current.has_value();
}

AliasVerdict AliasGraph::check(const std::string& alias, const std::string& target, bool force,
                               const std::function<bool(const std::string&)>& is_wrapper) const {
    if (wouldCycle(alias, target)) {
        return AliasVerdict::Cycle;
    }

    auto existing = targetOf(alias);
    if (existing) {
        if (*existing == target || force) return AliasVerdict::Ok;
        return AliasVerdict::Collision;
    }

    if (is_wrapper && is_wrapper(alias) && !force) {
        return AliasVerdict::Collision;
    }
    return AliasVerdict::Ok;
}

Result<std::string> AliasGraph::resolve(const std::string& name) const {
    auto node = find(name);
    if (!node) {
        return Result<std::string>::ok(name);
    }

    size_t current = *node;
    for (int hop = 0; hop < kMaxAliasHops; ++hop) {
        if (!edges_[current]) {
            return Result<std::string>::ok(names_[current]);
        }
        current = *edges_[current];
    }
    if (!edges_[current]) {
        return Result<std::string>::ok(names_[current]);
    }

    return Result<std::string>::err(Error(ErrorCode::AliasResolution,
        "alias chain for " + printable_input(name) + " exceeds " +
        std::to_string(kMaxAliasHops) + " hops"));
}

std::vector<AliasRecord> AliasGraph::records() const {
    std::vector<AliasRecord> out;
    for (size_t node = 0; node < names_.size(); ++node) {
        if (edges_[node]) {
            out.push_back({names_[node], names_[*edges_[node]]});
        }
    }
    std::sort(out.begin(), out.end(),
              [](const AliasRecord& a, const AliasRecord& b) { return a.alias < b.alias; });
    return out;
}

// ============================================================================
// AliasResolver
// ============================================================================

AliasResolver::AliasResolver(ConfigStore& store, WrapperCheck is_wrapper)
    : store_(store), is_wrapper_(std::move(is_wrapper)) {
    if (!is_wrapper_) {
        is_wrapper_ = [this](const std::string& name) {
            return path_exists(join_path(store_.binDir(), name));
        };
    }
    reload();
}

void AliasResolver::reload() {
    graph_ = AliasGraph(store_.loadAliases());
}

Result<void> AliasResolver::createAlias(const std::string& alias, const std::string& target,
                                        bool force) {
    auto blocklist = store_.loadBlocklist();
    for (const auto* name : {&alias, &target}) {
        auto id_check = validate_identifier_format(*name, blocklist);
        if (!id_check.ok()) {
            return Result<void>::err(Error(ErrorCode::Validation,
                "alias name " + printable_input(*name) + ": " + id_check.reason));
        }
        auto file_check = validate_name_component(*name);
        if (!file_check.ok()) {
            return Result<void>::err(Error(ErrorCode::Validation,
                "alias name " + printable_input(*name) + ": " + file_check.reason));
        }
    }

    auto guard = store_.lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    reload();

    auto previous = graph_.targetOf(alias);
    auto verdict = graph_.check(alias, target, force, is_wrapper_);
    if (verdict == AliasVerdict::Cycle) {
        return Result<void>::err(Error(ErrorCode::AliasResolution,
            "CYCLE: " + alias + " -> " + target + " would create an alias loop"));
    }
    if (verdict == AliasVerdict::Collision) {
        return Result<void>::err(Error(ErrorCode::AliasResolution,
            "COLLISION: " + alias + " already exists (use --force to replace)"));
    }

    if (previous && *previous != target) {
        spdlog::warn("replacing alias {} -> {} with {} -> {}", alias, *previous, alias, target);
    } else if (!previous && is_wrapper_(alias)) {
        spdlog::warn("alias {} now shadows an existing wrapper", alias);
    }

    graph_.setEdge(alias, target);
    auto saved = store_.saveAliases(graph_.records());
    if (saved.isErr()) {
        reload();
        return saved;
    }

    // Point <bin_dir>/<alias> at the target wrapper; never clobber a real file
    std::string bin_dir = store_.binDir();
    std::string alias_path = join_path(bin_dir, alias);
    if (is_regular_file(join_path(bin_dir, target)) &&
        (!path_exists(alias_path) || is_symlink(alias_path))) {
        auto linked = atomic_update_symlink(alias_path, target);
        if (!linked.ok) {
            spdlog::warn("could not link {}: {}", alias_path, linked.error);
        }
    }

    return Result<void>::ok();
}

Result<void> AliasResolver::removeAlias(const std::string& alias) {
    auto guard = store_.lock();
    if (guard.isErr()) {
        return Result<void>::err(guard.error());
    }
    reload();

    if (!graph_.removeEdge(alias)) {
        return Result<void>::err(Error(ErrorCode::NotFound,
                                       "alias not found: " + printable_input(alias)));
    }
    auto saved = store_.saveAliases(graph_.records());
    if (saved.isErr()) {
        reload();
        return saved;
    }

    if (validate_name_component(alias).ok()) {
        std::string alias_path = join_path(store_.binDir(), alias);
        if (is_symlink(alias_path)) {
            remove_file(alias_path);
        }
    }
    return Result<void>::ok();
}

Result<std::string> AliasResolver::resolve(const std::string& name) const {
    return graph_.resolve(name);
}

} // namespace fplaunch
