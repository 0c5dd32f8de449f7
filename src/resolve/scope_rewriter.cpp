#include "jpi/scope_rewriter.hpp"
#include "jpi/classifier.hpp"
#include "jpi/scopes.hpp"

#include <algorithm>
#include <future>
#include <map>

#include <spdlog/spdlog.h>

namespace jpi {

std::string rewrite_reason(const std::string& source_role) {
    return "added jar for compilation support (plugin present on " + source_role + ")";
}

ScopeRewriter::ScopeRewriter(const BuildConfiguration& config) : config_(config) {
    for (std::size_t i = 0; i < config.roles().size(); ++i) {
        slots_.push_back(std::make_unique<TargetSlot>());
    }
}

std::size_t ScopeRewriter::apply(const RewriteRule& rule,
                                 const std::vector<ResolvedArtifact>& artifacts) {
    if (rule.target >= slots_.size() || rule.source >= slots_.size()) {
        spdlog::error("rewrite rule references an unknown role");
        return 0;
    }

    const std::string& source_name = config_.roles().role(rule.source).name;
    const std::string& target_name = config_.roles().role(rule.target).name;

    TargetSlot& slot = *slots_[rule.target];
    std::lock_guard<std::mutex> lock(slot.mutex);

    std::size_t added = 0;
    for (const auto& artifact : artifacts) {
        if (classify(artifact) != ArtifactKind::HostExtension) continue;

        ModuleId module = artifact.id.module();
        auto existing = std::find_if(slot.entries.begin(), slot.entries.end(),
                                     [&](const RewrittenDependency& r) {
                                         return r.dependency.id.module() == module;
                                     });
        if (existing != slot.entries.end()) {
            spdlog::debug("rewrite {} -> {}: {} already added from {}", source_name, target_name,
                          module.to_string(), existing->source_role);
            continue;
        }

        RewrittenDependency entry;
        entry.dependency.id = artifact.id;
        entry.dependency.artifact_extension = "jar";
        entry.dependency.reason = rewrite_reason(source_name);
        entry.source_role = source_name;
        entry.target_role = target_name;

        spdlog::debug("rewrite {} -> {}: {}", source_name, target_name,
                      entry.dependency.to_notation());
        slot.entries.push_back(std::move(entry));
        ++added;
    }
    return added;
}

RewriteResult ScopeRewriter::run(RoleResolver& resolver) {
    RewriteResult result;

    if (!config_.frozen()) {
        result.error_kind = ErrorKind::Configuration;
        result.error = "rewrite rules run only after the configuration is frozen";
        return result;
    }

    const auto& rules = config_.rewrite_rules();
    const auto& graph = config_.roles();

    // Rule i depends on rule j when j's target flows into i's source
    std::vector<std::vector<std::size_t>> depends_on(rules.size());
    for (std::size_t i = 0; i < rules.size(); ++i) {
        auto feeding = graph.contributors(rules[i].source);
        for (std::size_t j = 0; j < rules.size(); ++j) {
            if (std::find(feeding.begin(), feeding.end(), rules[j].target) != feeding.end()) {
                depends_on[i].push_back(j);
            }
        }
    }

    std::vector<bool> done(rules.size(), false);
    std::size_t remaining = rules.size();

    while (remaining > 0) {
        std::vector<std::size_t> wave;
        for (std::size_t i = 0; i < rules.size(); ++i) {
            if (done[i]) continue;
            bool ready = std::all_of(depends_on[i].begin(), depends_on[i].end(),
                                     [&](std::size_t j) { return done[j]; });
            if (ready) wave.push_back(i);
        }

        if (wave.empty()) {
            result.error_kind = ErrorKind::Configuration;
            for (std::size_t i = 0; i < rules.size(); ++i) {
                if (!done[i]) {
                    result.error = "rewrite rules feed each other through '" +
                                   graph.role(rules[i].source).name + "'";
                    break;
                }
            }
            return result;
        }

        // One resolution per distinct source role
        std::map<RoleHandle, std::future<RoleResolveResult>> pending;
        for (std::size_t i : wave) {
            RoleHandle source = rules[i].source;
            if (pending.count(source) > 0) continue;
            pending.emplace(source, std::async(std::launch::async, [&resolver, source]() {
                                return resolver.resolve(source);
                            }));
        }

        std::map<RoleHandle, RoleResolveResult> resolved;
        for (auto& [source, future] : pending) {
            resolved.emplace(source, future.get());
        }

        for (std::size_t i : wave) {
            const auto& source_result = resolved.at(rules[i].source);
            if (!source_result.ok) {
                result.resolution_errors.insert(result.resolution_errors.end(),
                                                source_result.errors.begin(),
                                                source_result.errors.end());
                if (result.error.empty()) {
                    result.error_kind = source_result.error_kind;
                    result.error = source_result.error;
                }
                continue;
            }
            result.added += apply(rules[i], source_result.artifacts);
            done[i] = true;
            --remaining;
        }

        if (!result.error.empty()) return result;
    }

    spdlog::info("rewrite rules applied: {} dependencies added", result.added);
    result.ok = true;
    return result;
}

std::vector<RewrittenDependency> ScopeRewriter::rewritten(RoleHandle target) const {
    if (target >= slots_.size()) return {};
    const TargetSlot& slot = *slots_[target];
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.entries;
}

std::vector<RewrittenDependency> ScopeRewriter::all() const {
    std::vector<RewrittenDependency> result;
    for (RoleHandle h = 0; h < slots_.size(); ++h) {
        auto entries = rewritten(h);
        result.insert(result.end(), entries.begin(), entries.end());
    }
    return result;
}

} // namespace jpi
