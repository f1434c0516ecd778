// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ctrust/core/logging.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"
#include "ctrust/validation/trust_state.hpp"

namespace ctrust::validation
{
    namespace
    {
        [[nodiscard]] auto to_delegation_role(const Role& role) -> DelegationRole
        {
            auto out = DelegationRole{};
            out.name = role.name;
            out.keys = role.keys;
            out.threshold = role.threshold;
            out.paths = role.paths;
            return out;
        }

        [[nodiscard]] auto to_role(const DelegationRole& delegation) -> Role
        {
            auto out = Role{};
            out.name = delegation.name;
            out.keys = delegation.keys;
            out.threshold = delegation.threshold;
            out.paths = delegation.paths;
            return out;
        }

        [[nodiscard]] auto default_roles(const std::vector<std::string>& roles)
            -> std::vector<std::string>
        {
            if (roles.empty())
            {
                return { std::string(targets_role_name) };
            }
            return roles;
        }

        void apply_target_change(TrustState& state, const Change& change, FoldSummary& summary)
        {
            if (!state.is_signing_role(change.scope))
            {
                LOG_ERROR << "Target '" << change.path << "' is scoped to unknown role '"
                          << change.scope << "'";
                throw unknown_delegation_error(change.scope);
            }

            if (change.action == change_action::remove)
            {
                if (!state.catalog.remove_target(change.scope, change.path))
                {
                    LOG_DEBUG << "Target '" << change.path << "' already absent from role '"
                              << change.scope << "'";
                }
                summary.touched_roles.insert(change.scope);
                return;
            }

            const auto content = change.target_content();
            auto target = Target{ change.path, content.length, content.hashes };
            target.check_well_formed();
            if (!state.signing_role(change.scope).can_sign_for(target.name))
            {
                LOG_ERROR << "Role '" << change.scope << "' may not sign for target '"
                          << target.name << "'";
                throw path_not_authorized_error(change.scope, target.name);
            }
            state.catalog.set_target(change.scope, std::move(target));
            summary.touched_roles.insert(change.scope);
        }

        void apply_delegation_change(TrustState& state, const Change& change, FoldSummary& summary)
        {
            const auto& name = change.scope;
            if (!is_delegation_name(name))
            {
                LOG_ERROR << "'" << name << "' is not a valid delegation name";
                throw role_error(name, "delegation names must be of the form 'targets/<name>'");
            }
            const auto parent = parent_role_name(name);
            if (!state.is_signing_role(parent))
            {
                LOG_ERROR << "Parent '" << parent << "' of delegation '" << name
                          << "' does not exist";
                throw unknown_delegation_error(parent);
            }

            switch (change.action)
            {
                case change_action::create:
                {
                    const auto content = change.delegation_content();
                    state.delegations.add_delegation(
                        name,
                        content.add_keys,
                        content.add_paths,
                        content.threshold
                    );
                    break;
                }
                case change_action::update:
                {
                    const auto content = change.delegation_content();
                    // Throws if absent
                    static_cast<void>(state.delegations.get(name));
                    state.delegations.add_delegation_keys(name, content.add_keys);
                    state.delegations.remove_delegation_keys(name, content.remove_keys);
                    if (content.clear_paths)
                    {
                        state.delegations.clear_delegation_paths(name);
                    }
                    state.delegations.add_delegation_paths(name, content.add_paths);
                    state.delegations.remove_delegation_paths(name, content.remove_paths);
                    if (content.threshold)
                    {
                        state.delegations.set_delegation_threshold(name, *content.threshold);
                    }
                    break;
                }
                case change_action::remove:
                {
                    for (const auto& removed : state.delegations.remove_delegation(name))
                    {
                        state.catalog.remove_role(removed);
                        state.metadata.erase(removed);
                        state.registry.invalidate(removed);
                        summary.touched_roles.erase(removed);
                        summary.removed_roles.insert(removed);
                    }
                    break;
                }
            }

            state.registry.invalidate(name);
            summary.touched_roles.insert(parent);
            // A signed statement of the delegation must be re-signed by its current keys
            if (change.action != change_action::remove && state.metadata.count(name) > 0)
            {
                summary.touched_roles.insert(name);
            }
        }

        void apply_witness_change(TrustState& state, const Change& change, FoldSummary& summary)
        {
            if (!state.is_signing_role(change.scope))
            {
                LOG_ERROR << "Cannot witness unknown role '" << change.scope << "'";
                throw unknown_delegation_error(change.scope);
            }
            summary.touched_roles.insert(change.scope);
        }

        void apply_role_change(TrustState& state, const Change& change, FoldSummary& summary)
        {
            const auto& name = change.path;
            if (!is_top_level_role(name))
            {
                LOG_ERROR << "'" << name << "' is not a top-level role";
                throw role_error(name, "not a top-level role");
            }

            const auto content = change.role_content();
            auto role = Role{};
            if (const auto* existing = state.registry.find_role(name))
            {
                role = *existing;
            }
            role.name = name;

            if (content.keys)
            {
                if (name == root_role_name && !summary.previous_root && !role.keys.empty())
                {
                    summary.previous_root = role;
                }
                role.keys = *content.keys;
            }
            if (content.threshold)
            {
                role.threshold = *content.threshold;
            }

            if (name == snapshot_role_name || name == timestamp_role_name)
            {
                state.registry.set_server_managed(name, content.server_managed);
            }
            else if (content.server_managed)
            {
                LOG_ERROR << "Role '" << name << "' cannot be managed by the server";
                throw role_error(name, "only snapshot and timestamp keys can be managed by the server");
            }

            state.registry.set_role(std::move(role));
            if (name == targets_role_name)
            {
                state.delegations.set_root_paths(state.registry.get_role(name).paths);
            }
            summary.touched_roles.insert(name);
            summary.touched_roles.insert(std::string(root_role_name));
        }

        [[nodiscard]] auto signed_header(
            const TrustState& state,
            std::string_view type,
            std::string_view role,
            std::size_t version,
            std::string_view expires
        ) -> nlohmann::json
        {
            return {
                { "_type", std::string(type) },
                { "gun", state.gun },
                { "role", std::string(role) },
                { "version", version },
                { "expires", std::string(expires) },
            };
        }

        [[nodiscard]] auto meta_entry(const SignedMetadata& metadata) -> nlohmann::json
        {
            return {
                { "version", metadata.version },
                { "length", metadata.payload.size() },
                { "hashes", { { "sha256", sha256_hex(metadata.payload) } } },
            };
        }
    }

    auto TrustState::signing_role(std::string_view name) const -> DelegationRole
    {
        if (name == targets_role_name)
        {
            if (const auto* targets = registry.find_role(name))
            {
                return to_delegation_role(*targets);
            }
            throw unknown_delegation_error(name);
        }
        return delegations.get(name);
    }

    auto TrustState::is_signing_role(std::string_view name) const -> bool
    {
        if (name == targets_role_name)
        {
            return registry.has_role(name);
        }
        return delegations.contains(name);
    }

    auto TrustState::walk_from(std::string_view name) const -> std::vector<std::string>
    {
        std::vector<std::string> out = { std::string(name) };
        for (const auto& child : delegations.children_of(name))
        {
            auto sub = walk_from(child.name);
            out.insert(out.end(), sub.begin(), sub.end());
        }
        return out;
    }

    auto TrustState::list_targets(const std::vector<std::string>& roles) const
        -> std::vector<TargetWithRole>
    {
        std::vector<TargetWithRole> out;
        std::set<std::string> seen;
        for (const auto& requested : default_roles(roles))
        {
            if (!is_signing_role(requested))
            {
                LOG_WARNING << "Skipping unknown role '" << requested << "' while listing targets";
                continue;
            }
            for (const auto& role : walk_from(requested))
            {
                for (const auto& [name, target] : catalog.targets_of(role))
                {
                    if (seen.insert(name).second)
                    {
                        out.push_back({ target, role });
                    }
                }
            }
        }
        return out;
    }

    auto
    TrustState::get_target_by_name(std::string_view name, const std::vector<std::string>& roles) const
        -> TargetWithRole
    {
        for (const auto& requested : default_roles(roles))
        {
            if (!is_signing_role(requested))
            {
                LOG_WARNING << "Skipping unknown role '" << requested << "' while looking up target '"
                            << name << "'";
                continue;
            }
            for (const auto& role : walk_from(requested))
            {
                if (!signing_role(role).can_sign_for(name))
                {
                    continue;
                }
                if (const auto* target = catalog.find(role, name))
                {
                    return { *target, role };
                }
            }
        }
        throw not_found_error("target", name, { {}, std::string(name) });
    }

    auto TrustState::get_all_target_metadata_by_name(std::string_view name) const
        -> std::vector<TargetSignedStruct>
    {
        std::vector<TargetSignedStruct> out;
        if (!is_signing_role(targets_role_name))
        {
            throw not_found_error("target", name, { {}, std::string(name) });
        }
        for (const auto& role : walk_from(targets_role_name))
        {
            if (const auto* target = catalog.find(role, name))
            {
                out.push_back({ signing_role(role), *target, verified_signatures(role) });
            }
        }
        if (out.empty())
        {
            throw not_found_error("target", name, { {}, std::string(name) });
        }
        return out;
    }

    auto TrustState::list_roles() const -> std::vector<RoleWithSignatures>
    {
        std::vector<RoleWithSignatures> out;
        for (auto& role : registry.list_roles())
        {
            auto signatures = verified_signatures(role.name);
            out.push_back({ std::move(role), std::move(signatures) });
        }
        for (const auto& delegation : delegations.list_delegations())
        {
            out.push_back({ to_role(delegation), verified_signatures(delegation.name) });
        }
        return out;
    }

    auto TrustState::verified_signatures(std::string_view role) const -> std::vector<Signature>
    {
        auto it = metadata.find(std::string(role));
        if (it == metadata.cend())
        {
            return {};
        }
        if (const auto* top_level = registry.find_role(role))
        {
            return registry.annotate(*top_level, it->second.payload, it->second.signatures);
        }
        if (const auto* delegation = delegations.find(role))
        {
            return registry.annotate(*delegation, it->second.payload, it->second.signatures);
        }
        return it->second.signatures;
    }

    void apply_change(TrustState& state, const Change& change, FoldSummary& summary)
    {
        LOG_TRACE << "Applying '" << name_of(change.action) << "' " << change.type
                  << " change on '" << change.scope << "' (" << change.path << ")";
        if (change.type == change_type_target)
        {
            apply_target_change(state, change, summary);
        }
        else if (change.type == change_type_delegation)
        {
            apply_delegation_change(state, change, summary);
        }
        else if (change.type == change_type_witness)
        {
            apply_witness_change(state, change, summary);
        }
        else if (change.type == change_type_role)
        {
            apply_role_change(state, change, summary);
        }
        else
        {
            throw invalid_change_error(
                fmt::format("unknown change type '{}'", change.type),
                { change.scope, change.path }
            );
        }
    }

    void check_consistency(const TrustState& state)
    {
        state.delegations.check_consistency();
        for (const auto& role : state.registry.list_roles())
        {
            role.check_threshold_bounds();
        }
        for (const auto& role : state.catalog.roles())
        {
            if (!state.is_signing_role(role))
            {
                LOG_ERROR << "Targets are signed by unknown role '" << role << "'";
                throw unknown_delegation_error(role);
            }
            const auto signer = state.signing_role(role);
            for (const auto& [name, target] : state.catalog.targets_of(role))
            {
                if (!signer.can_sign_for(name))
                {
                    LOG_ERROR << "Role '" << role << "' may no longer sign for target '" << name
                              << "'";
                    throw path_not_authorized_error(role, name);
                }
            }
        }
    }

    auto fold_changes(const TrustState& state, const std::vector<Change>& changes)
        -> std::pair<TrustState, FoldSummary>
    {
        auto candidate = state;
        auto summary = FoldSummary{};
        for (const auto& change : changes)
        {
            apply_change(candidate, change, summary);
        }
        check_consistency(candidate);
        return { std::move(candidate), std::move(summary) };
    }

    auto apply_staged_changes(const TrustState& state, const std::vector<Change>& changes)
        -> TrustState
    {
        auto pending = state;
        auto summary = FoldSummary{};
        for (const auto& change : changes)
        {
            try
            {
                auto next = pending;
                apply_change(next, change, summary);
                pending = std::move(next);
            }
            catch (const trust_error& e)
            {
                LOG_DEBUG << "Staged change no longer applies: " << e.what();
            }
        }
        return pending;
    }

    auto build_signed_payload(
        const TrustState& state,
        std::string_view role,
        std::size_t version,
        std::string_view expires
    ) -> std::string
    {
        if (role == root_role_name)
        {
            auto j = signed_header(state, "Root", role, version, expires);
            auto keys = std::map<std::string, PublicKey>{};
            auto roles = nlohmann::json::object();
            for (const auto& r : state.registry.list_roles())
            {
                keys.insert(r.keys.cbegin(), r.keys.cend());
                roles[r.name] = r.root_view();
            }
            j["keys"] = keys_to_json(keys);
            j["roles"] = roles;
            j["server_managed"] = state.registry.server_managed_roles();
            return j.dump();
        }

        if (role == snapshot_role_name || role == timestamp_role_name)
        {
            auto j = signed_header(
                state,
                role == snapshot_role_name ? "Snapshot" : "Timestamp",
                role,
                version,
                expires
            );
            auto meta = nlohmann::json::object();
            for (const auto& [name, metadata] : state.metadata)
            {
                const bool covered = (role == snapshot_role_name)
                                         ? (name != snapshot_role_name && name != timestamp_role_name)
                                         : (name == snapshot_role_name);
                if (covered)
                {
                    meta[name] = meta_entry(metadata);
                }
            }
            j["meta"] = meta;
            return j.dump();
        }

        if (!state.is_signing_role(role))
        {
            throw not_found_error("role", role, { std::string(role) });
        }
        auto j = signed_header(state, "Targets", role, version, expires);
        auto targets = nlohmann::json::object();
        for (const auto& [name, target] : state.catalog.targets_of(role))
        {
            targets[name] = { { "length", target.length }, { "hashes", target.hashes } };
        }
        j["targets"] = targets;

        auto delegated_keys = std::map<std::string, PublicKey>{};
        auto delegated_roles = nlohmann::json::array();
        for (const auto& child : state.delegations.children_of(role))
        {
            delegated_keys.insert(child.keys.cbegin(), child.keys.cend());
            delegated_roles.push_back({
                { "name", child.name },
                { "keyids", child.key_ids() },
                { "threshold", child.threshold },
                { "paths", child.paths },
            });
        }
        j["delegations"] = { { "keys", keys_to_json(delegated_keys) }, { "roles", delegated_roles } };
        return j.dump();
    }
}
