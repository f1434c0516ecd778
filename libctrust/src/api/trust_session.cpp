// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "ctrust/api/trust_session.hpp"
#include "ctrust/core/logging.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust
{
    namespace v = validation;

    auto name_of(session_state state) noexcept -> std::string_view
    {
        switch (state)
        {
            case session_state::uninitialized:
                return "uninitialized";
            case session_state::initialized:
                return "initialized";
            case session_state::staging:
                return "staging";
            case session_state::publishing:
                return "publishing";
            case session_state::failed:
                return "failed";
        }
        return "";
    }

    namespace
    {
        [[nodiscard]] auto key_map(const std::vector<v::PublicKey>& keys)
            -> std::map<std::string, v::PublicKey>
        {
            auto out = std::map<std::string, v::PublicKey>{};
            for (const auto& key : keys)
            {
                out.insert_or_assign(v::key_id(key), key);
            }
            return out;
        }

        [[nodiscard]] auto default_roles(const TrustSession::role_list& roles) -> TrustSession::role_list
        {
            if (roles.empty())
            {
                return { std::string(v::targets_role_name) };
            }
            return roles;
        }

        void check_top_level(std::string_view role)
        {
            if (!v::is_top_level_role(role))
            {
                LOG_ERROR << "'" << role << "' is not a top-level role";
                throw v::role_error(role, "not a top-level role");
            }
        }
    }

    TrustSession::TrustSession(
        std::string gun,
        v::CryptoService& custody,
        RemoteStore* remote,
        SessionParams params,
        v::signature_verifier verifier
    )
        : m_gun(std::move(gun))
        , p_custody(&custody)
        , p_remote(remote)
        , m_params(std::move(params))
        , m_verifier(std::move(verifier))
    {
    }

    auto TrustSession::gun() const -> const std::string&
    {
        return m_gun;
    }

    auto TrustSession::state() const -> session_state
    {
        return m_state.load();
    }

    auto TrustSession::params() const -> const SessionParams&
    {
        return m_params;
    }

    auto TrustSession::require_committed() const -> state_ptr
    {
        if (m_state.load() == session_state::failed)
        {
            throw v::session_failed_error(m_gun, m_failure_reason.value());
        }
        auto committed = m_committed.value();
        if (!committed)
        {
            throw v::not_initialized_error(m_gun);
        }
        return committed;
    }

    auto TrustSession::committed() const -> std::shared_ptr<const v::TrustState>
    {
        return m_committed.value();
    }

    /*******************
     * Initialization *
     *******************/

    void TrustSession::initialize(const role_list& root_key_ids, const role_list& server_managed_roles)
    {
        auto lock = std::unique_lock(m_publish_mutex);
        if (m_committed.value())
        {
            LOG_ERROR << "Trust data of '" << m_gun << "' is already initialized";
            throw v::already_initialized_error(m_gun);
        }

        auto state = v::TrustState{};
        state.gun = m_gun;
        state.generation = 1;
        state.registry = v::RoleRegistry::initialize(
            *p_custody,
            root_key_ids,
            server_managed_roles,
            m_verifier
        );

        for (const auto& name : { v::targets_role_name, v::snapshot_role_name, v::timestamp_role_name })
        {
            auto role = v::Role{};
            role.name = std::string(name);
            if (state.registry.is_server_managed(name))
            {
                if (p_remote == nullptr)
                {
                    throw v::unimplemented_error(
                        "initialize",
                        fmt::format("role '{}' is server-managed but there is no remote store", name)
                    );
                }
                role.add_key(p_remote->get_role_key(m_gun, name));
            }
            else
            {
                for (const auto& id : p_custody->list_keys(name))
                {
                    if (auto key = p_custody->get_key(id))
                    {
                        role.keys.insert_or_assign(id, *key);
                    }
                }
                if (role.keys.empty())
                {
                    LOG_DEBUG << "Creating a " << v::name_of(m_params.default_key_algorithm)
                              << " key for role '" << name << "' of '" << m_gun << "'";
                    role.add_key(p_custody->create(name, m_gun, m_params.default_key_algorithm));
                }
            }
            if (name == v::targets_role_name)
            {
                role.paths = { "" };
            }
            state.registry.set_role(std::move(role));
        }
        state.delegations.set_root_paths(state.registry.get_role(v::targets_role_name).paths);

        auto summary = v::FoldSummary{};
        summary.touched_roles = { std::string(v::root_role_name), std::string(v::targets_role_name) };
        sign_generation(state, summary, {});
        upload_and_commit(std::move(state));
        LOG_INFO << "Initialized trust data of '" << m_gun << "'";
    }

    /*************
     * Publishing *
     *************/

    auto TrustSession::collect_signatures(
        const v::TrustState& state,
        const v::BaseRole& role,
        std::string_view payload
    ) const -> std::vector<v::Signature>
    {
        if (state.registry.is_server_managed(role.name))
        {
            if (p_remote == nullptr)
            {
                throw v::unimplemented_error(
                    "sign",
                    fmt::format("role '{}' is server-managed but there is no remote store", role.name)
                );
            }
            return p_remote->sign_role(m_gun, role.name, payload);
        }

        std::vector<v::Signature> signatures;
        for (const auto& id : role.key_ids())
        {
            if (!p_custody->get_key(id))
            {
                LOG_WARNING << "Key '" << id << "' of role '" << role.name
                            << "' is not in the key custody, skipping";
                continue;
            }
            signatures.push_back(p_custody->sign(id, payload));
        }
        return signatures;
    }

    void TrustSession::sign_generation(
        v::TrustState& candidate,
        const v::FoldSummary& summary,
        const std::stop_token& stop
    ) const
    {
        const auto touched = [&](std::string_view name)
        { return summary.touched_roles.count(std::string(name)) > 0; };

        std::vector<std::string> to_sign;
        for (const auto name : { v::root_role_name, v::targets_role_name })
        {
            if (touched(name))
            {
                to_sign.emplace_back(name);
            }
        }
        for (const auto& delegation : candidate.delegations.list_delegations())
        {
            if (touched(delegation.name))
            {
                to_sign.push_back(delegation.name);
            }
        }
        // Snapshot covers the roles above, timestamp covers snapshot
        to_sign.emplace_back(v::snapshot_role_name);
        to_sign.emplace_back(v::timestamp_role_name);

        for (const auto& name : to_sign)
        {
            if (stop.stop_requested())
            {
                throw v::cancelled_error("publish");
            }

            const auto previous = candidate.metadata.find(name);
            const std::size_t version = previous == candidate.metadata.end()
                                            ? 1
                                            : previous->second.version + 1;
            const auto expires = v::expiration_from_now(m_params.expiry_for(name));
            auto payload = v::build_signed_payload(candidate, name, version, expires);

            const v::BaseRole& role = v::is_top_level_role(name)
                                          ? static_cast<const v::BaseRole&>(
                                                candidate.registry.get_role(name)
                                            )
                                          : candidate.delegations.get(name);
            auto signatures = collect_signatures(candidate, role, payload);

            if (name == v::root_role_name && summary.previous_root)
            {
                // A rotated root is also signed by the keys it replaces
                for (auto& sig : collect_signatures(candidate, *summary.previous_root, payload))
                {
                    const bool known = std::any_of(
                        signatures.cbegin(),
                        signatures.cend(),
                        [&](const v::Signature& s) { return s.keyid == sig.keyid; }
                    );
                    if (!known)
                    {
                        signatures.push_back(std::move(sig));
                    }
                }
                candidate.registry.check_threshold(*summary.previous_root, payload, signatures);
            }
            candidate.registry.check_threshold(role, payload, signatures);

            LOG_DEBUG << "Signed version " << version << " of role '" << name << "' with "
                      << signatures.size() << " signature(s)";
            candidate.metadata.insert_or_assign(
                name,
                v::SignedMetadata{ name, version, expires, std::move(payload), std::move(signatures) }
            );
        }
    }

    void TrustSession::upload_and_commit(v::TrustState candidate)
    {
        if (p_remote != nullptr)
        {
            p_remote->publish(m_gun, candidate.generation, candidate.metadata);
        }

        auto staged = m_staged.synchronize();
        m_committed = std::make_shared<const v::TrustState>(std::move(candidate));
        staged->changes.remove_first(staged->in_flight);
        staged->in_flight = 0;
        m_state = staged->changes.empty() ? session_state::initialized : session_state::staging;
    }

    void TrustSession::publish(std::stop_token stop)
    {
        auto lock = std::unique_lock(m_publish_mutex);
        state_ptr base;
        std::vector<v::Change> changes;
        {
            auto staged = m_staged.synchronize();
            base = require_committed();
            changes = staged->changes.list();
            staged->in_flight = changes.size();
        }
        if (changes.empty())
        {
            LOG_INFO << "No staged changes to publish for '" << m_gun << "'";
            return;
        }

        m_state = session_state::publishing;
        try
        {
            if (stop.stop_requested())
            {
                throw v::cancelled_error("publish");
            }

            auto [candidate, summary] = v::fold_changes(*base, changes);
            candidate.generation = base->generation + 1;
            sign_generation(candidate, summary, stop);

            if (stop.stop_requested())
            {
                throw v::cancelled_error("publish");
            }
            upload_and_commit(std::move(candidate));
            LOG_INFO << "Published generation " << base->generation + 1 << " of '" << m_gun
                     << "' with " << changes.size() << " change(s)";
        }
        catch (const v::trust_error& e)
        {
            LOG_ERROR << "Publishing '" << m_gun << "' failed: " << e.what();
            m_staged->in_flight = 0;
            m_state = session_state::staging;
            throw;
        }
        catch (const std::exception& e)
        {
            LOG_CRITICAL << "Publishing '" << m_gun << "' failed unrecoverably: " << e.what();
            m_staged->in_flight = 0;
            m_failure_reason = std::string(e.what());
            m_state = session_state::failed;
            throw;
        }
    }

    void TrustSession::delete_trust_data(bool delete_remote)
    {
        auto lock = std::unique_lock(m_publish_mutex);
        if (delete_remote)
        {
            if (p_remote == nullptr)
            {
                throw v::unimplemented_error("delete_trust_data", "there is no remote store");
            }
            // Local data are kept if this throws
            p_remote->delete_trust_data(m_gun);
        }

        auto staged = m_staged.synchronize();
        m_committed = state_ptr{};
        staged->changes.clear();
        m_failure_reason = std::string();
        m_state = session_state::uninitialized;
        LOG_INFO << "Deleted trust data of '" << m_gun << "'";
    }

    /***********
     * Staging *
     ***********/

    auto TrustSession::pending_view() const -> v::TrustState
    {
        auto staged = m_staged.synchronize();
        const auto base = require_committed();
        return v::apply_staged_changes(*base, staged->changes.list());
    }

    void TrustSession::stage(std::vector<v::Change> changes)
    {
        // Checked against and appended to the staged changes under one lock
        auto staged = m_staged.synchronize();
        const auto base = require_committed();
        auto pending = v::apply_staged_changes(*base, staged->changes.list());
        auto summary = v::FoldSummary{};
        for (const auto& change : changes)
        {
            v::apply_change(pending, change, summary);
            if (change.type == v::change_type_delegation && change.action != v::change_action::remove)
            {
                pending.delegations.get(change.scope).check_threshold_bounds();
            }
        }

        auto updated = staged->changes;
        for (auto& change : changes)
        {
            updated.add(std::move(change));
        }
        staged->changes = std::move(updated);

        auto expected = session_state::initialized;
        m_state.compare_exchange_strong(expected, session_state::staging);
    }

    void TrustSession::stage_delegation(
        v::change_action action,
        std::string_view name,
        const v::DelegationChangeContent& content
    )
    {
        stage({ v::Change::make_delegation(action, name, content) });
    }

    void TrustSession::add_target(const v::Target& target, const role_list& roles)
    {
        target.check_well_formed();
        std::vector<v::Change> changes;
        for (const auto& role : default_roles(roles))
        {
            changes.push_back(v::Change::make_target(v::change_action::create, role, target));
        }
        stage(std::move(changes));
    }

    void TrustSession::remove_target(std::string_view name, const role_list& roles)
    {
        auto target = v::Target{};
        target.name = std::string(name);
        std::vector<v::Change> changes;
        for (const auto& role : default_roles(roles))
        {
            changes.push_back(v::Change::make_target(v::change_action::remove, role, target));
        }
        stage(std::move(changes));
    }

    void TrustSession::add_delegation(
        std::string_view name,
        const std::vector<v::PublicKey>& keys,
        const std::vector<std::string>& paths,
        std::optional<std::size_t> threshold
    )
    {
        auto content = v::DelegationChangeContent{};
        content.add_keys = key_map(keys);
        content.add_paths = paths;
        content.threshold = threshold;
        stage_delegation(v::change_action::create, name, content);
    }

    void TrustSession::add_delegation_role_and_keys(
        std::string_view name,
        const std::vector<v::PublicKey>& keys,
        std::optional<std::size_t> threshold
    )
    {
        add_delegation(name, keys, {}, threshold);
    }

    void TrustSession::add_delegation_paths(std::string_view name, const std::vector<std::string>& paths)
    {
        auto content = v::DelegationChangeContent{};
        content.add_paths = paths;
        stage_delegation(v::change_action::update, name, content);
    }

    void TrustSession::remove_delegation_keys_and_paths(
        std::string_view name,
        const std::vector<std::string>& key_ids,
        const std::vector<std::string>& paths
    )
    {
        auto content = v::DelegationChangeContent{};
        content.remove_keys = key_ids;
        content.remove_paths = paths;
        stage_delegation(v::change_action::update, name, content);
    }

    void TrustSession::remove_delegation_role(std::string_view name)
    {
        stage_delegation(v::change_action::remove, name, {});
    }

    void
    TrustSession::remove_delegation_paths(std::string_view name, const std::vector<std::string>& paths)
    {
        remove_delegation_keys_and_paths(name, {}, paths);
    }

    void
    TrustSession::remove_delegation_keys(std::string_view name, const std::vector<std::string>& key_ids)
    {
        remove_delegation_keys_and_paths(name, key_ids, {});
    }

    void TrustSession::clear_delegation_paths(std::string_view name)
    {
        auto content = v::DelegationChangeContent{};
        content.clear_paths = true;
        stage_delegation(v::change_action::update, name, content);
    }

    auto TrustSession::witness(const role_list& roles) -> role_list
    {
        const auto pending = pending_view();
        role_list staged;
        std::vector<v::Change> changes;
        for (const auto& role : roles)
        {
            if (!pending.is_signing_role(role))
            {
                LOG_WARNING << "Only targets and delegation roles can be witnessed, skipping '"
                            << role << "'";
                continue;
            }
            changes.push_back(v::Change::make_witness(role));
            staged.push_back(role);
        }
        if (!changes.empty())
        {
            stage(std::move(changes));
        }
        return staged;
    }

    void TrustSession::rotate_key(std::string_view role, bool server_manages_key, const role_list& key_ids)
    {
        check_top_level(role);
        const auto pending = pending_view();

        auto keys = std::map<std::string, v::PublicKey>{};
        if (server_manages_key)
        {
            if (role != v::snapshot_role_name && role != v::timestamp_role_name)
            {
                LOG_ERROR << "Role '" << role << "' cannot be managed by the server";
                throw v::role_error(role, "only snapshot and timestamp keys can be managed by the server");
            }
            if (p_remote == nullptr)
            {
                throw v::unimplemented_error(
                    "rotate_key",
                    "server-managed keys require a remote store"
                );
            }
            auto key = p_remote->rotate_role_key(m_gun, role);
            keys.insert_or_assign(v::key_id(key), key);
        }
        else if (key_ids.empty())
        {
            auto key = p_custody->create(role, m_gun, m_params.default_key_algorithm);
            keys.insert_or_assign(v::key_id(key), key);
        }
        else
        {
            for (const auto& id : key_ids)
            {
                auto key = p_custody->get_key(id);
                if (!key)
                {
                    LOG_ERROR << "Key '" << id << "' is unknown to the key custody";
                    throw v::not_found_error("key", id, { std::string(role), {}, id });
                }
                keys.insert_or_assign(id, *key);
            }
        }

        auto content = v::RoleChangeContent{};
        content.server_managed = server_manages_key;
        if (pending.registry.get_role(role).threshold > keys.size())
        {
            content.threshold = keys.size();
        }
        content.keys = std::move(keys);
        stage({ v::Change::make_role(role, content) });
    }

    void TrustSession::set_role_threshold(std::string_view role, std::size_t threshold)
    {
        check_top_level(role);
        const auto pending = pending_view();
        auto content = v::RoleChangeContent{};
        content.threshold = threshold;
        content.server_managed = pending.registry.is_server_managed(role);
        stage({ v::Change::make_role(role, content) });
    }

    void TrustSession::discard_changes()
    {
        auto staged = m_staged.synchronize();
        if (staged->in_flight > 0)
        {
            LOG_INFO << "Keeping " << staged->in_flight << " change(s) being published for '"
                     << m_gun << "'";
        }
        staged->changes.truncate(staged->in_flight);
        if (staged->changes.empty())
        {
            auto expected = session_state::staging;
            m_state.compare_exchange_strong(expected, session_state::initialized);
        }
    }

    /***********
     * Queries *
     ***********/

    auto TrustSession::list_targets(const role_list& roles) const -> target_list
    {
        return require_committed()->list_targets(roles);
    }

    auto TrustSession::get_target_by_name(std::string_view name, const role_list& roles) const
        -> v::TargetWithRole
    {
        return require_committed()->get_target_by_name(name, roles);
    }

    auto TrustSession::get_all_target_metadata_by_name(std::string_view name) const
        -> std::vector<v::TargetSignedStruct>
    {
        return require_committed()->get_all_target_metadata_by_name(name);
    }

    auto TrustSession::get_changelist() const -> std::vector<v::Change>
    {
        return m_staged->changes.list();
    }

    auto TrustSession::list_roles() const -> std::vector<v::RoleWithSignatures>
    {
        return require_committed()->list_roles();
    }

    auto TrustSession::get_delegation_roles(bool include_pending) const
        -> std::vector<v::DelegationRole>
    {
        if (include_pending)
        {
            return pending_view().delegations.list_delegations();
        }
        return require_committed()->delegations.list_delegations();
    }

    auto TrustSession::list_keys(std::string_view role) const -> std::set<std::string>
    {
        return p_custody->list_keys(role);
    }

    auto TrustSession::get_signed_metadata(std::string_view role) const
        -> std::optional<v::SignedMetadata>
    {
        const auto committed = require_committed();
        if (auto it = committed->metadata.find(std::string(role)); it != committed->metadata.end())
        {
            return it->second;
        }
        return std::nullopt;
    }
}
