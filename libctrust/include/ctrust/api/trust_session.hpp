// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_API_TRUST_SESSION_HPP
#define CTRUST_API_TRUST_SESSION_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "ctrust/api/configuration.hpp"
#include "ctrust/api/remote_store.hpp"
#include "ctrust/util/synchronized_value.hpp"
#include "ctrust/validation/changelist.hpp"
#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/role_registry.hpp"
#include "ctrust/validation/trust_state.hpp"

namespace ctrust
{
    enum class session_state
    {
        uninitialized,
        initialized,
        staging,
        publishing,
        failed,
    };

    [[nodiscard]] auto name_of(session_state state) noexcept -> std::string_view;

    /**
     * Trust data of one collection (GUN): staged edits and the committed signed generation.
     *
     * Edits are staged in a changelist and only reach the committed state through `publish`,
     * which folds them all or none. Queries read the committed generation as of their call.
     * Staging and queries may run concurrently with a publish, at most one publish runs at a
     * time.
     */
    class TrustSession
    {
    public:

        using target_list = std::vector<validation::TargetWithRole>;
        using role_list = std::vector<std::string>;

        /**
         * @param custody Key custody, must outlive the session.
         * @param remote Remote authority, optional, must outlive the session.
         */
        TrustSession(
            std::string gun,
            validation::CryptoService& custody,
            RemoteStore* remote = nullptr,
            SessionParams params = {},
            validation::signature_verifier verifier = validation::default_signature_verifier()
        );

        TrustSession(const TrustSession&) = delete;
        TrustSession& operator=(const TrustSession&) = delete;

        [[nodiscard]] auto gun() const -> const std::string&;
        [[nodiscard]] auto state() const -> session_state;
        [[nodiscard]] auto params() const -> const SessionParams&;

        /**
         * Create the root of trust and publish generation 1.
         *
         * Keys of non server-managed roles are taken from the custody, or created there.
         *
         * @throw already_initialized_error if the session holds trust data.
         * @throw invalid_root_keys_error if a root key is unknown to the custody.
         * @throw unimplemented_error if a role is server-managed without a remote store.
         */
        void initialize(const role_list& root_key_ids, const role_list& server_managed_roles = {});

        /**
         * Fold every staged change into a new signed generation and commit it.
         *
         * On failure the committed generation and the changelist are left unchanged.
         *
         * @throw trust_error describing the failure.
         * @throw cancelled_error if a stop was requested before the upload.
         */
        void publish(std::stop_token stop = {});

        /**
         * Wipe the trust data of the collection, remotely first if requested.
         *
         * @throw unimplemented_error if `delete_remote` is requested without a remote store.
         * @throw transport_error if the remote deletion fails, local data is then kept.
         */
        void delete_trust_data(bool delete_remote);

        /// Stage the target in each role, `targets` by default.
        void add_target(const validation::Target& target, const role_list& roles = {});
        void remove_target(std::string_view name, const role_list& roles = {});

        [[nodiscard]] auto list_targets(const role_list& roles = {}) const -> target_list;
        [[nodiscard]] auto get_target_by_name(std::string_view name, const role_list& roles = {}) const
            -> validation::TargetWithRole;
        [[nodiscard]] auto get_all_target_metadata_by_name(std::string_view name) const
            -> std::vector<validation::TargetSignedStruct>;

        [[nodiscard]] auto get_changelist() const -> std::vector<validation::Change>;
        [[nodiscard]] auto list_roles() const -> std::vector<validation::RoleWithSignatures>;
        [[nodiscard]] auto get_delegation_roles(bool include_pending = false) const
            -> std::vector<validation::DelegationRole>;

        /// Stage the creation of a delegation, or the addition of keys and paths to it.
        void add_delegation(
            std::string_view name,
            const std::vector<validation::PublicKey>& keys,
            const std::vector<std::string>& paths,
            std::optional<std::size_t> threshold = std::nullopt
        );
        void add_delegation_role_and_keys(
            std::string_view name,
            const std::vector<validation::PublicKey>& keys,
            std::optional<std::size_t> threshold = std::nullopt
        );
        void add_delegation_paths(std::string_view name, const std::vector<std::string>& paths);
        void remove_delegation_keys_and_paths(
            std::string_view name,
            const std::vector<std::string>& key_ids,
            const std::vector<std::string>& paths
        );
        /// Stage the removal of a delegation and all its descendants.
        void remove_delegation_role(std::string_view name);
        void remove_delegation_paths(std::string_view name, const std::vector<std::string>& paths);
        void remove_delegation_keys(std::string_view name, const std::vector<std::string>& key_ids);
        void clear_delegation_paths(std::string_view name);

        /**
         * Stage a re-signature of the roles without content change.
         *
         * @return The roles staged, unknown roles are skipped.
         */
        auto witness(const role_list& roles) -> role_list;

        /**
         * Stage new keys for a top-level role.
         *
         * An empty key list creates a new key in the custody. Server-managed keys are only
         * available for `snapshot` and `timestamp`. The threshold is lowered to the number of new
         * keys if needed.
         */
        void rotate_key(std::string_view role, bool server_manages_key, const role_list& key_ids = {});

        void set_role_threshold(std::string_view role, std::size_t threshold);

        /// Drop every staged change, except those taken by a publish in progress.
        void discard_changes();

        /// Key IDs of the custody for the role.
        [[nodiscard]] auto list_keys(std::string_view role) const -> std::set<std::string>;

        [[nodiscard]] auto get_signed_metadata(std::string_view role) const
            -> std::optional<validation::SignedMetadata>;

        /// Committed generation, null when uninitialized.
        [[nodiscard]] auto committed() const -> std::shared_ptr<const validation::TrustState>;

    private:

        using state_ptr = std::shared_ptr<const validation::TrustState>;

        std::string m_gun;
        validation::CryptoService* p_custody;
        RemoteStore* p_remote;
        SessionParams m_params;
        validation::signature_verifier m_verifier;

        util::synchronized_value<state_ptr, std::shared_mutex> m_committed;

        struct StagedChanges
        {
            StagedChanges() {}

            validation::Changelist changes;
            /// Number of leading changes folded by the publish in progress.
            std::size_t in_flight = 0;
        };

        util::synchronized_value<StagedChanges> m_staged;
        std::mutex m_publish_mutex;
        std::atomic<session_state> m_state = session_state::uninitialized;
        util::synchronized_value<std::string> m_failure_reason;

        [[nodiscard]] auto require_committed() const -> state_ptr;
        [[nodiscard]] auto pending_view() const -> validation::TrustState;
        void stage(std::vector<validation::Change> changes);
        void stage_delegation(
            validation::change_action action,
            std::string_view name,
            const validation::DelegationChangeContent& content
        );

        void sign_generation(
            validation::TrustState& candidate,
            const validation::FoldSummary& summary,
            const std::stop_token& stop
        ) const;
        [[nodiscard]] auto collect_signatures(
            const validation::TrustState& state,
            const validation::BaseRole& role,
            std::string_view payload
        ) const -> std::vector<validation::Signature>;
        void upload_and_commit(validation::TrustState candidate);
    };
}
#endif
