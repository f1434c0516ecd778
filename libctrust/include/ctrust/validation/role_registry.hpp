// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_ROLE_REGISTRY_HPP
#define CTRUST_VALIDATION_ROLE_REGISTRY_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "ctrust/util/synchronized_value.hpp"
#include "ctrust/validation/roles.hpp"

namespace ctrust::validation
{
    class CryptoService;

    /**
     * Cryptographic verification primitive of a hex encoded signature over a payload.
     */
    using signature_verifier = std::function<
        bool(const PublicKey& key, std::string_view payload, std::string_view signature_hex)>;

    [[nodiscard]] auto default_signature_verifier() -> signature_verifier;

    /**
     * Top-level roles of a collection and threshold signature checks.
     *
     * Verification results are cached per role, changing a role invalidates its entries.
     */
    class RoleRegistry
    {
    public:

        explicit RoleRegistry(signature_verifier verifier = default_signature_verifier());

        /**
         * Establish the root role from keys held by the custody and record the server-managed
         * roles.
         *
         * @throw invalid_root_keys_error if a root key ID is unknown to the custody.
         * @throw role_error if a server-managed role is neither `snapshot` nor `timestamp`.
         */
        [[nodiscard]] static auto initialize(
            const CryptoService& custody,
            const std::vector<std::string>& root_key_ids,
            const std::vector<std::string>& server_managed_roles,
            signature_verifier verifier = default_signature_verifier()
        ) -> RoleRegistry;

        /// @throw not_found_error if the role is not registered.
        [[nodiscard]] auto get_role(std::string_view name) const -> const Role&;
        [[nodiscard]] auto find_role(std::string_view name) const -> const Role*;
        [[nodiscard]] auto has_role(std::string_view name) const -> bool;

        /// Registered roles, in the order root, targets, snapshot, timestamp.
        [[nodiscard]] auto list_roles() const -> std::vector<Role>;

        /**
         * Register or replace a top-level role.
         *
         * @throw role_error if the name is not a top-level role or the threshold is invalid.
         */
        void set_role(Role role);

        [[nodiscard]] auto is_server_managed(std::string_view name) const -> bool;
        [[nodiscard]] auto server_managed_roles() const -> std::set<std::string>;

        /// @throw role_error if the role is neither `snapshot` nor `timestamp`.
        void set_server_managed(std::string_view name, bool managed);

        /**
         * Number of distinct key IDs of the role with a cryptographically valid signature.
         */
        [[nodiscard]] auto count_valid_signatures(
            const BaseRole& role,
            std::string_view payload,
            const std::vector<Signature>& signatures
        ) const -> std::size_t;

        [[nodiscard]] auto verify_threshold(
            const BaseRole& role,
            std::string_view payload,
            const std::vector<Signature>& signatures
        ) const -> bool;

        /// @throw threshold_error if the threshold is not met.
        void check_threshold(
            const BaseRole& role,
            std::string_view payload,
            const std::vector<Signature>& signatures
        ) const;

        /**
         * Copy of the signatures with `is_valid` recomputed against the role's keys.
         */
        [[nodiscard]] auto annotate(
            const BaseRole& role,
            std::string_view payload,
            const std::vector<Signature>& signatures
        ) const -> std::vector<Signature>;

        /// Drop the cached verification results of a role.
        void invalidate(std::string_view name);

        [[nodiscard]] auto cached_results_count(std::string_view name) const -> std::size_t;

    private:

        // (role, key ID, payload digest, signature)
        using cache_key = std::tuple<std::string, std::string, std::string, std::string>;

        std::vector<Role> m_roles;
        std::set<std::string> m_server_managed;
        signature_verifier m_verifier;
        mutable util::synchronized_value<std::map<cache_key, bool>> m_cache;

        [[nodiscard]] auto is_valid_signature(
            const BaseRole& role,
            std::string_view payload_digest,
            std::string_view payload,
            const Signature& signature
        ) const -> bool;
    };
}
#endif
