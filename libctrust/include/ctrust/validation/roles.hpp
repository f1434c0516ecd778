// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_ROLES_HPP
#define CTRUST_VALIDATION_ROLES_HPP

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ctrust/validation/keys.hpp"

namespace ctrust::validation
{
    inline constexpr std::string_view root_role_name = "root";
    inline constexpr std::string_view targets_role_name = "targets";
    inline constexpr std::string_view snapshot_role_name = "snapshot";
    inline constexpr std::string_view timestamp_role_name = "timestamp";

    /// Top-level roles in registration order.
    [[nodiscard]] auto top_level_role_names() -> const std::vector<std::string>&;

    [[nodiscard]] auto is_top_level_role(std::string_view name) -> bool;

    /**
     * Whether the name is a delegation name, `targets/<segment>(/<segment>)*` with non-empty
     * segments.
     */
    [[nodiscard]] auto is_delegation_name(std::string_view name) -> bool;

    /**
     * Parent role of a delegation, `targets/a` for `targets/a/b`.
     */
    [[nodiscard]] auto parent_role_name(std::string_view name) -> std::string;

    /// Number of segments below `targets`, zero for top-level roles.
    [[nodiscard]] auto delegation_depth(std::string_view name) -> std::size_t;

    /**
     * Whether the pattern matches the path.
     *
     * A pattern matches every path it is a prefix of, the empty pattern matches everything.
     */
    [[nodiscard]] auto path_matches(std::string_view pattern, std::string_view path) -> bool;

    [[nodiscard]] auto any_path_matches(const std::vector<std::string>& patterns, std::string_view path)
        -> bool;

    /**
     * Root-of-trust view of a role.
     */
    struct RootRole
    {
        std::vector<std::string> keyids;
        std::size_t threshold = 1;

        auto operator==(const RootRole&) const -> bool = default;
    };

    void to_json(nlohmann::json& j, const RootRole& r);
    void from_json(const nlohmann::json& j, RootRole& r);

    /**
     * A named authority with a key set and a signature threshold.
     */
    struct BaseRole
    {
        std::string name;
        std::map<std::string, PublicKey> keys;
        std::size_t threshold = 1;

        [[nodiscard]] auto key_ids() const -> std::vector<std::string>;
        [[nodiscard]] auto has_key(std::string_view id) const -> bool;

        /// Whether `1 <= threshold <= keys.size()`.
        [[nodiscard]] auto has_valid_threshold() const -> bool;

        /// @throw role_error if the threshold is not valid.
        void check_threshold_bounds() const;

        void add_key(const PublicKey& key);

        auto operator==(const BaseRole&) const -> bool = default;
    };

    /**
     * A top-level role, with the paths it may sign for.
     */
    struct Role : BaseRole
    {
        std::vector<std::string> paths;

        [[nodiscard]] auto root_view() const -> RootRole;
        [[nodiscard]] auto can_sign_for(std::string_view path) const -> bool;

        auto operator==(const Role&) const -> bool = default;
    };

    /**
     * A role scoped under a parent role, restricted to a subset of the parent's paths.
     */
    struct DelegationRole : BaseRole
    {
        std::vector<std::string> paths;

        [[nodiscard]] auto parent_name() const -> std::string;
        [[nodiscard]] auto can_sign_for(std::string_view path) const -> bool;

        auto operator==(const DelegationRole&) const -> bool = default;
    };

    struct RoleWithSignatures
    {
        Role role;
        std::vector<Signature> signatures;
    };

    void to_json(nlohmann::json& j, const BaseRole& r);
    void from_json(const nlohmann::json& j, BaseRole& r);
    void to_json(nlohmann::json& j, const Role& r);
    void from_json(const nlohmann::json& j, Role& r);
    void to_json(nlohmann::json& j, const DelegationRole& r);
    void from_json(const nlohmann::json& j, DelegationRole& r);
    void to_json(nlohmann::json& j, const RoleWithSignatures& r);
    void from_json(const nlohmann::json& j, RoleWithSignatures& r);

    [[nodiscard]] auto keys_to_json(const std::map<std::string, PublicKey>& keys) -> nlohmann::json;
    [[nodiscard]] auto keys_from_json(const nlohmann::json& j) -> std::map<std::string, PublicKey>;
}
#endif
