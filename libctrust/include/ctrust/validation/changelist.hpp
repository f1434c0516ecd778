// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_CHANGELIST_HPP
#define CTRUST_VALIDATION_CHANGELIST_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ctrust/validation/keys.hpp"
#include "ctrust/validation/targets.hpp"

namespace ctrust::validation
{
    enum class change_action
    {
        create,
        update,
        remove,
    };

    [[nodiscard]] auto name_of(change_action action) noexcept -> std::string_view;
    [[nodiscard]] auto change_action_from_name(std::string_view name) -> std::optional<change_action>;

    inline constexpr std::string_view change_type_target = "target";
    inline constexpr std::string_view change_type_delegation = "delegation";
    inline constexpr std::string_view change_type_witness = "witness";
    inline constexpr std::string_view change_type_role = "role";

    /**
     * Content of a `target` change.
     */
    struct TargetChangeContent
    {
        std::size_t length = 0;
        std::map<std::string, std::string> hashes;
    };

    /**
     * Content of a `delegation` change.
     */
    struct DelegationChangeContent
    {
        std::optional<std::size_t> threshold;
        std::map<std::string, PublicKey> add_keys;
        std::vector<std::string> remove_keys;
        std::vector<std::string> add_paths;
        std::vector<std::string> remove_paths;
        bool clear_paths = false;
    };

    /**
     * Content of a `role` change, replacing keys or threshold of a top-level role.
     */
    struct RoleChangeContent
    {
        std::optional<std::map<std::string, PublicKey>> keys;
        std::optional<std::size_t> threshold;
        bool server_managed = false;
    };

    /**
     * One staged edit.
     *
     * The content is the canonical JSON of the typed content of the change.
     */
    struct Change
    {
        change_action action = change_action::create;
        std::string scope;
        std::string type;
        std::string path;
        std::string content;

        [[nodiscard]] static auto
        make_target(change_action action, std::string_view scope, const Target& target) -> Change;
        [[nodiscard]] static auto make_delegation(
            change_action action,
            std::string_view scope,
            const DelegationChangeContent& content
        ) -> Change;
        [[nodiscard]] static auto make_witness(std::string_view scope) -> Change;
        [[nodiscard]] static auto make_role(std::string_view role, const RoleChangeContent& content)
            -> Change;

        /// @throw invalid_change_error if the content is not a target content.
        [[nodiscard]] auto target_content() const -> TargetChangeContent;
        /// @throw invalid_change_error if the content is not a delegation content.
        [[nodiscard]] auto delegation_content() const -> DelegationChangeContent;
        /// @throw invalid_change_error if the content is not a role content.
        [[nodiscard]] auto role_content() const -> RoleChangeContent;

        auto operator==(const Change&) const -> bool = default;
    };

    void to_json(nlohmann::json& j, const Change& c);
    void from_json(const nlohmann::json& j, Change& c);

    /**
     * Ordered log of staged edits, in apply order.
     */
    class Changelist
    {
    public:

        Changelist() = default;

        /// @throw invalid_change_error if the scope or the type is empty.
        void add(Change change);

        [[nodiscard]] auto list() const -> const std::vector<Change>&;
        [[nodiscard]] auto size() const -> std::size_t;
        [[nodiscard]] auto empty() const -> bool;

        void clear();

        /// Drop the first `count` changes, the ones already folded into a generation.
        void remove_first(std::size_t count);

        /// Keep only the first `count` changes.
        void truncate(std::size_t count);

        auto operator==(const Changelist&) const -> bool = default;

    private:

        std::vector<Change> m_changes;
    };

    void to_json(nlohmann::json& j, const Changelist& c);
    void from_json(const nlohmann::json& j, Changelist& c);
}
#endif
