// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_DELEGATIONS_HPP
#define CTRUST_VALIDATION_DELEGATIONS_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ctrust/validation/roles.hpp"

namespace ctrust::validation
{
    /**
     * Tree of delegated roles beneath `targets`.
     *
     * Delegations are kept in registration order, which is the priority order among
     * delegations of equal depth.
     */
    class DelegationResolver
    {
    public:

        DelegationResolver() = default;

        /// Set the paths of the top-level `targets` role, the root of the tree.
        void set_root_paths(std::vector<std::string> paths);
        [[nodiscard]] auto root_paths() const -> const std::vector<std::string>&;

        [[nodiscard]] auto list_delegations() const -> const std::vector<DelegationRole>&;
        [[nodiscard]] auto find(std::string_view name) const -> const DelegationRole*;
        [[nodiscard]] auto contains(std::string_view name) const -> bool;

        /// @throw unknown_delegation_error if absent.
        [[nodiscard]] auto get(std::string_view name) const -> const DelegationRole&;

        /// Direct children of a role, in registration order.
        [[nodiscard]] auto children_of(std::string_view name) const -> std::vector<DelegationRole>;

        /**
         * Delegations whose paths match the path, deepest first and registration order among
         * delegations of equal depth.
         */
        [[nodiscard]] auto resolve_for_path(std::string_view path) const
            -> std::vector<DelegationRole>;

        /**
         * Paths of the parent of a delegation.
         *
         * @throw unknown_delegation_error if the parent does not exist.
         */
        [[nodiscard]] auto parent_paths(std::string_view name) const -> const std::vector<std::string>&;

        /**
         * Whether a path is within the parent's paths of the delegation.
         */
        [[nodiscard]] auto is_within_parent(std::string_view name, std::string_view path) const
            -> bool;

        /**
         * Create a delegation, or merge into an existing one.
         *
         * @throw role_error if the name is not a delegation name.
         * @throw unknown_delegation_error if the parent does not exist.
         * @throw path_conflict_error if a path is not within the parent's paths.
         */
        void add_delegation(
            std::string_view name,
            const std::map<std::string, PublicKey>& keys,
            const std::vector<std::string>& paths,
            std::optional<std::size_t> threshold = std::nullopt
        );

        void add_delegation_keys(std::string_view name, const std::map<std::string, PublicKey>& keys);
        void add_delegation_paths(std::string_view name, const std::vector<std::string>& paths);
        void remove_delegation_keys(std::string_view name, const std::vector<std::string>& key_ids);
        void remove_delegation_paths(std::string_view name, const std::vector<std::string>& paths);
        void clear_delegation_paths(std::string_view name);
        void set_delegation_threshold(std::string_view name, std::size_t threshold);

        /**
         * Remove a delegation and all its descendants.
         *
         * @return The names of the removed delegations.
         */
        auto remove_delegation(std::string_view name) -> std::vector<std::string>;

        /**
         * Check the whole tree: names, parents, paths within the parent's paths and thresholds.
         *
         * @throw trust_error describing the first inconsistency found.
         */
        void check_consistency() const;

    private:

        std::vector<DelegationRole> m_delegations;
        std::vector<std::string> m_root_paths = { "" };

        [[nodiscard]] auto find_mut(std::string_view name) -> DelegationRole*;
        [[nodiscard]] auto get_mut(std::string_view name) -> DelegationRole&;
    };
}
#endif
