// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_TRUST_STATE_HPP
#define CTRUST_VALIDATION_TRUST_STATE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ctrust/validation/changelist.hpp"
#include "ctrust/validation/delegations.hpp"
#include "ctrust/validation/metadata.hpp"
#include "ctrust/validation/role_registry.hpp"
#include "ctrust/validation/targets.hpp"

namespace ctrust::validation
{
    /**
     * One generation of the trust data of a collection.
     *
     * Committed generations are never mutated, edits are folded into a copy.
     */
    struct TrustState
    {
        std::string gun;
        std::size_t generation = 0;
        RoleRegistry registry;
        DelegationResolver delegations;
        TargetCatalog catalog;
        std::map<std::string, SignedMetadata> metadata;

        /**
         * Signing authority of `targets` or of a delegation, as a delegation role.
         *
         * @throw unknown_delegation_error if there is no such role.
         */
        [[nodiscard]] auto signing_role(std::string_view name) const -> DelegationRole;
        [[nodiscard]] auto is_signing_role(std::string_view name) const -> bool;

        /// `name` and its delegations, in pre-order and registration order.
        [[nodiscard]] auto walk_from(std::string_view name) const -> std::vector<std::string>;

        /**
         * Targets of the roles and their delegations, the first entry per name wins.
         *
         * Defaults to `targets` when no role is given.
         */
        [[nodiscard]] auto list_targets(const std::vector<std::string>& roles = {}) const
            -> std::vector<TargetWithRole>;

        /// @throw not_found_error if no visited role signs for the target.
        [[nodiscard]] auto
        get_target_by_name(std::string_view name, const std::vector<std::string>& roles = {}) const
            -> TargetWithRole;

        /**
         * Every signed statement about the target, one per signing role.
         *
         * @throw not_found_error if no role signs for the target.
         */
        [[nodiscard]] auto get_all_target_metadata_by_name(std::string_view name) const
            -> std::vector<TargetSignedStruct>;

        /// Top-level roles, then delegations, with their verified signatures.
        [[nodiscard]] auto list_roles() const -> std::vector<RoleWithSignatures>;

        /// Signatures of the current metadata of a role, with `is_valid` recomputed.
        [[nodiscard]] auto verified_signatures(std::string_view role) const -> std::vector<Signature>;
    };

    /**
     * What a fold changed, used to decide what must be signed.
     */
    struct FoldSummary
    {
        std::set<std::string> touched_roles;
        std::set<std::string> removed_roles;

        /// Root role before a rotation of its keys, if any.
        std::optional<Role> previous_root;
    };

    /**
     * Apply one change to the state.
     *
     * Only the change's own constraints are checked, see `check_consistency`.
     *
     * @throw trust_error if the change cannot be applied.
     */
    void apply_change(TrustState& state, const Change& change, FoldSummary& summary);

    /**
     * Check constraints spanning several changes.
     *
     * Delegations are consistent and every target is within the paths of its signing role.
     *
     * @throw trust_error describing the first inconsistency found.
     */
    void check_consistency(const TrustState& state);

    /**
     * Fold the changes into a candidate copy of the state, all or nothing.
     *
     * @throw trust_error if a change cannot be applied or the result is inconsistent.
     */
    [[nodiscard]] auto fold_changes(const TrustState& state, const std::vector<Change>& changes)
        -> std::pair<TrustState, FoldSummary>;

    /**
     * Replay staged changes onto a copy of the state, skipping those that no longer apply.
     *
     * This is the pending view staging operations validate against.
     */
    [[nodiscard]] auto apply_staged_changes(const TrustState& state, const std::vector<Change>& changes)
        -> TrustState;

    /**
     * Canonical signed section of a role for the state.
     *
     * The `snapshot` section covers the current metadata of every other role except `timestamp`,
     * the `timestamp` section covers `snapshot`.
     */
    [[nodiscard]] auto build_signed_payload(
        const TrustState& state,
        std::string_view role,
        std::size_t version,
        std::string_view expires
    ) -> std::string;
}
#endif
