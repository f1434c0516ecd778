// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_TARGETS_HPP
#define CTRUST_VALIDATION_TARGETS_HPP

#include <cstddef>
#include <istream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ctrust/validation/keys.hpp"
#include "ctrust/validation/roles.hpp"

namespace ctrust::validation
{
    /**
     * A named artifact, with its length and content digests by algorithm.
     */
    struct Target
    {
        std::string name;
        std::size_t length = 0;
        std::map<std::string, std::string> hashes;

        /// @throw invalid_change_error if the name or the hashes are empty.
        void check_well_formed() const;

        auto operator==(const Target&) const -> bool = default;
    };

    void to_json(nlohmann::json& j, const Target& t);
    void from_json(const nlohmann::json& j, Target& t);

    /**
     * Build a target from its content, with `sha256` and `sha512` digests.
     */
    [[nodiscard]] auto make_target(std::string name, std::string_view content) -> Target;
    [[nodiscard]] auto make_target(std::string name, std::istream& content) -> Target;

    /**
     * Check the length and every known digest (`sha256`, `sha512`) of the content.
     *
     * Unknown algorithms are ignored, but at least one known digest must be present.
     */
    [[nodiscard]] auto verify_target_content(const Target& target, std::string_view content) -> bool;

    struct TargetWithRole
    {
        Target target;
        std::string role;

        auto operator==(const TargetWithRole&) const -> bool = default;
    };

    void to_json(nlohmann::json& j, const TargetWithRole& t);
    void from_json(const nlohmann::json& j, TargetWithRole& t);

    /**
     * One signed statement about a target.
     */
    struct TargetSignedStruct
    {
        DelegationRole role;
        Target target;
        std::vector<Signature> signatures;
    };

    void to_json(nlohmann::json& j, const TargetSignedStruct& t);
    void from_json(const nlohmann::json& j, TargetSignedStruct& t);

    /**
     * Targets of every signing role, by role and then by name.
     */
    class TargetCatalog
    {
    public:

        using target_map = std::map<std::string, Target>;

        [[nodiscard]] auto targets_of(std::string_view role) const -> const target_map&;
        [[nodiscard]] auto find(std::string_view role, std::string_view name) const -> const Target*;
        [[nodiscard]] auto roles() const -> std::vector<std::string>;
        [[nodiscard]] auto size() const -> std::size_t;
        [[nodiscard]] auto empty() const -> bool;

        void set_target(std::string_view role, Target target);

        /// @return Whether a target was removed.
        auto remove_target(std::string_view role, std::string_view name) -> bool;

        void remove_role(std::string_view role);

        auto operator==(const TargetCatalog&) const -> bool = default;

    private:

        std::map<std::string, target_map, std::less<>> m_targets;
    };
}
#endif
