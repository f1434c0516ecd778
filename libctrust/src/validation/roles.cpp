// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/roles.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust::validation
{
    auto top_level_role_names() -> const std::vector<std::string>&
    {
        static const auto names = std::vector<std::string>{
            std::string(root_role_name),
            std::string(targets_role_name),
            std::string(snapshot_role_name),
            std::string(timestamp_role_name),
        };
        return names;
    }

    auto is_top_level_role(std::string_view name) -> bool
    {
        const auto& names = top_level_role_names();
        return std::find(names.cbegin(), names.cend(), name) != names.cend();
    }

    auto is_delegation_name(std::string_view name) -> bool
    {
        const auto prefix = fmt::format("{}/", targets_role_name);
        if (!name.starts_with(prefix))
        {
            return false;
        }
        auto rest = name.substr(prefix.size());
        while (true)
        {
            const auto sep = rest.find('/');
            if (sep == 0 || rest.empty())
            {
                return false;
            }
            if (sep == std::string_view::npos)
            {
                return true;
            }
            rest = rest.substr(sep + 1);
        }
    }

    auto parent_role_name(std::string_view name) -> std::string
    {
        const auto sep = name.rfind('/');
        if (sep == std::string_view::npos)
        {
            return {};
        }
        return std::string(name.substr(0, sep));
    }

    auto delegation_depth(std::string_view name) -> std::size_t
    {
        return static_cast<std::size_t>(std::count(name.cbegin(), name.cend(), '/'));
    }

    auto path_matches(std::string_view pattern, std::string_view path) -> bool
    {
        return path.starts_with(pattern);
    }

    auto any_path_matches(const std::vector<std::string>& patterns, std::string_view path) -> bool
    {
        return std::any_of(
            patterns.cbegin(),
            patterns.cend(),
            [&](const std::string& pattern) { return path_matches(pattern, path); }
        );
    }

    void to_json(nlohmann::json& j, const RootRole& r)
    {
        j = { { "keyids", r.keyids }, { "threshold", r.threshold } };
    }

    void from_json(const nlohmann::json& j, RootRole& r)
    {
        j.at("keyids").get_to(r.keyids);
        r.threshold = get_count(j, "threshold");
    }

    auto BaseRole::key_ids() const -> std::vector<std::string>
    {
        std::vector<std::string> ids;
        ids.reserve(keys.size());
        for (const auto& [id, _] : keys)
        {
            ids.push_back(id);
        }
        return ids;
    }

    auto BaseRole::has_key(std::string_view id) const -> bool
    {
        return keys.find(std::string(id)) != keys.cend();
    }

    auto BaseRole::has_valid_threshold() const -> bool
    {
        return threshold >= 1 && threshold <= keys.size();
    }

    void BaseRole::check_threshold_bounds() const
    {
        if (!has_valid_threshold())
        {
            throw role_error(
                name,
                fmt::format("threshold {} must be between 1 and the {} role keys", threshold, keys.size())
            );
        }
    }

    void BaseRole::add_key(const PublicKey& key)
    {
        keys.insert_or_assign(key_id(key), key);
    }

    auto Role::root_view() const -> RootRole
    {
        return { key_ids(), threshold };
    }

    auto Role::can_sign_for(std::string_view path) const -> bool
    {
        return any_path_matches(paths, path);
    }

    auto DelegationRole::parent_name() const -> std::string
    {
        return parent_role_name(name);
    }

    auto DelegationRole::can_sign_for(std::string_view path) const -> bool
    {
        return any_path_matches(paths, path);
    }

    auto keys_to_json(const std::map<std::string, PublicKey>& keys) -> nlohmann::json
    {
        auto j = nlohmann::json::object();
        for (const auto& [id, key] : keys)
        {
            j[id] = public_key_to_json(key);
        }
        return j;
    }

    auto keys_from_json(const nlohmann::json& j) -> std::map<std::string, PublicKey>
    {
        std::map<std::string, PublicKey> keys;
        for (const auto& [id, key] : j.items())
        {
            auto pk = public_key_from_json(key);
            if (key_id(pk) != id)
            {
                throw role_metadata_error(fmt::format("key ID '{}' does not match its key", id));
            }
            keys.emplace(id, std::move(pk));
        }
        return keys;
    }

    void to_json(nlohmann::json& j, const BaseRole& r)
    {
        j = { { "name", r.name }, { "keys", keys_to_json(r.keys) }, { "threshold", r.threshold } };
    }

    void from_json(const nlohmann::json& j, BaseRole& r)
    {
        j.at("name").get_to(r.name);
        r.keys = keys_from_json(j.at("keys"));
        r.threshold = get_count(j, "threshold", r.name);
    }

    void to_json(nlohmann::json& j, const Role& r)
    {
        to_json(j, static_cast<const BaseRole&>(r));
        j["paths"] = r.paths;
    }

    void from_json(const nlohmann::json& j, Role& r)
    {
        from_json(j, static_cast<BaseRole&>(r));
        if (j.contains("paths"))
        {
            j.at("paths").get_to(r.paths);
        }
    }

    void to_json(nlohmann::json& j, const DelegationRole& r)
    {
        to_json(j, static_cast<const BaseRole&>(r));
        j["paths"] = r.paths;
    }

    void from_json(const nlohmann::json& j, DelegationRole& r)
    {
        from_json(j, static_cast<BaseRole&>(r));
        j.at("paths").get_to(r.paths);
    }

    void to_json(nlohmann::json& j, const RoleWithSignatures& r)
    {
        j = { { "role", r.role }, { "signatures", r.signatures } };
    }

    void from_json(const nlohmann::json& j, RoleWithSignatures& r)
    {
        j.at("role").get_to(r.role);
        j.at("signatures").get_to(r.signatures);
    }
}
