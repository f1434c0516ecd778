// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "ctrust/validation/changelist.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust::validation
{
    namespace
    {
        [[nodiscard]] auto parse_content(const Change& change, std::string_view expected_type)
            -> nlohmann::json
        {
            if (change.type != expected_type)
            {
                throw invalid_change_error(
                    fmt::format("expected a '{}' change, got '{}'", expected_type, change.type),
                    { change.scope, change.path }
                );
            }
            try
            {
                return nlohmann::json::parse(change.content);
            }
            catch (const nlohmann::json::exception& e)
            {
                throw invalid_change_error(
                    fmt::format("malformed content: {}", e.what()),
                    { change.scope, change.path }
                );
            }
        }

        [[nodiscard]] auto
        content_count(const nlohmann::json& j, std::string_view field, const Change& change)
            -> std::size_t
        {
            const auto& value = j.at(std::string(field));
            if (const auto count = to_count(value))
            {
                return *count;
            }
            throw invalid_change_error(
                fmt::format("'{}' must be a non-negative integer, got {}", field, value.dump()),
                { change.scope, change.path }
            );
        }
    }

    auto name_of(change_action action) noexcept -> std::string_view
    {
        switch (action)
        {
            case change_action::create:
                return "create";
            case change_action::update:
                return "update";
            case change_action::remove:
                return "delete";
        }
        return "";
    }

    auto change_action_from_name(std::string_view name) -> std::optional<change_action>
    {
        for (auto action : { change_action::create, change_action::update, change_action::remove })
        {
            if (name_of(action) == name)
            {
                return action;
            }
        }
        return std::nullopt;
    }

    auto Change::make_target(change_action action, std::string_view scope, const Target& target)
        -> Change
    {
        auto content = nlohmann::json::object();
        if (action != change_action::remove)
        {
            content = { { "length", target.length }, { "hashes", target.hashes } };
        }
        return {
            action,
            std::string(scope),
            std::string(change_type_target),
            target.name,
            content.dump(),
        };
    }

    auto Change::make_delegation(
        change_action action,
        std::string_view scope,
        const DelegationChangeContent& content
    ) -> Change
    {
        auto j = nlohmann::json{
            { "add_keys", keys_to_json(content.add_keys) },
            { "remove_keys", content.remove_keys },
            { "add_paths", content.add_paths },
            { "remove_paths", content.remove_paths },
            { "clear_paths", content.clear_paths },
        };
        if (content.threshold)
        {
            j["threshold"] = *content.threshold;
        }
        return {
            action,
            std::string(scope),
            std::string(change_type_delegation),
            "",
            j.dump(),
        };
    }

    auto Change::make_witness(std::string_view scope) -> Change
    {
        return {
            change_action::update,
            std::string(scope),
            std::string(change_type_witness),
            "",
            nlohmann::json::object().dump(),
        };
    }

    auto Change::make_role(std::string_view role, const RoleChangeContent& content) -> Change
    {
        auto j = nlohmann::json{ { "server_managed", content.server_managed } };
        if (content.keys)
        {
            j["keys"] = keys_to_json(*content.keys);
        }
        if (content.threshold)
        {
            j["threshold"] = *content.threshold;
        }
        return {
            change_action::update,
            std::string(root_role_name),
            std::string(change_type_role),
            std::string(role),
            j.dump(),
        };
    }

    auto Change::target_content() const -> TargetChangeContent
    {
        const auto j = parse_content(*this, change_type_target);
        auto out = TargetChangeContent{};
        if (action == change_action::remove)
        {
            return out;
        }
        try
        {
            out.length = content_count(j, "length", *this);
            j.at("hashes").get_to(out.hashes);
        }
        catch (const nlohmann::json::exception& e)
        {
            throw invalid_change_error(fmt::format("malformed target content: {}", e.what()), { scope, path });
        }
        return out;
    }

    auto Change::delegation_content() const -> DelegationChangeContent
    {
        const auto j = parse_content(*this, change_type_delegation);
        auto out = DelegationChangeContent{};
        try
        {
            if (j.contains("threshold"))
            {
                out.threshold = content_count(j, "threshold", *this);
            }
            out.add_keys = keys_from_json(j.value("add_keys", nlohmann::json::object()));
            out.remove_keys = j.value("remove_keys", std::vector<std::string>{});
            out.add_paths = j.value("add_paths", std::vector<std::string>{});
            out.remove_paths = j.value("remove_paths", std::vector<std::string>{});
            out.clear_paths = j.value("clear_paths", false);
        }
        catch (const nlohmann::json::exception& e)
        {
            throw invalid_change_error(
                fmt::format("malformed delegation content: {}", e.what()),
                { scope, path }
            );
        }
        return out;
    }

    auto Change::role_content() const -> RoleChangeContent
    {
        const auto j = parse_content(*this, change_type_role);
        auto out = RoleChangeContent{};
        try
        {
            if (j.contains("keys"))
            {
                out.keys = keys_from_json(j.at("keys"));
            }
            if (j.contains("threshold"))
            {
                out.threshold = content_count(j, "threshold", *this);
            }
            out.server_managed = j.value("server_managed", false);
        }
        catch (const nlohmann::json::exception& e)
        {
            throw invalid_change_error(fmt::format("malformed role content: {}", e.what()), { path });
        }
        return out;
    }

    void to_json(nlohmann::json& j, const Change& c)
    {
        j = {
            { "action", std::string(name_of(c.action)) },
            { "scope", c.scope },
            { "type", c.type },
            { "path", c.path },
            { "content", c.content },
        };
    }

    void from_json(const nlohmann::json& j, Change& c)
    {
        const auto action_name = j.at("action").get<std::string>();
        const auto action = change_action_from_name(action_name);
        if (!action)
        {
            throw invalid_change_error(fmt::format("unknown action '{}'", action_name));
        }
        c.action = *action;
        j.at("scope").get_to(c.scope);
        j.at("type").get_to(c.type);
        c.path = j.value("path", std::string());
        c.content = j.value("content", std::string());
    }

    void Changelist::add(Change change)
    {
        if (change.scope.empty() || change.type.empty())
        {
            throw invalid_change_error("change scope and type must not be empty", { change.scope, change.path });
        }
        m_changes.push_back(std::move(change));
    }

    auto Changelist::list() const -> const std::vector<Change>&
    {
        return m_changes;
    }

    auto Changelist::size() const -> std::size_t
    {
        return m_changes.size();
    }

    auto Changelist::empty() const -> bool
    {
        return m_changes.empty();
    }

    void Changelist::clear()
    {
        m_changes.clear();
    }

    void Changelist::remove_first(std::size_t count)
    {
        const auto n = static_cast<std::ptrdiff_t>(std::min(count, m_changes.size()));
        m_changes.erase(m_changes.begin(), m_changes.begin() + n);
    }

    void Changelist::truncate(std::size_t count)
    {
        if (count < m_changes.size())
        {
            m_changes.erase(m_changes.begin() + static_cast<std::ptrdiff_t>(count), m_changes.end());
        }
    }

    void to_json(nlohmann::json& j, const Changelist& c)
    {
        j = c.list();
    }

    void from_json(const nlohmann::json& j, Changelist& c)
    {
        c.clear();
        for (const auto& item : j)
        {
            c.add(item.get<Change>());
        }
    }
}
