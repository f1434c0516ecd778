// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <sstream>

#include <nlohmann/json.hpp>

#include "ctrust/core/logging.hpp"
#include "ctrust/util/cryptography.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/targets.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust::validation
{
    void Target::check_well_formed() const
    {
        if (name.empty())
        {
            throw invalid_change_error("target name is empty");
        }
        if (hashes.empty())
        {
            throw invalid_change_error("target has no hash", { "", name });
        }
    }

    void to_json(nlohmann::json& j, const Target& t)
    {
        j = { { "name", t.name }, { "length", t.length }, { "hashes", t.hashes } };
    }

    void from_json(const nlohmann::json& j, Target& t)
    {
        j.at("name").get_to(t.name);
        t.length = get_count(j, "length");
        j.at("hashes").get_to(t.hashes);
    }

    auto make_target(std::string name, std::string_view content) -> Target
    {
        auto sha256 = util::Sha256Hasher();
        auto sha512 = util::Sha512Hasher();
        return {
            std::move(name),
            content.size(),
            { { "sha256", sha256.str_hex_str(content) }, { "sha512", sha512.str_hex_str(content) } },
        };
    }

    auto make_target(std::string name, std::istream& content) -> Target
    {
        std::ostringstream buffer;
        buffer << content.rdbuf();
        return make_target(std::move(name), std::string_view(buffer.str()));
    }

    auto verify_target_content(const Target& target, std::string_view content) -> bool
    {
        if (content.size() != target.length)
        {
            LOG_WARNING << "Length mismatch for target '" << target.name << "': expected "
                        << target.length << ", got " << content.size();
            return false;
        }

        std::size_t checked = 0;
        for (const auto& [algo, digest] : target.hashes)
        {
            std::string actual;
            if (algo == "sha256")
            {
                actual = util::Sha256Hasher().str_hex_str(content);
            }
            else if (algo == "sha512")
            {
                actual = util::Sha512Hasher().str_hex_str(content);
            }
            else
            {
                LOG_DEBUG << "Skipping unknown hash algorithm '" << algo << "'";
                continue;
            }
            if (actual != digest)
            {
                LOG_WARNING << "Digest mismatch for target '" << target.name << "' (" << algo << ")";
                return false;
            }
            ++checked;
        }
        return checked > 0;
    }

    void to_json(nlohmann::json& j, const TargetWithRole& t)
    {
        j = { { "target", t.target }, { "role", t.role } };
    }

    void from_json(const nlohmann::json& j, TargetWithRole& t)
    {
        j.at("target").get_to(t.target);
        j.at("role").get_to(t.role);
    }

    void to_json(nlohmann::json& j, const TargetSignedStruct& t)
    {
        j = { { "role", t.role }, { "target", t.target }, { "signatures", t.signatures } };
    }

    void from_json(const nlohmann::json& j, TargetSignedStruct& t)
    {
        j.at("role").get_to(t.role);
        j.at("target").get_to(t.target);
        j.at("signatures").get_to(t.signatures);
    }

    auto TargetCatalog::targets_of(std::string_view role) const -> const target_map&
    {
        static const target_map empty_map = {};
        if (auto it = m_targets.find(role); it != m_targets.end())
        {
            return it->second;
        }
        return empty_map;
    }

    auto TargetCatalog::find(std::string_view role, std::string_view name) const -> const Target*
    {
        const auto& targets = targets_of(role);
        if (auto it = targets.find(std::string(name)); it != targets.end())
        {
            return &it->second;
        }
        return nullptr;
    }

    auto TargetCatalog::roles() const -> std::vector<std::string>
    {
        std::vector<std::string> out;
        for (const auto& [role, targets] : m_targets)
        {
            if (!targets.empty())
            {
                out.push_back(role);
            }
        }
        return out;
    }

    auto TargetCatalog::size() const -> std::size_t
    {
        std::size_t count = 0;
        for (const auto& [_, targets] : m_targets)
        {
            count += targets.size();
        }
        return count;
    }

    auto TargetCatalog::empty() const -> bool
    {
        return size() == 0;
    }

    void TargetCatalog::set_target(std::string_view role, Target target)
    {
        auto it = m_targets.find(role);
        if (it == m_targets.end())
        {
            it = m_targets.emplace(std::string(role), target_map{}).first;
        }
        auto name = target.name;
        it->second.insert_or_assign(std::move(name), std::move(target));
    }

    auto TargetCatalog::remove_target(std::string_view role, std::string_view name) -> bool
    {
        if (auto it = m_targets.find(role); it != m_targets.end())
        {
            return it->second.erase(std::string(name)) > 0;
        }
        return false;
    }

    void TargetCatalog::remove_role(std::string_view role)
    {
        if (auto it = m_targets.find(role); it != m_targets.end())
        {
            m_targets.erase(it);
        }
    }
}
