// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "ctrust/core/logging.hpp"
#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/role_registry.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust::validation
{
    namespace
    {
        [[nodiscard]] auto can_be_server_managed(std::string_view name) -> bool
        {
            return name == snapshot_role_name || name == timestamp_role_name;
        }

        [[nodiscard]] auto registration_rank(std::string_view name) -> std::size_t
        {
            const auto& names = top_level_role_names();
            return static_cast<std::size_t>(
                std::find(names.cbegin(), names.cend(), name) - names.cbegin()
            );
        }
    }

    auto default_signature_verifier() -> signature_verifier
    {
        return [](const PublicKey& key, std::string_view payload, std::string_view sig)
        { return verify_signature(key, payload, sig); };
    }

    RoleRegistry::RoleRegistry(signature_verifier verifier)
        : m_verifier(std::move(verifier))
    {
    }

    auto RoleRegistry::initialize(
        const CryptoService& custody,
        const std::vector<std::string>& root_key_ids,
        const std::vector<std::string>& server_managed_roles,
        signature_verifier verifier
    ) -> RoleRegistry
    {
        if (root_key_ids.empty())
        {
            LOG_ERROR << "No root key provided";
            throw role_error(root_role_name, "at least one root key is required");
        }

        auto registry = RoleRegistry(std::move(verifier));

        auto root = Role{};
        root.name = std::string(root_role_name);
        for (const auto& id : root_key_ids)
        {
            auto key = custody.get_key(id);
            if (!key)
            {
                LOG_ERROR << "Root key '" << id << "' is unknown to the key custody";
                throw invalid_root_keys_error(id);
            }
            root.add_key(*key);
        }
        root.threshold = 1;
        registry.set_role(std::move(root));

        for (const auto& name : server_managed_roles)
        {
            registry.set_server_managed(name, true);
        }
        return registry;
    }

    auto RoleRegistry::find_role(std::string_view name) const -> const Role*
    {
        auto it = std::find_if(
            m_roles.cbegin(),
            m_roles.cend(),
            [&](const Role& r) { return r.name == name; }
        );
        return it != m_roles.cend() ? &*it : nullptr;
    }

    auto RoleRegistry::get_role(std::string_view name) const -> const Role&
    {
        if (const auto* role = find_role(name))
        {
            return *role;
        }
        throw not_found_error("role", name, { std::string(name) });
    }

    auto RoleRegistry::has_role(std::string_view name) const -> bool
    {
        return find_role(name) != nullptr;
    }

    auto RoleRegistry::list_roles() const -> std::vector<Role>
    {
        return m_roles;
    }

    void RoleRegistry::set_role(Role role)
    {
        if (!is_top_level_role(role.name))
        {
            LOG_ERROR << "'" << role.name << "' is not a top-level role";
            throw role_error(role.name, "not a top-level role");
        }
        role.check_threshold_bounds();
        if (role.name == targets_role_name && role.paths.empty())
        {
            role.paths = { "" };
        }

        invalidate(role.name);
        auto it = std::find_if(
            m_roles.begin(),
            m_roles.end(),
            [&](const Role& r) { return r.name == role.name; }
        );
        if (it != m_roles.end())
        {
            *it = std::move(role);
        }
        else
        {
            auto pos = std::find_if(
                m_roles.begin(),
                m_roles.end(),
                [&](const Role& r) { return registration_rank(r.name) > registration_rank(role.name); }
            );
            m_roles.insert(pos, std::move(role));
        }
    }

    auto RoleRegistry::is_server_managed(std::string_view name) const -> bool
    {
        return m_server_managed.find(std::string(name)) != m_server_managed.cend();
    }

    auto RoleRegistry::server_managed_roles() const -> std::set<std::string>
    {
        return m_server_managed;
    }

    void RoleRegistry::set_server_managed(std::string_view name, bool managed)
    {
        if (!can_be_server_managed(name))
        {
            LOG_ERROR << "Role '" << name << "' cannot be managed by the server";
            throw role_error(name, "only snapshot and timestamp keys can be managed by the server");
        }
        if (managed)
        {
            m_server_managed.insert(std::string(name));
        }
        else
        {
            m_server_managed.erase(std::string(name));
        }
    }

    auto RoleRegistry::is_valid_signature(
        const BaseRole& role,
        std::string_view payload_digest,
        std::string_view payload,
        const Signature& signature
    ) const -> bool
    {
        auto key_it = role.keys.find(signature.keyid);
        if (key_it == role.keys.cend())
        {
            LOG_WARNING << "Skipping signature of key '" << signature.keyid
                        << "' which is not a key of role '" << role.name << "'";
            return false;
        }

        auto entry = cache_key{
            role.name,
            signature.keyid,
            std::string(payload_digest),
            signature.sig,
        };
        {
            auto cache = m_cache.synchronize();
            if (auto it = cache->find(entry); it != cache->end())
            {
                return it->second;
            }
        }

        const bool valid = m_verifier(key_it->second, payload, signature.sig);
        if (!valid)
        {
            LOG_WARNING << "Invalid signature of key '" << signature.keyid << "' for role '"
                        << role.name << "'";
        }
        m_cache->insert_or_assign(std::move(entry), valid);
        return valid;
    }

    auto RoleRegistry::count_valid_signatures(
        const BaseRole& role,
        std::string_view payload,
        const std::vector<Signature>& signatures
    ) const -> std::size_t
    {
        const auto digest = sha256_hex(payload);
        std::set<std::string> valid_key_ids;
        for (const auto& sig : signatures)
        {
            if (valid_key_ids.count(sig.keyid) == 0 && is_valid_signature(role, digest, payload, sig))
            {
                valid_key_ids.insert(sig.keyid);
            }
        }
        return valid_key_ids.size();
    }

    auto RoleRegistry::verify_threshold(
        const BaseRole& role,
        std::string_view payload,
        const std::vector<Signature>& signatures
    ) const -> bool
    {
        return count_valid_signatures(role, payload, signatures) >= role.threshold;
    }

    void RoleRegistry::check_threshold(
        const BaseRole& role,
        std::string_view payload,
        const std::vector<Signature>& signatures
    ) const
    {
        const auto valid = count_valid_signatures(role, payload, signatures);
        if (valid < role.threshold)
        {
            LOG_ERROR << "Signatures threshold not met for role '" << role.name << "' (" << valid
                      << "/" << role.threshold << ")";
            throw threshold_error(role.name, valid, role.threshold);
        }
    }

    auto RoleRegistry::annotate(
        const BaseRole& role,
        std::string_view payload,
        const std::vector<Signature>& signatures
    ) const -> std::vector<Signature>
    {
        const auto digest = sha256_hex(payload);
        auto out = signatures;
        for (auto& sig : out)
        {
            sig.is_valid = is_valid_signature(role, digest, payload, sig);
        }
        return out;
    }

    void RoleRegistry::invalidate(std::string_view name)
    {
        auto cache = m_cache.synchronize();
        std::erase_if(*cache, [&](const auto& item) { return std::get<0>(item.first) == name; });
    }

    auto RoleRegistry::cached_results_count(std::string_view name) const -> std::size_t
    {
        auto cache = m_cache.synchronize();
        return static_cast<std::size_t>(std::count_if(
            cache->cbegin(),
            cache->cend(),
            [&](const auto& item) { return std::get<0>(item.first) == name; }
        ));
    }
}
