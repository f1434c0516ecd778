// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "ctrust/core/logging.hpp"
#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust::validation
{
    auto MemoryCryptoService::create(std::string_view role, std::string_view gun, key_algorithm algo)
        -> PublicKey
    {
        auto key = generate_private_key(algo);
        auto public_key = public_key_of(key);
        add_key(role, gun, key);
        LOG_DEBUG << "Created " << name_of(algo) << " key '" << key_id(public_key) << "' for role '"
                  << role << "' of '" << gun << "'";
        return public_key;
    }

    void MemoryCryptoService::add_key(std::string_view role, std::string_view gun, const PrivateKey& key)
    {
        auto id = key_id(public_key_of(key));
        auto keys = m_keys.synchronize();
        keys->insert_or_assign(std::move(id), KeyEntry{ key, std::string(role), std::string(gun) });
    }

    auto MemoryCryptoService::get_key(std::string_view key_id) const -> std::optional<PublicKey>
    {
        auto keys = m_keys.synchronize();
        if (auto it = keys->find(key_id); it != keys->end())
        {
            return public_key_of(it->second.key);
        }
        return std::nullopt;
    }

    auto MemoryCryptoService::get_private_key(std::string_view key_id) const
        -> std::pair<PrivateKey, std::string>
    {
        auto keys = m_keys.synchronize();
        if (auto it = keys->find(key_id); it != keys->end())
        {
            return { it->second.key, it->second.role };
        }
        throw not_found_error("key", key_id, { "", "", std::string(key_id) });
    }

    void MemoryCryptoService::remove_key(std::string_view key_id)
    {
        auto keys = m_keys.synchronize();
        if (auto it = keys->find(key_id); it != keys->end())
        {
            keys->erase(it);
        }
    }

    auto MemoryCryptoService::list_keys(std::string_view role) const -> std::set<std::string>
    {
        std::set<std::string> out;
        auto keys = m_keys.synchronize();
        for (const auto& [id, entry] : *keys)
        {
            if (entry.role == role)
            {
                out.insert(id);
            }
        }
        return out;
    }

    auto MemoryCryptoService::list_all_keys() const -> std::map<std::string, std::string>
    {
        std::map<std::string, std::string> out;
        auto keys = m_keys.synchronize();
        for (const auto& [id, entry] : *keys)
        {
            out.emplace(id, entry.role);
        }
        return out;
    }

    auto MemoryCryptoService::sign(std::string_view key_id, std::string_view payload) const
        -> Signature
    {
        auto key = get_private_key(key_id).first;
        const auto algo = algorithm_of(key);
        return {
            std::string(key_id),
            std::string(scheme_of(algo)),
            sign_payload(key, payload),
            true,
        };
    }
}
