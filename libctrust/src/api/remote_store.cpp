// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "ctrust/api/remote_store.hpp"
#include "ctrust/core/logging.hpp"
#include "ctrust/validation/errors.hpp"

namespace ctrust
{
    namespace
    {
        auto name_of(remote_operation operation) -> std::string_view
        {
            switch (operation)
            {
                case remote_operation::get_role_key:
                    return "get_role_key";
                case remote_operation::rotate_role_key:
                    return "rotate_role_key";
                case remote_operation::sign_role:
                    return "sign_role";
                case remote_operation::publish:
                    return "publish";
                case remote_operation::delete_trust_data:
                    return "delete_trust_data";
            }
            return "";
        }
    }

    void MemoryRemoteStore::enter(remote_operation operation)
    {
        auto data = m_data.synchronize();
        ++data->calls[operation];
        if (auto it = data->failures.find(operation); it != data->failures.end())
        {
            LOG_DEBUG << "Injected failure of remote operation '" << name_of(operation) << "'";
            throw validation::transport_error(it->second);
        }
    }

    auto MemoryRemoteStore::create_role_key(std::string_view gun, std::string_view role)
        -> validation::PublicKey
    {
        auto key = m_keys.create(role, gun, validation::key_algorithm::ecdsa);
        auto data = m_data.synchronize();
        auto& collection = data->collections[std::string(gun)];
        if (auto previous = collection.role_key_ids.find(std::string(role));
            previous != collection.role_key_ids.end())
        {
            m_keys.remove_key(previous->second);
        }
        collection.role_key_ids.insert_or_assign(std::string(role), validation::key_id(key));
        return key;
    }

    auto MemoryRemoteStore::get_role_key(std::string_view gun, std::string_view role)
        -> validation::PublicKey
    {
        enter(remote_operation::get_role_key);
        std::optional<std::string> existing;
        {
            auto data = m_data.synchronize();
            if (auto it = data->collections.find(gun); it != data->collections.end())
            {
                if (auto key = it->second.role_key_ids.find(std::string(role));
                    key != it->second.role_key_ids.end())
                {
                    existing = key->second;
                }
            }
        }
        if (existing)
        {
            if (auto key = m_keys.get_key(*existing))
            {
                return *key;
            }
        }
        return create_role_key(gun, role);
    }

    auto MemoryRemoteStore::rotate_role_key(std::string_view gun, std::string_view role)
        -> validation::PublicKey
    {
        enter(remote_operation::rotate_role_key);
        return create_role_key(gun, role);
    }

    auto MemoryRemoteStore::sign_role(std::string_view gun, std::string_view role, std::string_view payload)
        -> std::vector<validation::Signature>
    {
        enter(remote_operation::sign_role);
        std::string id;
        {
            auto data = m_data.synchronize();
            auto it = data->collections.find(gun);
            if (it == data->collections.end()
                || it->second.role_key_ids.count(std::string(role)) == 0)
            {
                throw validation::transport_error(
                    fmt::format("No server key for role '{}' of '{}'", role, gun)
                );
            }
            id = it->second.role_key_ids.at(std::string(role));
        }
        return { m_keys.sign(id, payload) };
    }

    void MemoryRemoteStore::publish(
        std::string_view gun,
        std::size_t generation,
        const metadata_map& metadata
    )
    {
        enter(remote_operation::publish);
        auto data = m_data.synchronize();
        auto& collection = data->collections[std::string(gun)];
        if (collection.generation && *collection.generation >= generation)
        {
            throw validation::transport_error(fmt::format(
                "Generation {} of '{}' is not newer than the published generation {}",
                generation,
                gun,
                *collection.generation
            ));
        }
        collection.generation = generation;
        collection.metadata = metadata;
    }

    void MemoryRemoteStore::delete_trust_data(std::string_view gun)
    {
        enter(remote_operation::delete_trust_data);
        std::vector<std::string> key_ids;
        {
            auto data = m_data.synchronize();
            if (auto it = data->collections.find(gun); it != data->collections.end())
            {
                for (const auto& [role, id] : it->second.role_key_ids)
                {
                    key_ids.push_back(id);
                }
                data->collections.erase(it);
            }
        }
        for (const auto& id : key_ids)
        {
            m_keys.remove_key(id);
        }
    }

    void MemoryRemoteStore::set_failure(remote_operation operation, std::string message)
    {
        m_data->failures.insert_or_assign(operation, std::move(message));
    }

    void MemoryRemoteStore::clear_failure(remote_operation operation)
    {
        m_data->failures.erase(operation);
    }

    auto MemoryRemoteStore::published_generation(std::string_view gun) const
        -> std::optional<std::size_t>
    {
        auto data = m_data.synchronize();
        if (auto it = data->collections.find(gun); it != data->collections.end())
        {
            return it->second.generation;
        }
        return std::nullopt;
    }

    auto MemoryRemoteStore::published_metadata(std::string_view gun) const -> metadata_map
    {
        auto data = m_data.synchronize();
        if (auto it = data->collections.find(gun); it != data->collections.end())
        {
            return it->second.metadata;
        }
        return {};
    }

    auto MemoryRemoteStore::has_trust_data(std::string_view gun) const -> bool
    {
        auto data = m_data.synchronize();
        return data->collections.find(gun) != data->collections.end();
    }

    auto MemoryRemoteStore::call_count(remote_operation operation) const -> std::size_t
    {
        auto data = m_data.synchronize();
        if (auto it = data->calls.find(operation); it != data->calls.end())
        {
            return it->second;
        }
        return 0;
    }
}
