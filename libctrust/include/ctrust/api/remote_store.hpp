// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_API_REMOTE_STORE_HPP
#define CTRUST_API_REMOTE_STORE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ctrust/util/synchronized_value.hpp"
#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/keys.hpp"
#include "ctrust/validation/metadata.hpp"

namespace ctrust
{
    /**
     * Remote authority of a collection: holds the keys of server-managed roles, signs with them
     * and stores published generations.
     *
     * Failures are reported as `validation::transport_error`.
     */
    class RemoteStore
    {
    public:

        using metadata_map = std::map<std::string, validation::SignedMetadata>;

        virtual ~RemoteStore() = default;

        /// Public key of a server-managed role, created on first request.
        virtual auto get_role_key(std::string_view gun, std::string_view role)
            -> validation::PublicKey = 0;

        /// Replace the key of a server-managed role.
        virtual auto rotate_role_key(std::string_view gun, std::string_view role)
            -> validation::PublicKey = 0;

        virtual auto sign_role(std::string_view gun, std::string_view role, std::string_view payload)
            -> std::vector<validation::Signature> = 0;

        /// Upload a whole generation, the remote keeps the latest one.
        virtual void
        publish(std::string_view gun, std::size_t generation, const metadata_map& metadata) = 0;

        virtual void delete_trust_data(std::string_view gun) = 0;
    };

    enum class remote_operation
    {
        get_role_key,
        rotate_role_key,
        sign_role,
        publish,
        delete_trust_data,
    };

    /**
     * In-memory `RemoteStore` with failure injection.
     *
     * Thread-safe.
     */
    class MemoryRemoteStore final : public RemoteStore
    {
    public:

        auto get_role_key(std::string_view gun, std::string_view role)
            -> validation::PublicKey override;
        auto rotate_role_key(std::string_view gun, std::string_view role)
            -> validation::PublicKey override;
        auto sign_role(std::string_view gun, std::string_view role, std::string_view payload)
            -> std::vector<validation::Signature> override;
        void
        publish(std::string_view gun, std::size_t generation, const metadata_map& metadata) override;
        void delete_trust_data(std::string_view gun) override;

        /// Make every call of the operation fail with a transport error until cleared.
        void set_failure(remote_operation operation, std::string message);
        void clear_failure(remote_operation operation);

        [[nodiscard]] auto published_generation(std::string_view gun) const
            -> std::optional<std::size_t>;
        [[nodiscard]] auto published_metadata(std::string_view gun) const -> metadata_map;
        [[nodiscard]] auto has_trust_data(std::string_view gun) const -> bool;

        /// Number of calls of the operation, failed ones included.
        [[nodiscard]] auto call_count(remote_operation operation) const -> std::size_t;

    private:

        struct Collection
        {
            std::map<std::string, std::string> role_key_ids;
            std::optional<std::size_t> generation;
            metadata_map metadata;
        };

        struct Data
        {
            std::map<std::string, Collection, std::less<>> collections;
            std::map<remote_operation, std::string> failures;
            std::map<remote_operation, std::size_t> calls;
        };

        validation::MemoryCryptoService m_keys;
        util::synchronized_value<Data, std::shared_mutex> m_data;

        void enter(remote_operation operation);
        auto create_role_key(std::string_view gun, std::string_view role) -> validation::PublicKey;
    };
}
#endif
