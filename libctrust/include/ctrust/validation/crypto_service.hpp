// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_CRYPTO_SERVICE_HPP
#define CTRUST_VALIDATION_CRYPTO_SERVICE_HPP

#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>

#include "ctrust/util/synchronized_value.hpp"
#include "ctrust/validation/keys.hpp"

namespace ctrust::validation
{
    /**
     * Key custody: creates, stores and lists key material, and signs payloads.
     *
     * The trust engine never reads private key bytes, every signature goes through `sign`.
     * Implementations must be thread-safe.
     */
    class CryptoService
    {
    public:

        virtual ~CryptoService() = default;

        /**
         * Generate and store a new key for the role of a collection.
         *
         * @throw crypto_error if the generation fails.
         */
        virtual auto create(std::string_view role, std::string_view gun, key_algorithm algo)
            -> PublicKey = 0;

        virtual void add_key(std::string_view role, std::string_view gun, const PrivateKey& key) = 0;

        [[nodiscard]] virtual auto get_key(std::string_view key_id) const
            -> std::optional<PublicKey> = 0;

        /**
         * @return The private key and the role it is stored for.
         * @throw not_found_error if the key is absent.
         */
        [[nodiscard]] virtual auto get_private_key(std::string_view key_id) const
            -> std::pair<PrivateKey, std::string> = 0;

        /// Absent keys are ignored.
        virtual void remove_key(std::string_view key_id) = 0;

        /// Key IDs stored for the role, empty when there are none.
        [[nodiscard]] virtual auto list_keys(std::string_view role) const
            -> std::set<std::string> = 0;

        [[nodiscard]] virtual auto list_all_keys() const -> std::map<std::string, std::string> = 0;

        /**
         * Sign a payload with a stored key.
         *
         * @throw not_found_error if the key is absent.
         * @throw crypto_error if signing fails.
         */
        [[nodiscard]] virtual auto sign(std::string_view key_id, std::string_view payload) const
            -> Signature = 0;
    };

    /**
     * Thread-safe in-memory key custody.
     */
    class MemoryCryptoService final : public CryptoService
    {
    public:

        auto create(std::string_view role, std::string_view gun, key_algorithm algo)
            -> PublicKey override;
        void add_key(std::string_view role, std::string_view gun, const PrivateKey& key) override;
        [[nodiscard]] auto get_key(std::string_view key_id) const
            -> std::optional<PublicKey> override;
        [[nodiscard]] auto get_private_key(std::string_view key_id) const
            -> std::pair<PrivateKey, std::string> override;
        void remove_key(std::string_view key_id) override;
        [[nodiscard]] auto list_keys(std::string_view role) const -> std::set<std::string> override;
        [[nodiscard]] auto list_all_keys() const -> std::map<std::string, std::string> override;
        [[nodiscard]] auto sign(std::string_view key_id, std::string_view payload) const
            -> Signature override;

    private:

        struct KeyEntry
        {
            PrivateKey key;
            std::string role;
            std::string gun;
        };

        util::synchronized_value<std::map<std::string, KeyEntry, std::less<>>, std::shared_mutex> m_keys;
    };
}
#endif
