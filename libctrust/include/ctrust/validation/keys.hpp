// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_KEYS_HPP
#define CTRUST_VALIDATION_KEYS_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace ctrust::validation
{
    enum class key_algorithm
    {
        ed25519,
        ecdsa,
    };

    [[nodiscard]] auto name_of(key_algorithm algo) noexcept -> std::string_view;
    [[nodiscard]] auto scheme_of(key_algorithm algo) noexcept -> std::string_view;
    [[nodiscard]] auto key_algorithm_from_name(std::string_view name) -> std::optional<key_algorithm>;

    /**
     * Public part of an ED25519 key pair, as the hex encoding of the raw 32 bytes.
     */
    struct Ed25519PublicKey
    {
        std::string keyval;

        auto operator==(const Ed25519PublicKey&) const -> bool = default;
    };

    /**
     * Public part of an ECDSA P-256 key pair, as the hex encoding of its DER
     * SubjectPublicKeyInfo.
     */
    struct EcdsaPublicKey
    {
        std::string keyval;

        auto operator==(const EcdsaPublicKey&) const -> bool = default;
    };

    using PublicKey = std::variant<Ed25519PublicKey, EcdsaPublicKey>;

    struct Ed25519PrivateKey
    {
        std::string public_keyval;
        std::string private_keyval;
    };

    /**
     * ECDSA P-256 private key, as the hex encoding of its DER form.
     */
    struct EcdsaPrivateKey
    {
        std::string public_keyval;
        std::string private_keyval;
    };

    using PrivateKey = std::variant<Ed25519PrivateKey, EcdsaPrivateKey>;

    [[nodiscard]] auto algorithm_of(const PublicKey& key) -> key_algorithm;
    [[nodiscard]] auto algorithm_of(const PrivateKey& key) -> key_algorithm;
    [[nodiscard]] auto keyval_of(const PublicKey& key) -> const std::string&;
    [[nodiscard]] auto public_key_of(const PrivateKey& key) -> PublicKey;

    /**
     * Compute the identifier of a public key.
     *
     * This is the hex encoded SHA-256 digest of the canonical JSON `{keytype, keyval}`.
     */
    [[nodiscard]] auto key_id(const PublicKey& key) -> std::string;

    /**
     * Representation of the public part of a cryptographic key pair, as found in metadata.
     */
    struct Key
    {
        std::string keytype = "";
        std::string scheme = "";
        std::string keyval = "";

        [[nodiscard]] static auto from_public_key(const PublicKey& key) -> Key;

        /**
         * Convert to a public key.
         *
         * @throw role_metadata_error if the key type is not supported.
         */
        [[nodiscard]] auto to_public_key() const -> PublicKey;
    };

    void to_json(nlohmann::json& j, const Key& k);
    void from_json(const nlohmann::json& j, Key& k);

    [[nodiscard]] auto public_key_to_json(const PublicKey& key) -> nlohmann::json;
    [[nodiscard]] auto public_key_from_json(const nlohmann::json& j) -> PublicKey;

    /**
     * A signature over a payload.
     *
     * `is_valid` is derived, it is recomputed against the current keys whenever signatures
     * are reported and is never read from the transport.
     */
    struct Signature
    {
        std::string keyid = "";
        std::string method = "";
        std::string sig = "";
        bool is_valid = false;

        auto operator==(const Signature&) const -> bool = default;
    };

    void to_json(nlohmann::json& j, const Signature& s);
    void from_json(const nlohmann::json& j, Signature& s);

    [[nodiscard]] auto operator<(const Signature& s1, const Signature& s2) -> bool;
}
#endif
