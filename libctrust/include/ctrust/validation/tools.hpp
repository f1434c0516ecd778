// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_TOOLS_HPP
#define CTRUST_VALIDATION_TOOLS_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "ctrust/validation/keys.hpp"

namespace ctrust::validation
{
    inline constexpr std::size_t CTRUST_SHA256_SIZE_HEX = 64;
    inline constexpr std::size_t CTRUST_SHA256_SIZE_BYTES = 32;
    inline constexpr std::size_t CTRUST_ED25519_KEYSIZE_HEX = 64;
    inline constexpr std::size_t CTRUST_ED25519_KEYSIZE_BYTES = 32;
    inline constexpr std::size_t CTRUST_ED25519_SIGSIZE_HEX = 128;
    inline constexpr std::size_t CTRUST_ED25519_SIGSIZE_BYTES = 64;

    [[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

    auto generate_ed25519_keypair(std::byte* pk, std::byte* sk) -> int;
    auto generate_ed25519_keypair() -> std::pair<
        std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES>,
        std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES>>;
    auto generate_ed25519_keypair_hex() -> std::pair<std::string, std::string>;

    /**
     * Generate an ECDSA P-256 key pair.
     *
     * @return The hex encoded DER public and private keys, empty on failure.
     */
    auto generate_ecdsa_keypair_hex() -> std::pair<std::string, std::string>;

    auto sign(std::string_view data, const std::byte* sk, std::byte* signature) -> int;
    auto sign(std::string_view data, const std::string& sk, std::string& signature) -> int;
    auto sign_ecdsa(std::string_view data, const std::string& sk, std::string& signature) -> int;

    auto ed25519_sig_hex_to_bytes(const std::string& sig_hex, int& error_code) noexcept
        -> std::array<std::byte, CTRUST_ED25519_SIGSIZE_BYTES>;

    auto ed25519_key_hex_to_bytes(const std::string& key_hex, int& error_code) noexcept
        -> std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES>;

    auto
    verify(const std::byte* data, std::size_t data_len, const std::byte* pk, const std::byte* signature)
        -> int;
    auto verify(std::string_view data, const std::byte* pk, const std::byte* signature) -> int;
    auto verify(std::string_view data, const std::string& pk_hex, const std::string& signature_hex)
        -> int;
    auto verify_ecdsa(std::string_view data, const std::string& pk_hex, const std::string& signature_hex)
        -> int;

    /**
     * Generate a new private key of the given algorithm.
     *
     * @throw crypto_error on failure.
     */
    [[nodiscard]] auto generate_private_key(key_algorithm algo) -> PrivateKey;

    /**
     * Sign a payload and return the hex encoded signature.
     *
     * @throw crypto_error on failure.
     */
    [[nodiscard]] auto sign_payload(const PrivateKey& key, std::string_view payload) -> std::string;

    /**
     * Verify a hex encoded signature of a payload.
     */
    [[nodiscard]] auto
    verify_signature(const PublicKey& key, std::string_view payload, std::string_view signature_hex)
        -> bool;

    /**
     * Format a time point as an UTC ISO8601 timestamp ('<YYYY>-<MM>-<DD>T<HH>:<MM>:<SS>Z').
     */
    [[nodiscard]] auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string;

    /**
     * Timestamp of the expiration date after the given duration from now.
     */
    [[nodiscard]] auto expiration_from_now(std::chrono::seconds duration) -> std::string;

    void check_timestamp_metadata_format(const std::string& ts);

    /**
     * Read a count (length, threshold, version) from metadata.
     *
     * @return The value, or nothing if it is not a non-negative integer.
     */
    [[nodiscard]] auto to_count(const nlohmann::json& value) -> std::optional<std::size_t>;

    /**
     * Read the count field of a metadata object.
     *
     * @throw role_metadata_error if the field is missing or not a non-negative integer.
     */
    [[nodiscard]] auto
    get_count(const nlohmann::json& j, std::string_view field, std::string_view role = {})
        -> std::size_t;
}
#endif
