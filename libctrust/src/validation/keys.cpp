// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <utility>

#include <nlohmann/json.hpp>

#include "ctrust/util/cryptography.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/keys.hpp"

namespace ctrust::validation
{
    namespace
    {
        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;
    }

    auto name_of(key_algorithm algo) noexcept -> std::string_view
    {
        switch (algo)
        {
            case key_algorithm::ed25519:
                return "ed25519";
            case key_algorithm::ecdsa:
                return "ecdsa";
        }
        return "";
    }

    auto scheme_of(key_algorithm algo) noexcept -> std::string_view
    {
        switch (algo)
        {
            case key_algorithm::ed25519:
                return "ed25519";
            case key_algorithm::ecdsa:
                return "ecdsa-sha2-nistp256";
        }
        return "";
    }

    auto key_algorithm_from_name(std::string_view name) -> std::optional<key_algorithm>
    {
        if (name == "ed25519")
        {
            return key_algorithm::ed25519;
        }
        if (name == "ecdsa")
        {
            return key_algorithm::ecdsa;
        }
        return std::nullopt;
    }

    auto algorithm_of(const PublicKey& key) -> key_algorithm
    {
        return std::visit(
            overloaded{
                [](const Ed25519PublicKey&) { return key_algorithm::ed25519; },
                [](const EcdsaPublicKey&) { return key_algorithm::ecdsa; },
            },
            key
        );
    }

    auto algorithm_of(const PrivateKey& key) -> key_algorithm
    {
        return std::visit(
            overloaded{
                [](const Ed25519PrivateKey&) { return key_algorithm::ed25519; },
                [](const EcdsaPrivateKey&) { return key_algorithm::ecdsa; },
            },
            key
        );
    }

    auto keyval_of(const PublicKey& key) -> const std::string&
    {
        return std::visit([](const auto& k) -> const std::string& { return k.keyval; }, key);
    }

    auto public_key_of(const PrivateKey& key) -> PublicKey
    {
        return std::visit(
            overloaded{
                [](const Ed25519PrivateKey& k) -> PublicKey
                { return Ed25519PublicKey{ k.public_keyval }; },
                [](const EcdsaPrivateKey& k) -> PublicKey
                { return EcdsaPublicKey{ k.public_keyval }; },
            },
            key
        );
    }

    auto key_id(const PublicKey& key) -> std::string
    {
        // nlohmann::json objects are sorted by key, so the dump is canonical
        const auto canonical = nlohmann::json{
            { "keytype", std::string(name_of(algorithm_of(key))) },
            { "keyval", keyval_of(key) },
        }.dump();
        auto hasher = util::Sha256Hasher();
        return hasher.str_hex_str(canonical);
    }

    auto Key::from_public_key(const PublicKey& key) -> Key
    {
        const auto algo = algorithm_of(key);
        return { std::string(name_of(algo)), std::string(scheme_of(algo)), keyval_of(key) };
    }

    auto Key::to_public_key() const -> PublicKey
    {
        const auto algo = key_algorithm_from_name(keytype);
        if (!algo)
        {
            throw role_metadata_error("unsupported key type '" + keytype + "'");
        }
        switch (*algo)
        {
            case key_algorithm::ed25519:
                return Ed25519PublicKey{ keyval };
            case key_algorithm::ecdsa:
                return EcdsaPublicKey{ keyval };
        }
        throw role_metadata_error("unsupported key type '" + keytype + "'");
    }

    void to_json(nlohmann::json& j, const Key& key)
    {
        j = { { "keytype", key.keytype }, { "scheme", key.scheme }, { "keyval", key.keyval } };
    }

    void from_json(const nlohmann::json& j, Key& key)
    {
        j.at("keytype").get_to(key.keytype);
        j.at("scheme").get_to(key.scheme);
        j.at("keyval").get_to(key.keyval);
    }

    auto public_key_to_json(const PublicKey& key) -> nlohmann::json
    {
        return Key::from_public_key(key);
    }

    auto public_key_from_json(const nlohmann::json& j) -> PublicKey
    {
        return j.get<Key>().to_public_key();
    }

    void to_json(nlohmann::json& j, const Signature& s)
    {
        j = { { "keyid", s.keyid }, { "method", s.method }, { "sig", s.sig }, { "is_valid", s.is_valid } };
    }

    void from_json(const nlohmann::json& j, Signature& s)
    {
        j.at("keyid").get_to(s.keyid);
        j.at("method").get_to(s.method);
        j.at("sig").get_to(s.sig);
        s.is_valid = false;
    }

    auto operator<(const Signature& s1, const Signature& s2) -> bool
    {
        return s1.keyid < s2.keyid;
    }
}
