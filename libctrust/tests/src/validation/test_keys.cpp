// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <vector>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/keys.hpp"
#include "ctrust/validation/tools.hpp"

using namespace ctrust::validation;
namespace nl = nlohmann;

namespace
{
    TEST_CASE("key_algorithm names")
    {
        REQUIRE(name_of(key_algorithm::ed25519) == "ed25519");
        REQUIRE(scheme_of(key_algorithm::ecdsa) == "ecdsa-sha2-nistp256");
        REQUIRE(key_algorithm_from_name("ecdsa") == key_algorithm::ecdsa);
        REQUIRE_FALSE(key_algorithm_from_name("rsa").has_value());
    }

    TEST_CASE("key_id")
    {
        const auto key = PublicKey{ Ed25519PublicKey{ "abcdef" } };
        const auto id = key_id(key);

        SECTION("Digest of the canonical key")
        {
            const auto canonical = nl::json{ { "keyval", "abcdef" }, { "keytype", "ed25519" } }.dump();
            REQUIRE(id == sha256_hex(canonical));
            REQUIRE(id.size() == CTRUST_SHA256_SIZE_HEX);
        }

        SECTION("Depends on the key type")
        {
            REQUIRE(id != key_id(PublicKey{ EcdsaPublicKey{ "abcdef" } }));
        }

        SECTION("Stable")
        {
            REQUIRE(id == key_id(PublicKey{ Ed25519PublicKey{ "abcdef" } }));
        }
    }

    TEST_CASE("Key")
    {
        const auto public_key = public_key_of(generate_private_key(key_algorithm::ecdsa));
        const auto key = Key::from_public_key(public_key);
        REQUIRE(key.keytype == "ecdsa");
        REQUIRE(key.scheme == "ecdsa-sha2-nistp256");
        REQUIRE(key.to_public_key() == public_key);

        nl::json j = key;
        REQUIRE(j.at("keytype") == "ecdsa");
        REQUIRE(public_key_from_json(j) == public_key);

        SECTION("Unsupported key type")
        {
            j["keytype"] = "rsa";
            REQUIRE_THROWS_AS(public_key_from_json(j), role_metadata_error);
        }
    }

    TEST_CASE("Signature")
    {
        const auto sig = Signature{ "some_id", "ed25519", "abcd", true };

        nl::json j = sig;
        REQUIRE(j.at("is_valid") == true);

        SECTION("Validity is not read from the transport")
        {
            const auto read = j.get<Signature>();
            REQUIRE(read.keyid == "some_id");
            REQUIRE(read.sig == "abcd");
            REQUIRE_FALSE(read.is_valid);
        }

        SECTION("Ordering by key ID")
        {
            auto sigs = std::vector<Signature>{ { "b" }, { "c" }, { "a" } };
            std::sort(sigs.begin(), sigs.end());
            REQUIRE(sigs.front().keyid == "a");
            REQUIRE(sigs.back().keyid == "c");
        }
    }
}
