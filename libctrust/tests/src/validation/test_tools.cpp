// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <chrono>
#include <string>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "ctrust/util/encoding.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

using namespace ctrust;
using namespace ctrust::validation;

template <std::size_t size>
auto
hex_str(const std::array<std::byte, size>& bytes)
{
    return util::bytes_to_hex_str(bytes.data(), bytes.data() + bytes.size());
}

namespace
{
    TEST_CASE("sha256_hex")
    {
        REQUIRE(sha256_hex("test") == "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
    }

    TEST_CASE("ed25519_key_hex_to_bytes")
    {
        std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES> pk, sk;
        REQUIRE(generate_ed25519_keypair(pk.data(), sk.data()) == 1);

        auto pk_hex = hex_str(pk);
        int error = 0;
        auto pk_bytes = ed25519_key_hex_to_bytes(pk_hex, error);
        REQUIRE(error == 0);
        REQUIRE(pk_hex == hex_str(pk_bytes));

        std::array<std::byte, 6> wrong_size_key{};
        pk_hex = hex_str(wrong_size_key);
        pk_bytes = ed25519_key_hex_to_bytes(pk_hex, error);
        REQUIRE_FALSE(pk_hex == hex_str(pk_bytes));
    }

    TEST_CASE("ed25519 sign and verify")
    {
        auto [pk, sk] = generate_ed25519_keypair_hex();
        REQUIRE(pk.size() == CTRUST_ED25519_KEYSIZE_HEX);
        REQUIRE(sk.size() == CTRUST_ED25519_KEYSIZE_HEX);

        std::string signature;
        REQUIRE(sign("Some text.", sk, signature) == 1);
        REQUIRE(signature.size() == CTRUST_ED25519_SIGSIZE_HEX);

        REQUIRE(verify("Some text.", pk, signature) == 1);
        REQUIRE(verify("Some other text.", pk, signature) == 0);

        auto [other_pk, other_sk] = generate_ed25519_keypair_hex();
        REQUIRE(verify("Some text.", other_pk, signature) == 0);
    }

    TEST_CASE("ecdsa sign and verify")
    {
        auto [pk, sk] = generate_ecdsa_keypair_hex();
        REQUIRE_FALSE(pk.empty());
        REQUIRE_FALSE(sk.empty());

        std::string signature;
        REQUIRE(sign_ecdsa("Some text.", sk, signature) == 1);
        REQUIRE(verify_ecdsa("Some text.", pk, signature) == 1);
        REQUIRE(verify_ecdsa("Some other text.", pk, signature) == 0);
        REQUIRE(verify_ecdsa("Some text.", pk, "not hex") == 0);
    }

    TEST_CASE("sign_payload")
    {
        for (auto algo : { key_algorithm::ed25519, key_algorithm::ecdsa })
        {
            CAPTURE(name_of(algo));
            const auto key = generate_private_key(algo);
            const auto public_key = public_key_of(key);
            REQUIRE(algorithm_of(key) == algo);
            REQUIRE(algorithm_of(public_key) == algo);

            const auto signature = sign_payload(key, "{\"version\":1}");
            REQUIRE(verify_signature(public_key, "{\"version\":1}", signature));
            REQUIRE_FALSE(verify_signature(public_key, "{\"version\":2}", signature));
        }

        SECTION("Signing with a corrupted key")
        {
            auto key = Ed25519PrivateKey{ "00", "not a key" };
            REQUIRE_THROWS_AS(sign_payload(key, "payload"), crypto_error);
        }
    }

    TEST_CASE("Timestamps")
    {
        using namespace std::chrono;

        const auto epoch = system_clock::time_point{};
        REQUIRE(format_timestamp(epoch) == "1970-01-01T00:00:00Z");
        REQUIRE(format_timestamp(epoch + days(1) + seconds(61)) == "1970-01-02T00:01:01Z");

        const auto expires = expiration_from_now(hours(1));
        REQUIRE_NOTHROW(check_timestamp_metadata_format(expires));
        REQUIRE(expires > format_timestamp(system_clock::now()));

        REQUIRE_THROWS_AS(check_timestamp_metadata_format("2022-01-01"), role_metadata_error);
        REQUIRE_THROWS_AS(check_timestamp_metadata_format("2022-01-01T00:00:00"), role_metadata_error);
    }

    TEST_CASE("Metadata counts")
    {
        namespace nl = nlohmann;

        REQUIRE(to_count(nl::json(3)) == 3);
        REQUIRE(to_count(nl::json::parse("3")) == 3);
        REQUIRE(to_count(nl::json::parse("0")) == 0);
        REQUIRE_FALSE(to_count(nl::json::parse("-1")).has_value());
        REQUIRE_FALSE(to_count(nl::json(1.5)).has_value());
        REQUIRE_FALSE(to_count(nl::json("3")).has_value());

        const auto j = nl::json::parse(R"({"threshold": 2, "length": -1})");
        REQUIRE(get_count(j, "threshold") == 2);
        REQUIRE_THROWS_AS(get_count(j, "version"), role_metadata_error);
        try
        {
            static_cast<void>(get_count(j, "length", "targets"));
            FAIL("Expected a role metadata error");
        }
        catch (const role_metadata_error& e)
        {
            REQUIRE(e.details().role == "targets");
        }
    }
}
