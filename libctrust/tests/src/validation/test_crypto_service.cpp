// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <future>
#include <set>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

using namespace ctrust::validation;

namespace
{
    constexpr auto gun = "docker.io/library/app";

    TEST_CASE("MemoryCryptoService")
    {
        auto custody = MemoryCryptoService();
        REQUIRE(custody.list_keys("targets").empty());
        REQUIRE(custody.list_all_keys().empty());

        const auto key = custody.create("targets", gun, key_algorithm::ed25519);
        const auto id = key_id(key);

        SECTION("Lookup")
        {
            REQUIRE(custody.get_key(id) == key);
            REQUIRE_FALSE(custody.get_key("unknown").has_value());
            REQUIRE(custody.list_keys("targets") == std::set<std::string>{ id });
            REQUIRE(custody.list_keys("snapshot").empty());
            REQUIRE(custody.list_all_keys().at(id) == "targets");
            REQUIRE(custody.get_private_key(id).second == "targets");
            REQUIRE_THROWS_AS(custody.get_private_key("unknown"), not_found_error);
        }

        SECTION("Sign")
        {
            const auto sig = custody.sign(id, "payload");
            REQUIRE(sig.keyid == id);
            REQUIRE(sig.method == "ed25519");
            REQUIRE(verify_signature(key, "payload", sig.sig));
            REQUIRE_THROWS_AS(custody.sign("unknown", "payload"), not_found_error);
        }

        SECTION("ECDSA")
        {
            const auto ec_key = custody.create("snapshot", gun, key_algorithm::ecdsa);
            const auto sig = custody.sign(key_id(ec_key), "payload");
            REQUIRE(sig.method == "ecdsa-sha2-nistp256");
            REQUIRE(verify_signature(ec_key, "payload", sig.sig));
        }

        SECTION("Add an existing key")
        {
            const auto private_key = generate_private_key(key_algorithm::ed25519);
            custody.add_key("targets/releases", gun, private_key);
            REQUIRE(custody.list_keys("targets/releases").size() == 1);
            REQUIRE(custody.get_key(key_id(public_key_of(private_key))).has_value());
        }

        SECTION("Remove")
        {
            custody.remove_key(id);
            REQUIRE_FALSE(custody.get_key(id).has_value());
            REQUIRE_NOTHROW(custody.remove_key(id));
            REQUIRE(custody.list_keys("targets").empty());
        }
    }

    TEST_CASE("MemoryCryptoService concurrent use")
    {
        auto custody = MemoryCryptoService();
        std::vector<std::future<PublicKey>> futures;
        for (int i = 0; i < 8; ++i)
        {
            futures.push_back(std::async(
                std::launch::async,
                [&] { return custody.create("targets", gun, key_algorithm::ed25519); }
            ));
        }
        for (auto& f : futures)
        {
            const auto key = f.get();
            REQUIRE(custody.sign(key_id(key), "payload").keyid == key_id(key));
        }
        REQUIRE(custody.list_keys("targets").size() == 8);
    }
}
