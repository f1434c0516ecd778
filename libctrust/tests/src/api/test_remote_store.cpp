// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>

#include <catch2/catch_all.hpp>

#include "ctrust/api/remote_store.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

#include "ctrusttests.hpp"

using namespace ctrust;
using namespace ctrust::validation;

namespace
{
    TEST_CASE("MemoryRemoteStore keys")
    {
        auto remote = MemoryRemoteStore();
        const std::string gun(ctrusttests::test_gun);

        const auto key = remote.get_role_key(gun, "timestamp");
        REQUIRE(algorithm_of(key) == key_algorithm::ecdsa);
        REQUIRE(remote.get_role_key(gun, "timestamp") == key);
        REQUIRE(remote.has_trust_data(gun));

        SECTION("Signing")
        {
            const auto sigs = remote.sign_role(gun, "timestamp", "payload");
            REQUIRE(sigs.size() == 1);
            REQUIRE(sigs.front().keyid == key_id(key));
            REQUIRE(verify_signature(key, "payload", sigs.front().sig));
            REQUIRE_THROWS_AS(remote.sign_role(gun, "snapshot", "payload"), transport_error);
        }

        SECTION("Rotation")
        {
            const auto rotated = remote.rotate_role_key(gun, "timestamp");
            REQUIRE(rotated != key);
            REQUIRE(remote.get_role_key(gun, "timestamp") == rotated);
            REQUIRE(remote.sign_role(gun, "timestamp", "payload").front().keyid == key_id(rotated));
        }

        SECTION("Deletion")
        {
            remote.delete_trust_data(gun);
            REQUIRE_FALSE(remote.has_trust_data(gun));
            REQUIRE(remote.get_role_key(gun, "timestamp") != key);
        }
    }

    TEST_CASE("MemoryRemoteStore publication")
    {
        auto remote = MemoryRemoteStore();
        const std::string gun(ctrusttests::test_gun);
        REQUIRE_FALSE(remote.published_generation(gun).has_value());

        auto metadata = RemoteStore::metadata_map{
            { "root", SignedMetadata{ "root", 1, "2030-01-01T00:00:00Z", "{}", {} } },
        };
        remote.publish(gun, 1, metadata);
        REQUIRE(remote.published_generation(gun) == 1);
        REQUIRE(remote.published_metadata(gun) == metadata);

        SECTION("Generations must be newer")
        {
            REQUIRE_THROWS_AS(remote.publish(gun, 1, metadata), transport_error);
            REQUIRE_NOTHROW(remote.publish(gun, 2, {}));
            REQUIRE(remote.published_generation(gun) == 2);
            REQUIRE(remote.published_metadata(gun).empty());
        }

        SECTION("Injected failures")
        {
            remote.set_failure(remote_operation::publish, "connection refused");
            try
            {
                remote.publish(gun, 2, metadata);
                FAIL("Expected a transport error");
            }
            catch (const transport_error& e)
            {
                REQUIRE(std::string(e.what()).find("connection refused") != std::string::npos);
            }
            REQUIRE(remote.published_generation(gun) == 1);
            REQUIRE(remote.call_count(remote_operation::publish) == 2);

            remote.clear_failure(remote_operation::publish);
            REQUIRE_NOTHROW(remote.publish(gun, 2, metadata));
            REQUIRE(remote.call_count(remote_operation::publish) == 3);
        }
    }
}
