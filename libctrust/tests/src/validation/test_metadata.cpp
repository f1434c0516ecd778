// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/metadata.hpp"

using namespace ctrust::validation;
namespace nl = nlohmann;

namespace
{
    TEST_CASE("SignedMetadata")
    {
        const auto payload = nl::json{
            { "_type", "Targets" },
            { "role", "targets" },
            { "version", 2 },
            { "expires", "2030-01-01T00:00:00Z" },
            { "targets", nl::json::object() },
        }.dump();
        const auto metadata = SignedMetadata{
            "targets",
            2,
            "2030-01-01T00:00:00Z",
            payload,
            { { "some_id", "ed25519", "abcd", true } },
        };

        nl::json j = metadata;
        REQUIRE(j.at("signed").at("version") == 2);
        REQUIRE(j.at("signatures").size() == 1);

        SECTION("Read back")
        {
            const auto read = j.get<SignedMetadata>();
            REQUIRE(read.role == "targets");
            REQUIRE(read.version == 2);
            REQUIRE(read.payload == payload);
            REQUIRE_FALSE(read.signatures.front().is_valid);
        }

        SECTION("Invalid expiration")
        {
            j["signed"]["expires"] = "tomorrow";
            REQUIRE_THROWS_AS(j.get<SignedMetadata>(), role_metadata_error);
        }

        SECTION("Versions start at 1")
        {
            j["signed"]["version"] = 0;
            REQUIRE_THROWS_AS(j.get<SignedMetadata>(), role_metadata_error);
            j["signed"]["version"] = -1;
            REQUIRE_THROWS_AS(j.get<SignedMetadata>(), role_metadata_error);
        }
    }
}
