// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/role_registry.hpp"
#include "ctrust/validation/tools.hpp"

using namespace ctrust::validation;

namespace
{
    constexpr auto gun = "docker.io/library/app";

    auto make_role(std::string name, MemoryCryptoService& custody, std::size_t key_count) -> Role
    {
        auto role = Role{};
        role.name = name;
        for (std::size_t i = 0; i < key_count; ++i)
        {
            role.add_key(custody.create(name, gun, key_algorithm::ed25519));
        }
        return role;
    }

    auto sign_all(const BaseRole& role, const CryptoService& custody, std::string_view payload)
        -> std::vector<Signature>
    {
        std::vector<Signature> sigs;
        for (const auto& id : role.key_ids())
        {
            sigs.push_back(custody.sign(id, payload));
        }
        return sigs;
    }

    TEST_CASE("RoleRegistry::initialize")
    {
        auto custody = MemoryCryptoService();
        const auto root_id = key_id(custody.create("root", gun, key_algorithm::ed25519));

        SECTION("Root from custody keys")
        {
            const auto registry = RoleRegistry::initialize(custody, { root_id }, {});
            REQUIRE(registry.has_role("root"));
            REQUIRE(registry.get_role("root").has_key(root_id));
            REQUIRE(registry.get_role("root").threshold == 1);
            REQUIRE(registry.server_managed_roles().empty());
        }

        SECTION("Unknown root key")
        {
            REQUIRE_THROWS_AS(
                RoleRegistry::initialize(custody, { root_id, "unknown" }, {}),
                invalid_root_keys_error
            );
        }

        SECTION("No root key")
        {
            REQUIRE_THROWS_AS(RoleRegistry::initialize(custody, {}, {}), role_error);
        }

        SECTION("Server-managed roles")
        {
            const auto registry = RoleRegistry::initialize(custody, { root_id }, { "timestamp" });
            REQUIRE(registry.is_server_managed("timestamp"));
            REQUIRE_FALSE(registry.is_server_managed("snapshot"));

            REQUIRE_THROWS_AS(
                RoleRegistry::initialize(custody, { root_id }, { "targets" }),
                role_error
            );
        }
    }

    TEST_CASE("RoleRegistry::set_role")
    {
        auto custody = MemoryCryptoService();
        auto registry = RoleRegistry();

        SECTION("Top-level roles only")
        {
            REQUIRE_THROWS_AS(registry.set_role(make_role("targets/a", custody, 1)), role_error);
        }

        SECTION("Threshold bounds")
        {
            auto role = make_role("targets", custody, 2);
            role.threshold = 3;
            REQUIRE_THROWS_AS(registry.set_role(role), role_error);
            role.threshold = 0;
            REQUIRE_THROWS_AS(registry.set_role(role), role_error);
            REQUIRE_FALSE(registry.has_role("targets"));
        }

        SECTION("Registration order")
        {
            registry.set_role(make_role("timestamp", custody, 1));
            registry.set_role(make_role("targets", custody, 1));
            registry.set_role(make_role("root", custody, 1));

            const auto roles = registry.list_roles();
            REQUIRE(roles.size() == 3);
            REQUIRE(roles[0].name == "root");
            REQUIRE(roles[1].name == "targets");
            REQUIRE(roles[2].name == "timestamp");
            REQUIRE(roles[1].paths == std::vector<std::string>{ "" });
        }

        SECTION("Missing role")
        {
            REQUIRE(registry.find_role("snapshot") == nullptr);
            REQUIRE_THROWS_AS(registry.get_role("snapshot"), not_found_error);
        }
    }

    TEST_CASE("Threshold verification")
    {
        auto custody = MemoryCryptoService();
        auto registry = RoleRegistry();
        auto role = make_role("targets", custody, 3);
        role.threshold = 2;
        registry.set_role(role);

        const std::string payload = R"({"_type":"Targets","version":1})";
        const auto sigs = sign_all(role, custody, payload);
        REQUIRE(sigs.size() == 3);

        SECTION("Threshold met")
        {
            REQUIRE(registry.count_valid_signatures(role, payload, sigs) == 3);
            REQUIRE(registry.verify_threshold(role, payload, { sigs[0], sigs[1] }));
            REQUIRE_NOTHROW(registry.check_threshold(role, payload, sigs));
        }

        SECTION("Duplicate key IDs are counted once")
        {
            const auto dup = std::vector<Signature>{ sigs[0], sigs[0], sigs[0] };
            REQUIRE(registry.count_valid_signatures(role, payload, dup) == 1);
            REQUIRE_FALSE(registry.verify_threshold(role, payload, dup));
        }

        SECTION("Invalid signatures never count")
        {
            auto tampered = sigs[1];
            tampered.sig = sigs[0].sig;
            REQUIRE(registry.count_valid_signatures(role, payload, { sigs[0], tampered }) == 1);
            REQUIRE(registry.count_valid_signatures(role, "other payload", sigs) == 0);
        }

        SECTION("Signatures of foreign keys never count")
        {
            const auto foreign = custody.create("targets", gun, key_algorithm::ed25519);
            const auto sig = custody.sign(key_id(foreign), payload);
            REQUIRE(registry.count_valid_signatures(role, payload, { sig }) == 0);
        }

        SECTION("Threshold not met")
        {
            try
            {
                registry.check_threshold(role, payload, { sigs[2] });
                FAIL("Expected a threshold error");
            }
            catch (const threshold_error& e)
            {
                REQUIRE(e.code() == trust_error_code::threshold_not_met);
                REQUIRE(e.valid_count() == 1);
                REQUIRE(e.threshold() == 2);
                REQUIRE(e.details().role == "targets");
            }
        }

        SECTION("Annotations")
        {
            auto tampered = sigs[1];
            tampered.sig = sigs[0].sig;
            tampered.is_valid = true;
            const auto annotated = registry.annotate(role, payload, { sigs[0], tampered });
            REQUIRE(annotated[0].is_valid);
            REQUIRE_FALSE(annotated[1].is_valid);
        }
    }

    TEST_CASE("Verification cache")
    {
        auto custody = MemoryCryptoService();
        auto calls = std::make_shared<std::atomic<int>>(0);
        auto registry = RoleRegistry(
            [calls](const PublicKey& key, std::string_view payload, std::string_view sig)
            {
                ++*calls;
                return verify_signature(key, payload, sig);
            }
        );
        auto role = make_role("snapshot", custody, 1);
        registry.set_role(role);

        const std::string payload = "payload";
        const auto sigs = sign_all(role, custody, payload);

        REQUIRE(registry.verify_threshold(role, payload, sigs));
        REQUIRE(registry.verify_threshold(role, payload, sigs));
        REQUIRE(*calls == 1);
        REQUIRE(registry.cached_results_count("snapshot") == 1);

        SECTION("Another payload is verified again")
        {
            REQUIRE_FALSE(registry.verify_threshold(role, "other", sigs));
            REQUIRE(*calls == 2);
        }

        SECTION("Changing the role invalidates its entries")
        {
            registry.set_role(role);
            REQUIRE(registry.cached_results_count("snapshot") == 0);
            REQUIRE(registry.verify_threshold(role, payload, sigs));
            REQUIRE(*calls == 2);
        }

        SECTION("Explicit invalidation")
        {
            registry.invalidate("snapshot");
            REQUIRE(registry.cached_results_count("snapshot") == 0);
        }
    }
}
