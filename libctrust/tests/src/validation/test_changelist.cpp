// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "ctrust/validation/changelist.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

using namespace ctrust::validation;
namespace nl = nlohmann;

namespace
{
    auto sample_target() -> Target
    {
        return { "img:v1", 4, { { "sha256", "deadbeef" } } };
    }

    TEST_CASE("change_action")
    {
        REQUIRE(name_of(change_action::remove) == "delete");
        REQUIRE(change_action_from_name("update") == change_action::update);
        REQUIRE_FALSE(change_action_from_name("destroy").has_value());
    }

    TEST_CASE("Change")
    {
        SECTION("Target")
        {
            const auto change = Change::make_target(change_action::create, "targets", sample_target());
            REQUIRE(change.type == "target");
            REQUIRE(change.scope == "targets");
            REQUIRE(change.path == "img:v1");

            const auto content = change.target_content();
            REQUIRE(content.length == 4);
            REQUIRE(content.hashes.at("sha256") == "deadbeef");

            REQUIRE_THROWS_AS(change.delegation_content(), invalid_change_error);
        }

        SECTION("Target removal")
        {
            const auto change = Change::make_target(change_action::remove, "targets", sample_target());
            REQUIRE(change.content == "{}");
            REQUIRE(change.target_content().hashes.empty());
        }

        SECTION("Delegation")
        {
            const auto key = public_key_of(generate_private_key(key_algorithm::ed25519));
            auto content = DelegationChangeContent{};
            content.threshold = 1;
            content.add_keys = { { key_id(key), key } };
            content.add_paths = { "releases" };
            content.clear_paths = true;

            const auto change = Change::make_delegation(change_action::create, "targets/releases", content);
            REQUIRE(change.type == "delegation");
            REQUIRE(change.path.empty());

            const auto read = change.delegation_content();
            REQUIRE(read.threshold == 1);
            REQUIRE(read.add_keys == content.add_keys);
            REQUIRE(read.add_paths == content.add_paths);
            REQUIRE(read.remove_paths.empty());
            REQUIRE(read.clear_paths);
        }

        SECTION("Role")
        {
            const auto change = Change::make_role("timestamp", { std::nullopt, 1, true });
            REQUIRE(change.scope == "root");
            REQUIRE(change.path == "timestamp");
            REQUIRE(change.action == change_action::update);

            const auto read = change.role_content();
            REQUIRE_FALSE(read.keys.has_value());
            REQUIRE(read.threshold == 1);
            REQUIRE(read.server_managed);
        }

        SECTION("Witness")
        {
            const auto change = Change::make_witness("targets/releases");
            REQUIRE(change.type == "witness");
            REQUIRE(change.scope == "targets/releases");
        }

        SECTION("Malformed content")
        {
            auto change = Change::make_target(change_action::create, "targets", sample_target());
            change.content = "{not json";
            REQUIRE_THROWS_AS(change.target_content(), invalid_change_error);
            change.content = R"({"length": "four"})";
            REQUIRE_THROWS_AS(change.target_content(), invalid_change_error);
        }

        SECTION("Negative counts")
        {
            auto target = Change::make_target(change_action::create, "targets", sample_target());
            target.content = R"({"length": -1, "hashes": {"sha256": "deadbeef"}})";
            REQUIRE_THROWS_AS(target.target_content(), invalid_change_error);

            auto delegation = Change::make_delegation(
                change_action::update,
                "targets/releases",
                DelegationChangeContent{}
            );
            delegation.content = R"({"threshold": -2})";
            REQUIRE_THROWS_AS(delegation.delegation_content(), invalid_change_error);

            auto role = Change::make_role("targets", RoleChangeContent{});
            role.content = R"({"threshold": -1, "server_managed": false})";
            REQUIRE_THROWS_AS(role.role_content(), invalid_change_error);
        }
    }

    TEST_CASE("Changelist")
    {
        auto changelist = Changelist();
        REQUIRE(changelist.empty());

        changelist.add(Change::make_target(change_action::create, "targets", sample_target()));
        changelist.add(Change::make_witness("targets"));
        changelist.add(Change::make_target(change_action::remove, "targets", sample_target()));
        REQUIRE(changelist.size() == 3);
        REQUIRE(changelist.list()[1].type == "witness");

        SECTION("Empty scope or type")
        {
            auto change = Change::make_witness("targets");
            change.scope = "";
            REQUIRE_THROWS_AS(changelist.add(change), invalid_change_error);
            change.scope = "targets";
            change.type = "";
            REQUIRE_THROWS_AS(changelist.add(change), invalid_change_error);
            REQUIRE(changelist.size() == 3);
        }

        SECTION("Remove the first changes")
        {
            changelist.remove_first(2);
            REQUIRE(changelist.size() == 1);
            REQUIRE(changelist.list().front().action == change_action::remove);
            changelist.remove_first(10);
            REQUIRE(changelist.empty());
        }

        SECTION("Keep the first changes")
        {
            changelist.truncate(5);
            REQUIRE(changelist.size() == 3);
            changelist.truncate(1);
            REQUIRE(changelist.size() == 1);
            REQUIRE(changelist.list().front().action == change_action::create);
            changelist.truncate(0);
            REQUIRE(changelist.empty());
        }

        SECTION("JSON")
        {
            const nl::json j = changelist;
            REQUIRE(j.size() == 3);
            REQUIRE(j[2].at("action") == "delete");
            REQUIRE(j.get<Changelist>() == changelist);

            auto bad = j;
            bad[0]["action"] = "destroy";
            REQUIRE_THROWS_AS(bad.get<Changelist>(), invalid_change_error);

            bad = j;
            bad[0]["scope"] = "";
            REQUIRE_THROWS_AS(bad.get<Changelist>(), invalid_change_error);

            // Content is only interpreted when applied
            bad = j;
            bad[0]["content"] = R"({"length": -1, "hashes": {"sha256": "deadbeef"}})";
            const auto read = bad.get<Changelist>();
            REQUIRE_THROWS_AS(read.list()[0].target_content(), invalid_change_error);
        }

        SECTION("Clear")
        {
            changelist.clear();
            REQUIRE(changelist.empty());
        }
    }
}
