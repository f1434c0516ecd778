// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <map>
#include <set>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>

#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"
#include "ctrust/validation/trust_state.hpp"

using namespace ctrust::validation;
namespace nl = nlohmann;

namespace
{
    constexpr auto gun = "docker.io/library/app";

    class StateFixture
    {
    public:

        StateFixture()
        {
            state.gun = gun;
            state.generation = 1;
            for (const auto& name : top_level_role_names())
            {
                auto role = Role{};
                role.name = name;
                role.add_key(custody.create(name, gun, key_algorithm::ed25519));
                state.registry.set_role(std::move(role));
            }
        }

        auto delegation_keys(const std::string& role) -> std::map<std::string, PublicKey>
        {
            const auto key = custody.create(role, gun, key_algorithm::ed25519);
            return { { key_id(key), key } };
        }

        auto create_delegation(const std::string& role, std::vector<std::string> paths) -> Change
        {
            auto content = DelegationChangeContent{};
            content.add_keys = delegation_keys(role);
            content.add_paths = std::move(paths);
            content.threshold = 1;
            return Change::make_delegation(change_action::create, role, content);
        }

        auto add_target(const std::string& role, const std::string& name) -> Change
        {
            return Change::make_target(change_action::create, role, make_target(name, name));
        }

        MemoryCryptoService custody;
        TrustState state;
    };

    auto names_of(const std::vector<TargetWithRole>& targets) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        for (const auto& t : targets)
        {
            out.push_back(t.role + ":" + t.target.name);
        }
        return out;
    }

    TEST_CASE_METHOD(StateFixture, "fold_changes")
    {
        SECTION("Targets and delegations")
        {
            auto [next, summary] = fold_changes(
                state,
                {
                    add_target("targets", "img:v1"),
                    create_delegation("targets/releases", { "releases" }),
                    add_target("targets/releases", "releases/v1"),
                }
            );
            REQUIRE(next.catalog.size() == 2);
            REQUIRE(next.delegations.contains("targets/releases"));
            REQUIRE(summary.touched_roles == std::set<std::string>{ "targets", "targets/releases" });
            REQUIRE(summary.removed_roles.empty());
            REQUIRE_FALSE(summary.previous_root.has_value());

            // The input state is untouched
            REQUIRE(state.catalog.empty());
            REQUIRE_FALSE(state.delegations.contains("targets/releases"));
        }

        SECTION("Delegation edits re-sign an existing statement")
        {
            auto created = fold_changes(state, { create_delegation("targets/releases", { "releases" }) });
            REQUIRE(created.second.touched_roles == std::set<std::string>{ "targets" });

            auto published = created.first;
            published.metadata.insert_or_assign(
                "targets/releases",
                SignedMetadata{ "targets/releases", 1, "2030-01-01T00:00:00Z", "{}", {} }
            );
            auto content = DelegationChangeContent{};
            content.add_keys = delegation_keys("targets/releases");
            const auto [next, summary] = fold_changes(
                published,
                { Change::make_delegation(change_action::update, "targets/releases", content) }
            );
            REQUIRE(next.delegations.get("targets/releases").keys.size() == 2);
            REQUIRE(summary.touched_roles == std::set<std::string>{ "targets", "targets/releases" });
        }

        SECTION("Unknown scope")
        {
            REQUIRE_THROWS_AS(
                fold_changes(state, { add_target("targets/missing", "img:v1") }),
                unknown_delegation_error
            );
        }

        SECTION("Target outside the role paths")
        {
            REQUIRE_THROWS_AS(
                fold_changes(
                    state,
                    {
                        create_delegation("targets/releases", { "releases" }),
                        add_target("targets/releases", "nightly/v1"),
                    }
                ),
                path_not_authorized_error
            );
        }

        SECTION("Paths removed after the target was added")
        {
            auto content = DelegationChangeContent{};
            content.remove_paths = { "releases" };
            REQUIRE_THROWS_AS(
                fold_changes(
                    state,
                    {
                        create_delegation("targets/releases", { "releases" }),
                        add_target("targets/releases", "releases/v1"),
                        Change::make_delegation(change_action::update, "targets/releases", content),
                    }
                ),
                path_not_authorized_error
            );
        }

        SECTION("Update of a missing delegation")
        {
            auto content = DelegationChangeContent{};
            content.add_paths = { "releases" };
            REQUIRE_THROWS_AS(
                fold_changes(
                    state,
                    { Change::make_delegation(change_action::update, "targets/releases", content) }
                ),
                unknown_delegation_error
            );
        }

        SECTION("Delegation without keys")
        {
            auto content = DelegationChangeContent{};
            content.add_paths = { "releases" };
            REQUIRE_THROWS_AS(
                fold_changes(
                    state,
                    { Change::make_delegation(change_action::create, "targets/releases", content) }
                ),
                role_error
            );
        }

        SECTION("Removal of a delegation subtree")
        {
            auto [with_delegations, _] = fold_changes(
                state,
                {
                    create_delegation("targets/a", { "" }),
                    create_delegation("targets/a/b", { "" }),
                    add_target("targets/a/b", "img:v1"),
                }
            );
            auto [next, summary] = fold_changes(
                with_delegations,
                { Change::make_delegation(change_action::remove, "targets/a", {}) }
            );
            REQUIRE(next.delegations.list_delegations().empty());
            REQUIRE(next.catalog.empty());
            REQUIRE(summary.removed_roles == std::set<std::string>{ "targets/a", "targets/a/b" });
            REQUIRE(summary.touched_roles == std::set<std::string>{ "targets" });
        }

        SECTION("Removal of an absent target")
        {
            auto [next, summary] = fold_changes(
                state,
                { Change::make_target(change_action::remove, "targets", make_target("img:v1", "x")) }
            );
            REQUIRE(next.catalog.empty());
            REQUIRE(summary.touched_roles.count("targets") == 1);
        }

        SECTION("Witness")
        {
            auto [next, summary] = fold_changes(state, { Change::make_witness("targets") });
            REQUIRE(summary.touched_roles == std::set<std::string>{ "targets" });
            REQUIRE_THROWS_AS(
                fold_changes(state, { Change::make_witness("targets/missing") }),
                unknown_delegation_error
            );
        }

        SECTION("Root key rotation")
        {
            const auto new_key = custody.create("root", gun, key_algorithm::ed25519);
            auto content = RoleChangeContent{};
            content.keys = std::map<std::string, PublicKey>{ { key_id(new_key), new_key } };
            auto [next, summary] = fold_changes(state, { Change::make_role("root", content) });

            REQUIRE(next.registry.get_role("root").has_key(key_id(new_key)));
            REQUIRE(summary.previous_root.has_value());
            REQUIRE(*summary.previous_root == state.registry.get_role("root"));
            REQUIRE(summary.touched_roles == std::set<std::string>{ "root" });
        }

        SECTION("Server-managed roles")
        {
            auto content = RoleChangeContent{};
            content.server_managed = true;
            auto [next, _] = fold_changes(state, { Change::make_role("timestamp", content) });
            REQUIRE(next.registry.is_server_managed("timestamp"));

            REQUIRE_THROWS_AS(fold_changes(state, { Change::make_role("targets", content) }), role_error);
        }

        SECTION("Unknown change type")
        {
            auto change = Change::make_witness("targets");
            change.type = "mystery";
            REQUIRE_THROWS_AS(fold_changes(state, { change }), invalid_change_error);
        }
    }

    TEST_CASE_METHOD(StateFixture, "apply_staged_changes")
    {
        auto content = DelegationChangeContent{};
        content.add_paths = { "x" };
        const auto pending = apply_staged_changes(
            state,
            {
                add_target("targets", "img:v1"),
                Change::make_delegation(change_action::update, "targets/missing", content),
                add_target("targets", "img:v2"),
            }
        );
        REQUIRE(pending.catalog.size() == 2);
        REQUIRE(state.catalog.empty());
    }

    TEST_CASE_METHOD(StateFixture, "Target queries")
    {
        const auto changes = std::vector<Change>{
            add_target("targets", "img:v1"),
            create_delegation("targets/releases", { "releases", "img" }),
            create_delegation("targets/releases/stable", { "releases/stable" }),
            add_target("targets/releases", "img:v1"),
            add_target("targets/releases", "releases/v2"),
            add_target("targets/releases/stable", "releases/stable/v3"),
            create_delegation("targets/other", { "" }),
        };
        state = fold_changes(state, changes).first;

        SECTION("walk_from")
        {
            REQUIRE(
                state.walk_from("targets")
                == std::vector<std::string>{ "targets",
                                             "targets/releases",
                                             "targets/releases/stable",
                                             "targets/other" }
            );
        }

        SECTION("list_targets")
        {
            REQUIRE(
                names_of(state.list_targets())
                == std::vector<std::string>{ "targets:img:v1",
                                             "targets/releases:releases/v2",
                                             "targets/releases/stable:releases/stable/v3" }
            );
            REQUIRE(
                names_of(state.list_targets({ "targets/releases/stable", "targets/missing" }))
                == std::vector<std::string>{ "targets/releases/stable:releases/stable/v3" }
            );
        }

        SECTION("get_target_by_name")
        {
            REQUIRE(state.get_target_by_name("img:v1").role == "targets");
            REQUIRE(state.get_target_by_name("img:v1", { "targets/releases" }).role == "targets/releases");
            REQUIRE(
                state.get_target_by_name("releases/stable/v3").role == "targets/releases/stable"
            );
            try
            {
                static_cast<void>(state.get_target_by_name("absent"));
                FAIL("Expected a not found error");
            }
            catch (const not_found_error& e)
            {
                REQUIRE(e.code() == trust_error_code::not_found);
                REQUIRE(e.details().path == "absent");
            }
        }

        SECTION("get_all_target_metadata_by_name")
        {
            const auto all = state.get_all_target_metadata_by_name("img:v1");
            REQUIRE(all.size() == 2);
            REQUIRE(all[0].role.name == "targets");
            REQUIRE(all[1].role.name == "targets/releases");
            REQUIRE(all[1].role.paths == std::vector<std::string>{ "releases", "img" });
            REQUIRE_THROWS_AS(state.get_all_target_metadata_by_name("absent"), not_found_error);
        }

        SECTION("list_roles")
        {
            const auto roles = state.list_roles();
            REQUIRE(roles.size() == 7);
            REQUIRE(roles[0].role.name == "root");
            REQUIRE(roles[4].role.name == "targets/releases");
            REQUIRE(roles[0].signatures.empty());
        }
    }

    TEST_CASE_METHOD(StateFixture, "build_signed_payload")
    {
        const auto changes = std::vector<Change>{
            add_target("targets", "img:v1"),
            create_delegation("targets/releases", { "releases" }),
        };
        state = fold_changes(state, changes).first;

        SECTION("Root")
        {
            const auto j = nl::json::parse(build_signed_payload(state, "root", 1, "2030-01-01T00:00:00Z"));
            REQUIRE(j.at("_type") == "Root");
            REQUIRE(j.at("gun") == gun);
            REQUIRE(j.at("keys").size() == 4);
            REQUIRE(j.at("roles").contains("timestamp"));
            REQUIRE(j.at("roles").at("root").at("threshold") == 1);
        }

        SECTION("Targets")
        {
            const auto payload = build_signed_payload(state, "targets", 3, "2030-01-01T00:00:00Z");
            const auto j = nl::json::parse(payload);
            REQUIRE(j.at("version") == 3);
            REQUIRE(j.at("targets").contains("img:v1"));
            REQUIRE(j.at("delegations").at("roles").size() == 1);
            REQUIRE(j.at("delegations").at("roles")[0].at("name") == "targets/releases");
            REQUIRE(payload == build_signed_payload(state, "targets", 3, "2030-01-01T00:00:00Z"));
        }

        SECTION("Snapshot and timestamp")
        {
            for (const auto& name : { "root", "targets", "snapshot" })
            {
                state.metadata[name] = SignedMetadata{
                    name,
                    1,
                    "2030-01-01T00:00:00Z",
                    build_signed_payload(state, name, 1, "2030-01-01T00:00:00Z"),
                    {},
                };
            }
            const auto snapshot = nl::json::parse(build_signed_payload(state, "snapshot", 2, "2030-01-01T00:00:00Z"));
            REQUIRE(snapshot.at("meta").size() == 2);
            REQUIRE(snapshot.at("meta").at("targets").at("version") == 1);
            REQUIRE(
                snapshot.at("meta").at("targets").at("hashes").at("sha256")
                == sha256_hex(state.metadata.at("targets").payload)
            );

            const auto timestamp = nl::json::parse(build_signed_payload(state, "timestamp", 1, "2030-01-01T00:00:00Z"));
            REQUIRE(timestamp.at("meta").size() == 1);
            REQUIRE(timestamp.at("meta").contains("snapshot"));
        }

        SECTION("Unknown role")
        {
            REQUIRE_THROWS_AS(build_signed_payload(state, "targets/x", 1, "2030-01-01T00:00:00Z"), not_found_error);
        }
    }
}
