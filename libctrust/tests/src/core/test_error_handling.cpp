// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "ctrust/core/error_handling.hpp"

namespace ctrust
{
    namespace
    {
        auto parse_positive(int value) -> expected_t<int>
        {
            if (value <= 0)
            {
                return make_unexpected("not positive", ctrust_error_code::invalid_configuration);
            }
            return value;
        }

        auto twice(int value) -> expected_t<int>
        {
            auto res = parse_positive(value);
            if (!res)
            {
                return forward_error(res);
            }
            return 2 * res.value();
        }

        TEST_CASE("expected_t")
        {
            SECTION("Value")
            {
                auto res = twice(4);
                REQUIRE(res.has_value());
                REQUIRE(extract(res) == 8);
            }

            SECTION("Error")
            {
                auto res = twice(-1);
                REQUIRE_FALSE(res.has_value());
                REQUIRE(res.error().error_code() == ctrust_error_code::invalid_configuration);
                REQUIRE(std::string(res.error().what()) == "not positive");
                REQUIRE_THROWS_AS(extract(res), ctrust_error);
            }
        }

        TEST_CASE("make_unexpected from an error list")
        {
            SECTION("Single error")
            {
                std::vector<ctrust_error> errors{
                    ctrust_error("first", ctrust_error_code::invalid_configuration),
                };
                auto unexpected = make_unexpected(std::move(errors));
                REQUIRE(unexpected.value().error_code() == ctrust_error_code::invalid_configuration);
            }

            SECTION("Several errors")
            {
                std::vector<ctrust_error> errors{
                    ctrust_error("first", ctrust_error_code::invalid_configuration),
                    ctrust_error("second", ctrust_error_code::unknown),
                };
                auto unexpected = make_unexpected(std::move(errors));
                REQUIRE(unexpected.value().error_code() == ctrust_error_code::aggregated);
            }
        }

        TEST_CASE("ctrust_aggregated_error")
        {
            auto error = ctrust_aggregated_error({
                ctrust_error("first", ctrust_error_code::unknown),
                ctrust_error("second", ctrust_error_code::unknown),
            });
            REQUIRE(error.error_code() == ctrust_error_code::aggregated);
            REQUIRE(error.errors().size() == 2);
            const auto message = std::string(error.what());
            REQUIRE(message.find("first") != std::string::npos);
            REQUIRE(message.find("second") != std::string::npos);
        }
    }
}
