// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <sstream>
#include <string>

#include <catch2/catch_all.hpp>

#include "ctrust/util/cryptography.hpp"

using namespace ctrust::util;

namespace
{
    TEST_CASE("Sha256Hasher")
    {
        auto hasher = Sha256Hasher();

        SECTION("Hash string")
        {
            REQUIRE(
                hasher.str_hex_str("test")
                == "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08"
            );
            REQUIRE(
                hasher.str_hex_str("")
                == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
            );
        }

        SECTION("Hash stream")
        {
            auto in = std::istringstream("test");
            auto [hex, size] = hasher.stream_hex_str(in);
            REQUIRE(hex == "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
            REQUIRE(size == 4);
        }

        SECTION("Hash large stream")
        {
            const auto data = std::string(3 * Sha256Hasher::digest_size + 7, 'x');
            auto in = std::istringstream(data);
            auto [hex, size] = hasher.stream_hex_str(in);
            REQUIRE(hex == hasher.str_hex_str(data));
            REQUIRE(size == data.size());
        }
    }

    TEST_CASE("Sha512Hasher")
    {
        auto hasher = Sha512Hasher();
        const auto hex = hasher.str_hex_str("test");
        REQUIRE(hex.size() == Sha512Hasher::hex_size);
        REQUIRE(
            hex
            == "ee26b0dd4af7e749aa1a8ee3c10ae9923f618980772e473f8819a5d4940e0db27ac185f8a0e1d5f84f88bc887fd67b143732c304cc5fa9ad8e6f57f50028a8ff"
        );
    }
}
