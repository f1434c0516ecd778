// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_METADATA_HPP
#define CTRUST_VALIDATION_METADATA_HPP

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ctrust/validation/keys.hpp"

namespace ctrust::validation
{
    /**
     * Signed document of a role for one generation.
     *
     * The payload is the canonical JSON of the signed section, the exact bytes the signatures
     * are computed over.
     */
    struct SignedMetadata
    {
        std::string role;
        std::size_t version = 0;
        std::string expires;
        std::string payload;
        std::vector<Signature> signatures;

        auto operator==(const SignedMetadata&) const -> bool = default;
    };

    void to_json(nlohmann::json& j, const SignedMetadata& m);

    /**
     * @throw role_metadata_error if the expiration is not a valid timestamp or the payload is not
     *        the signed section of the role.
     */
    void from_json(const nlohmann::json& j, SignedMetadata& m);
}
#endif
