// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <nlohmann/json.hpp>

#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/metadata.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust::validation
{
    void to_json(nlohmann::json& j, const SignedMetadata& m)
    {
        j = {
            { "signed", nlohmann::json::parse(m.payload) },
            { "signatures", m.signatures },
        };
    }

    void from_json(const nlohmann::json& j, SignedMetadata& m)
    {
        const auto& signed_section = j.at("signed");
        m.payload = signed_section.dump();
        signed_section.at("role").get_to(m.role);
        m.version = get_count(signed_section, "version", m.role);
        signed_section.at("expires").get_to(m.expires);
        check_timestamp_metadata_format(m.expires);
        if (m.version == 0)
        {
            throw role_metadata_error("versions start at 1", m.role);
        }
        j.at("signatures").get_to(m.signatures);
    }
}
