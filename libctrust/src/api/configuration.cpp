// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <charconv>
#include <vector>

#include <fmt/format.h>

#include "ctrust/api/configuration.hpp"
#include "ctrust/validation/roles.hpp"

namespace ctrust
{
    auto SessionParams::expiry_for(std::string_view role) const -> std::chrono::seconds
    {
        if (role == validation::root_role_name)
        {
            return root_expiry;
        }
        if (role == validation::snapshot_role_name)
        {
            return snapshot_expiry;
        }
        if (role == validation::timestamp_role_name)
        {
            return timestamp_expiry;
        }
        return targets_expiry;
    }

    auto parse_duration(std::string_view text) -> expected_t<std::chrono::seconds>
    {
        if (text.empty())
        {
            return make_unexpected("Empty duration", ctrust_error_code::invalid_configuration);
        }

        auto unit = std::chrono::seconds(1);
        auto count_str = text;
        switch (text.back())
        {
            case 's':
                count_str.remove_suffix(1);
                break;
            case 'm':
                unit = std::chrono::minutes(1);
                count_str.remove_suffix(1);
                break;
            case 'h':
                unit = std::chrono::hours(1);
                count_str.remove_suffix(1);
                break;
            case 'd':
                unit = std::chrono::days(1);
                count_str.remove_suffix(1);
                break;
            default:
                break;
        }

        long long count = 0;
        const auto* const end = count_str.data() + count_str.size();
        auto [ptr, ec] = std::from_chars(count_str.data(), end, count);
        if (count_str.empty() || ec != std::errc() || ptr != end || count <= 0)
        {
            return make_unexpected(
                fmt::format("Invalid duration '{}', expected '<count>[s|m|h|d]'", text),
                ctrust_error_code::invalid_configuration
            );
        }
        return count * unit;
    }

    namespace
    {
        auto read_expiry(const YAML::Node& node, std::string_view role, std::chrono::seconds& out)
            -> expected_t<void>
        {
            const auto value = node[std::string(role)];
            if (!value)
            {
                return {};
            }
            auto duration = parse_duration(value.as<std::string>());
            if (!duration)
            {
                return forward_error(duration);
            }
            out = *duration;
            return {};
        }
    }

    auto read_session_params(const YAML::Node& node) -> expected_t<SessionParams>
    {
        auto params = SessionParams{};
        if (!node || node.IsNull())
        {
            return params;
        }
        if (!node.IsMap())
        {
            return make_unexpected(
                "Session configuration must be a mapping",
                ctrust_error_code::invalid_configuration
            );
        }

        try
        {
            if (const auto algo = node["default_key_algorithm"])
            {
                params.default_key_algorithm = algo.as<validation::key_algorithm>();
            }

            if (const auto expiry = node["expiry"])
            {
                std::vector<ctrust_error> errors;
                const auto check = [&](std::string_view role, std::chrono::seconds& out)
                {
                    if (auto res = read_expiry(expiry, role, out); !res)
                    {
                        errors.push_back(std::move(res).error());
                    }
                };
                check(validation::root_role_name, params.root_expiry);
                check(validation::targets_role_name, params.targets_expiry);
                check(validation::snapshot_role_name, params.snapshot_expiry);
                check(validation::timestamp_role_name, params.timestamp_expiry);
                if (!errors.empty())
                {
                    return make_unexpected(std::move(errors));
                }
            }

            if (const auto log_node = node["logging"])
            {
                if (const auto level = log_node["level"])
                {
                    params.logging.logging_level = level.as<log_level>();
                }
                if (const auto pattern = log_node["pattern"])
                {
                    params.logging.log_pattern = pattern.as<std::string>();
                }
            }
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format("Invalid session configuration: {}", e.what()),
                ctrust_error_code::invalid_configuration
            );
        }

        return params;
    }

    auto load_session_params(const std::filesystem::path& file) -> expected_t<SessionParams>
    {
        YAML::Node node;
        try
        {
            node = YAML::LoadFile(file.string());
        }
        catch (const YAML::Exception& e)
        {
            LOG_ERROR << "YAML error in session configuration '" << file.string() << "'";
            return make_unexpected(
                fmt::format("Could not load session configuration '{}': {}", file.string(), e.what()),
                ctrust_error_code::invalid_configuration
            );
        }
        return read_session_params(node);
    }
}
