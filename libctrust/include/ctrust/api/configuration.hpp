// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_API_CONFIGURATION_HPP
#define CTRUST_API_CONFIGURATION_HPP

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "ctrust/core/error_handling.hpp"
#include "ctrust/core/logging.hpp"
#include "ctrust/validation/keys.hpp"

namespace ctrust
{
    /**
     * Parameters of a trust session.
     */
    struct SessionParams
    {
        /// Algorithm of the keys created by the session.
        validation::key_algorithm default_key_algorithm = validation::key_algorithm::ed25519;

        std::chrono::seconds root_expiry = std::chrono::days(3650);
        std::chrono::seconds targets_expiry = std::chrono::days(1095);
        std::chrono::seconds snapshot_expiry = std::chrono::days(1095);
        std::chrono::seconds timestamp_expiry = std::chrono::days(14);

        LoggingParams logging = {};

        /// Validity duration of the metadata of a role, delegations use the `targets` one.
        [[nodiscard]] auto expiry_for(std::string_view role) const -> std::chrono::seconds;
    };

    /**
     * Parse a duration of the form `<count>[s|m|h|d]`, seconds when there is no unit.
     */
    [[nodiscard]] auto parse_duration(std::string_view text) -> expected_t<std::chrono::seconds>;

    /**
     * Read session parameters, missing entries keep their default value.
     *
     * ```yaml
     * default_key_algorithm: ecdsa
     * expiry:
     *   root: 3650d
     *   targets: 1095d
     *   snapshot: 1095d
     *   timestamp: 14d
     * logging:
     *   level: info
     *   pattern: "%^%-9!l%-8n%$ %v"
     * ```
     */
    [[nodiscard]] auto read_session_params(const YAML::Node& node) -> expected_t<SessionParams>;

    [[nodiscard]] auto load_session_params(const std::filesystem::path& file)
        -> expected_t<SessionParams>;
}

namespace YAML
{
    template <>
    struct convert<ctrust::log_level>
    {
    private:

        inline static const std::array<std::string, 7> log_level_names = {
            "trace", "debug", "info", "warning", "error", "critical", "off"
        };

    public:

        static Node encode(const ctrust::log_level& rhs)
        {
            return Node(log_level_names[static_cast<size_t>(rhs)]);
        }

        static bool decode(const Node& node, ctrust::log_level& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }
            auto name = node.as<std::string>();
            auto it = std::find(log_level_names.begin(), log_level_names.end(), name);
            if (it != log_level_names.end())
            {
                rhs = static_cast<ctrust::log_level>(it - log_level_names.begin());
                return true;
            }

            LOG_ERROR << "Invalid log level, should be in {'critical', 'error', 'warning', 'info', 'debug', 'trace', 'off'} but is '"
                      << name << "'";
            return false;
        }
    };

    template <>
    struct convert<ctrust::validation::key_algorithm>
    {
        static Node encode(const ctrust::validation::key_algorithm& rhs)
        {
            return Node(std::string(ctrust::validation::name_of(rhs)));
        }

        static bool decode(const Node& node, ctrust::validation::key_algorithm& rhs)
        {
            if (!node.IsScalar())
            {
                return false;
            }
            auto name = node.as<std::string>();
            if (auto algo = ctrust::validation::key_algorithm_from_name(name))
            {
                rhs = *algo;
                return true;
            }

            LOG_ERROR << "Invalid key algorithm, should be in {'ed25519', 'ecdsa'} but is '" << name
                      << "'";
            return false;
        }
    };
}

#endif
