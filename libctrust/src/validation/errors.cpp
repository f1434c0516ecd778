// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>

#include <fmt/format.h>

#include "ctrust/validation/errors.hpp"

namespace ctrust::validation
{
    auto name_of(trust_error_code code) noexcept -> std::string_view
    {
        constexpr auto names = std::array<std::string_view, 16>{
            "NotFound",        "UnknownDelegation", "PathNotAuthorized", "PathConflict",
            "ThresholdNotMet", "AlreadyInitialized", "NotInitialized",   "SessionFailed",
            "InvalidRootKeys", "InvalidRole",        "InvalidChange",    "RoleMetadata",
            "Unimplemented",   "TransportError",     "Cancelled",        "Crypto",
        };
        return names[static_cast<std::size_t>(code)];
    }

    trust_error::trust_error(trust_error_code code, std::string_view message, trust_error_details details)
        : m_message(fmt::format("Content trust error ({}). {}", name_of(code), message))
        , m_details(std::move(details))
        , m_code(code)
    {
    }

    auto trust_error::what() const noexcept -> const char*
    {
        return m_message.c_str();
    }

    auto trust_error::code() const noexcept -> trust_error_code
    {
        return m_code;
    }

    auto trust_error::details() const noexcept -> const trust_error_details&
    {
        return m_details;
    }

    not_found_error::not_found_error(
        std::string_view kind,
        std::string_view name,
        trust_error_details details
    )
        : trust_error(
              trust_error_code::not_found,
              fmt::format("No {} named '{}'", kind, name),
              std::move(details)
          )
    {
    }

    unknown_delegation_error::unknown_delegation_error(std::string_view role)
        : trust_error(
              trust_error_code::unknown_delegation,
              fmt::format("Unknown delegation '{}'", role),
              { std::string(role) }
          )
    {
    }

    path_not_authorized_error::path_not_authorized_error(std::string_view role, std::string_view path)
        : trust_error(
              trust_error_code::path_not_authorized,
              fmt::format("Role '{}' is not authorized to sign for '{}'", role, path),
              { std::string(role), std::string(path) }
          )
    {
    }

    path_conflict_error::path_conflict_error(std::string_view role, std::string_view path)
        : trust_error(
              trust_error_code::path_conflict,
              fmt::format("Path '{}' of delegation '{}' is not within its parent's paths", path, role),
              { std::string(role), std::string(path) }
          )
    {
    }

    threshold_error::threshold_error(std::string_view role, std::size_t valid_count, std::size_t threshold)
        : trust_error(
              trust_error_code::threshold_not_met,
              fmt::format(
                  "Signatures threshold not met for role '{}' ({} valid out of {} required)",
                  role,
                  valid_count,
                  threshold
              ),
              { std::string(role) }
          )
        , m_valid_count(valid_count)
        , m_threshold(threshold)
    {
    }

    auto threshold_error::valid_count() const noexcept -> std::size_t
    {
        return m_valid_count;
    }

    auto threshold_error::threshold() const noexcept -> std::size_t
    {
        return m_threshold;
    }

    already_initialized_error::already_initialized_error(std::string_view gun)
        : trust_error(
              trust_error_code::already_initialized,
              fmt::format("Trust data for '{}' is already initialized", gun)
          )
    {
    }

    not_initialized_error::not_initialized_error(std::string_view gun)
        : trust_error(
              trust_error_code::not_initialized,
              fmt::format("Trust data for '{}' is not initialized", gun)
          )
    {
    }

    session_failed_error::session_failed_error(std::string_view gun, std::string_view reason)
        : trust_error(
              trust_error_code::session_failed,
              fmt::format("Trust session for '{}' failed: {}", gun, reason)
          )
    {
    }

    invalid_root_keys_error::invalid_root_keys_error(std::string_view key_id)
        : trust_error(
              trust_error_code::invalid_root_keys,
              fmt::format("Root key '{}' is unknown to the key custody", key_id),
              { "root", "", std::string(key_id) }
          )
    {
    }

    role_error::role_error(std::string_view role, std::string_view reason)
        : trust_error(
              trust_error_code::invalid_role,
              fmt::format("Invalid role '{}': {}", role, reason),
              { std::string(role) }
          )
    {
    }

    invalid_change_error::invalid_change_error(std::string_view reason, trust_error_details details)
        : trust_error(
              trust_error_code::invalid_change,
              fmt::format("Invalid change: {}", reason),
              std::move(details)
          )
    {
    }

    role_metadata_error::role_metadata_error(std::string_view reason, std::string_view role)
        : trust_error(
              trust_error_code::role_metadata,
              fmt::format("Invalid role metadata: {}", reason),
              { std::string(role) }
          )
    {
    }

    unimplemented_error::unimplemented_error(std::string_view operation, std::string_view reason)
        : trust_error(
              trust_error_code::unimplemented,
              fmt::format("Operation '{}' is not available: {}", operation, reason)
          )
    {
    }

    transport_error::transport_error(std::string_view message)
        : trust_error(trust_error_code::transport, message)
    {
    }

    cancelled_error::cancelled_error(std::string_view operation)
        : trust_error(trust_error_code::cancelled, fmt::format("Operation '{}' was cancelled", operation))
    {
    }

    crypto_error::crypto_error(std::string_view reason, std::string_view key_id)
        : trust_error(
              trust_error_code::crypto,
              fmt::format("Cryptographic failure: {}", reason),
              { "", "", std::string(key_id) }
          )
    {
    }
}
