// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_VALIDATION_ERRORS_HPP
#define CTRUST_VALIDATION_ERRORS_HPP

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>

namespace ctrust::validation
{
    enum class trust_error_code
    {
        not_found,
        unknown_delegation,
        path_not_authorized,
        path_conflict,
        threshold_not_met,
        already_initialized,
        not_initialized,
        session_failed,
        invalid_root_keys,
        invalid_role,
        invalid_change,
        role_metadata,
        unimplemented,
        transport,
        cancelled,
        crypto,
    };

    [[nodiscard]] auto name_of(trust_error_code code) noexcept -> std::string_view;

    /**
     * Offending entities of a trust error, empty when not relevant.
     */
    struct trust_error_details
    {
        std::string role = {};
        std::string path = {};
        std::string key_id = {};

        auto operator==(const trust_error_details&) const -> bool = default;
    };

    /**
     * Base class for content trust errors.
     */
    class trust_error : public std::exception
    {
    public:

        trust_error(trust_error_code code, std::string_view message, trust_error_details details = {});
        ~trust_error() override = default;

        [[nodiscard]] auto what() const noexcept -> const char* override;
        [[nodiscard]] auto code() const noexcept -> trust_error_code;
        [[nodiscard]] auto details() const noexcept -> const trust_error_details&;

    private:

        std::string m_message;
        trust_error_details m_details;
        trust_error_code m_code;
    };

    /**
     * Error raised when a role, key or target is absent.
     */
    class not_found_error : public trust_error
    {
    public:

        not_found_error(std::string_view kind, std::string_view name, trust_error_details details = {});
        ~not_found_error() override = default;
    };

    /**
     * Error raised when mutating a delegation that does not exist, or when creating one whose
     * parent does not exist.
     */
    class unknown_delegation_error : public trust_error
    {
    public:

        unknown_delegation_error(std::string_view role);
        ~unknown_delegation_error() override = default;
    };

    /**
     * Error raised when a target path is outside the paths a role may sign for.
     */
    class path_not_authorized_error : public trust_error
    {
    public:

        path_not_authorized_error(std::string_view role, std::string_view path);
        ~path_not_authorized_error() override = default;
    };

    /**
     * Error raised when delegation paths are not contained in the parent's paths.
     */
    class path_conflict_error : public trust_error
    {
    public:

        path_conflict_error(std::string_view role, std::string_view path);
        ~path_conflict_error() override = default;
    };

    /**
     * Error raised when a threshold of signatures is not met.
     *
     * This can be due to wrong signatures, wrong or missing public keys.
     */
    class threshold_error : public trust_error
    {
    public:

        threshold_error(std::string_view role, std::size_t valid_count, std::size_t threshold);
        ~threshold_error() override = default;

        [[nodiscard]] auto valid_count() const noexcept -> std::size_t;
        [[nodiscard]] auto threshold() const noexcept -> std::size_t;

    private:

        std::size_t m_valid_count;
        std::size_t m_threshold;
    };

    class already_initialized_error : public trust_error
    {
    public:

        already_initialized_error(std::string_view gun);
        ~already_initialized_error() override = default;
    };

    class not_initialized_error : public trust_error
    {
    public:

        not_initialized_error(std::string_view gun);
        ~not_initialized_error() override = default;
    };

    /**
     * Error raised when using a session left in the failed state by an unrecoverable error.
     */
    class session_failed_error : public trust_error
    {
    public:

        session_failed_error(std::string_view gun, std::string_view reason);
        ~session_failed_error() override = default;
    };

    /**
     * Error raised when a root key is unknown to the key custody.
     */
    class invalid_root_keys_error : public trust_error
    {
    public:

        invalid_root_keys_error(std::string_view key_id);
        ~invalid_root_keys_error() override = default;
    };

    /**
     * Error raised when a role name or its keys and threshold are not acceptable.
     */
    class role_error : public trust_error
    {
    public:

        role_error(std::string_view role, std::string_view reason);
        ~role_error() override = default;
    };

    /**
     * Error raised when a staged change is malformed.
     */
    class invalid_change_error : public trust_error
    {
    public:

        invalid_change_error(std::string_view reason, trust_error_details details = {});
        ~invalid_change_error() override = default;
    };

    /**
     * Error raised when wrong metadata are spotted in a role document.
     */
    class role_metadata_error : public trust_error
    {
    public:

        role_metadata_error(std::string_view reason, std::string_view role = {});
        ~role_metadata_error() override = default;
    };

    /**
     * Error raised when an operation is not available in the current configuration.
     *
     * Retrying cannot succeed.
     */
    class unimplemented_error : public trust_error
    {
    public:

        unimplemented_error(std::string_view operation, std::string_view reason);
        ~unimplemented_error() override = default;
    };

    /**
     * Error raised by a remote collaborator, carried unchanged.
     */
    class transport_error : public trust_error
    {
    public:

        transport_error(std::string_view message);
        ~transport_error() override = default;
    };

    class cancelled_error : public trust_error
    {
    public:

        cancelled_error(std::string_view operation);
        ~cancelled_error() override = default;
    };

    /**
     * Error raised when a cryptographic primitive fails.
     */
    class crypto_error : public trust_error
    {
    public:

        crypto_error(std::string_view reason, std::string_view key_id = {});
        ~crypto_error() override = default;
    };
}
#endif
