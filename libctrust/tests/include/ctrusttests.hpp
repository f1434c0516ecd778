// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUSTTESTS_HPP
#define CTRUSTTESTS_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ctrust/api/remote_store.hpp"
#include "ctrust/api/trust_session.hpp"
#include "ctrust/core/logging.hpp"
#include "ctrust/core/logging_tools.hpp"
#include "ctrust/validation/crypto_service.hpp"
#include "ctrust/validation/keys.hpp"
#include "ctrust/validation/targets.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrusttests
{
    inline constexpr std::string_view test_gun = "docker.io/library/app";

    /**
     * Custody holding one root key, and an optional remote store.
     */
    struct TrustFixture
    {
        ctrust::validation::MemoryCryptoService custody;
        ctrust::MemoryRemoteStore remote;
        std::string root_key_id;

        TrustFixture()
            : root_key_id(ctrust::validation::key_id(
                  custody.create("root", test_gun, ctrust::validation::key_algorithm::ed25519)
              ))
        {
        }

        auto make_session(bool with_remote = false) -> std::unique_ptr<ctrust::TrustSession>
        {
            return std::make_unique<ctrust::TrustSession>(
                std::string(test_gun),
                custody,
                with_remote ? &remote : nullptr
            );
        }

        auto make_initialized_session(bool with_remote = false)
            -> std::unique_ptr<ctrust::TrustSession>
        {
            auto session = make_session(with_remote);
            session->initialize({ root_key_id });
            return session;
        }

        /// A key for a delegation, stored in the custody when `in_custody`.
        auto make_delegation_key(std::string_view role, bool in_custody = true)
            -> ctrust::validation::PublicKey
        {
            if (in_custody)
            {
                return custody.create(role, test_gun, ctrust::validation::key_algorithm::ed25519);
            }
            return ctrust::validation::public_key_of(
                ctrust::validation::generate_private_key(ctrust::validation::key_algorithm::ed25519)
            );
        }
    };

    inline auto sample_target(std::string name, std::size_t length = 1024)
        -> ctrust::validation::Target
    {
        return { std::move(name), length, { { "sha256", "deadbeef" } } };
    }

    /**
     * Captures the log records emitted during its lifetime.
     */
    class ScopedLogCapture
    {
    public:

        explicit ScopedLogCapture(ctrust::log_level level = ctrust::log_level::trace)
            : m_previous_params(ctrust::logging::get_logging_params())
            , m_previous(ctrust::logging::set_log_handler(
                  &m_history,
                  ctrust::LoggingParams{ .logging_level = level }
              ))
        {
        }

        ~ScopedLogCapture()
        {
            ctrust::logging::set_log_handler(std::move(m_previous), m_previous_params);
        }

        ScopedLogCapture(const ScopedLogCapture&) = delete;
        ScopedLogCapture& operator=(const ScopedLogCapture&) = delete;

        auto records() const -> std::vector<ctrust::logging::LogRecord>
        {
            return m_history.capture_history();
        }

        auto contains(ctrust::log_level level, std::string_view text) const -> bool
        {
            for (const auto& record : records())
            {
                if (record.level == level && record.message.find(text) != std::string::npos)
                {
                    return true;
                }
            }
            return false;
        }

    private:

        ctrust::logging::LogHandler_History m_history;
        ctrust::LoggingParams m_previous_params;
        ctrust::logging::AnyLogHandler m_previous;
    };
}

#endif
