// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "ctrust/core/error_handling.hpp"
#include "ctrust/core/logging.hpp"

namespace ctrust
{
    namespace
    {
        void maybe_log_failure(const char* msg, ctrust_error_code ec)
        {
            if (ec == ctrust_error_code::internal_failure || ec == ctrust_error_code::openssl_failed)
            {
                LOG_CRITICAL << msg;
            }
        }
    }

    ctrust_error::ctrust_error(const std::string& msg, ctrust_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
        maybe_log_failure(what(), m_error_code);
    }

    ctrust_error::ctrust_error(const char* msg, ctrust_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
        maybe_log_failure(what(), m_error_code);
    }

    ctrust_error::ctrust_error(const std::string& msg, ctrust_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
        maybe_log_failure(what(), m_error_code);
    }

    ctrust_error_code ctrust_error::error_code() const noexcept
    {
        return m_error_code;
    }

    const std::any& ctrust_error::data() const noexcept
    {
        return m_data;
    }

    ctrust_aggregated_error::ctrust_aggregated_error(error_list_t&& error_list)
        : base_type(ctrust_aggregated_error::m_base_message, ctrust_error_code::aggregated)
        , m_error_list(std::move(error_list))
        , m_aggregated_message()
    {
    }

    const char* ctrust_aggregated_error::what() const noexcept
    {
        if (m_aggregated_message.empty())
        {
            m_aggregated_message = m_base_message;

            for (const ctrust_error& er : m_error_list)
            {
                m_aggregated_message += er.what();
                m_aggregated_message += "\n";
            }
        }
        return m_aggregated_message.c_str();
    }

    auto ctrust_aggregated_error::errors() const noexcept -> const error_list_t&
    {
        return m_error_list;
    }

    tl::unexpected<ctrust_error> make_unexpected(const char* msg, ctrust_error_code ec)
    {
        return tl::make_unexpected(ctrust_error(msg, ec));
    }

    tl::unexpected<ctrust_error> make_unexpected(const std::string& msg, ctrust_error_code ec)
    {
        return tl::make_unexpected(ctrust_error(msg, ec));
    }

    tl::unexpected<ctrust_error> make_unexpected(std::vector<ctrust_error>&& error_list)
    {
        if (error_list.size() == 1)
        {
            return tl::make_unexpected(std::move(error_list.front()));
        }
        auto aggregated = ctrust_aggregated_error(std::move(error_list));
        // The individual errors are carried as data.
        return tl::make_unexpected(ctrust_error(
            aggregated.what(),
            ctrust_error_code::aggregated,
            std::any(aggregated.errors())
        ));
    }
}
