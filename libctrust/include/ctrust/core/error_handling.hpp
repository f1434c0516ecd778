// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_CORE_ERROR_HANDLING_HPP
#define CTRUST_CORE_ERROR_HANDLING_HPP

#include <any>
#include <stdexcept>
#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace ctrust
{

    /*********************
     * ctrust exceptions *
     *********************/

    enum class ctrust_error_code
    {
        unknown,
        aggregated,
        invalid_configuration,
        openssl_failed,
        internal_failure,
    };

    class ctrust_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        ctrust_error(const std::string& msg, ctrust_error_code ec);
        ctrust_error(const char* msg, ctrust_error_code ec);
        ctrust_error(const std::string& msg, ctrust_error_code ec, std::any&& data);

        ctrust_error_code error_code() const noexcept;
        const std::any& data() const noexcept;

    private:

        ctrust_error_code m_error_code;
        std::any m_data;
    };

    class ctrust_aggregated_error : public ctrust_error
    {
    public:

        using base_type = ctrust_error;
        using error_list_t = std::vector<ctrust_error>;

        explicit ctrust_aggregated_error(error_list_t&& error_list);

        const char* what() const noexcept override;

        const error_list_t& errors() const noexcept;

    private:

        error_list_t m_error_list;
        mutable std::string m_aggregated_message;
        static constexpr const char* m_base_message = "Multiple errors occurred:\n";
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = ctrust_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<ctrust_error> make_unexpected(const char* msg, ctrust_error_code ec);

    tl::unexpected<ctrust_error> make_unexpected(const std::string& msg, ctrust_error_code ec);

    tl::unexpected<ctrust_error> make_unexpected(std::vector<ctrust_error>&& error_list);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }
}

#endif
