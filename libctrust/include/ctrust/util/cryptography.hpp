// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef CTRUST_UTIL_CRYPTOGRAPHY_HPP
#define CTRUST_UTIL_CRYPTOGRAPHY_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ctrust/util/encoding.hpp"

using EVP_MD_CTX = struct evp_md_ctx_st;  // OpenSSL impl

namespace ctrust::util
{
    /**
     * Provide high-level hashing functions over a digest hashing algorithm.
     */
    template <typename Digester>
    class DigestHasher
    {
    public:

        using digester_type = Digester;

        inline static constexpr std::size_t bytes_size = digester_type::bytes_size;
        inline static constexpr std::size_t hex_size = 2 * bytes_size;
        inline static constexpr std::size_t digest_size = digester_type::digest_size;

        using bytes_array = std::array<std::byte, bytes_size>;

        struct blob_type
        {
            const std::byte* data;
            std::size_t size;
        };

        /**
         * Hash a blob of data and write the hashed bytes to the provided output.
         */
        void blob_bytes_to(blob_type blob, std::byte* out);

        /**
         * Hash a blob of data and return the hashed bytes with hexadecimal encoding as a string.
         */
        [[nodiscard]] auto blob_hex_str(blob_type blob) -> std::string;

        /**
         * Hash a string and return the hashed bytes with hexadecimal encoding as a string.
         */
        [[nodiscard]] auto str_hex_str(std::string_view data) -> std::string;

        /**
         * Incrementally hash a stream and return the hashed bytes with hexadecimal encoding,
         * together with the number of bytes read.
         */
        [[nodiscard]] auto stream_hex_str(std::istream& in) -> std::pair<std::string, std::size_t>;

    private:

        std::vector<std::byte> m_digest_buffer = {};
        digester_type m_digester = {};
    };

    namespace detail
    {
        class EVPDigester
        {
        public:

            enum struct Algorithm
            {
                sha256,
                sha512
            };

            /// @throw std::runtime_error if OpenSSL cannot allocate a digest context.
            EVPDigester(Algorithm algo);

            /// Digest calls throw `std::runtime_error` on OpenSSL failures.
            void digest_start();
            void digest_update(const std::byte* buffer, std::size_t count);
            void digest_finalize_to(std::byte* hash);

        private:

            struct EVPContextDeleter
            {
                void operator()(::EVP_MD_CTX* ptr) const;
            };

            std::unique_ptr<::EVP_MD_CTX, EVPContextDeleter> m_ctx;
            Algorithm m_algorithm;
        };
    }

    class Sha256Digester : private detail::EVPDigester
    {
    public:

        inline static constexpr std::size_t bytes_size = 32;
        inline static constexpr std::size_t digest_size = 32768;

        using detail::EVPDigester::digest_start;
        using detail::EVPDigester::digest_update;
        using detail::EVPDigester::digest_finalize_to;

        Sha256Digester()
            : EVPDigester(detail::EVPDigester::Algorithm::sha256)
        {
        }
    };

    using Sha256Hasher = DigestHasher<Sha256Digester>;

    class Sha512Digester : private detail::EVPDigester
    {
    public:

        inline static constexpr std::size_t bytes_size = 64;
        inline static constexpr std::size_t digest_size = 32768;

        using detail::EVPDigester::digest_start;
        using detail::EVPDigester::digest_update;
        using detail::EVPDigester::digest_finalize_to;

        Sha512Digester()
            : EVPDigester(detail::EVPDigester::Algorithm::sha512)
        {
        }
    };

    using Sha512Hasher = DigestHasher<Sha512Digester>;

    /************************************
     *  Implementation of DigestHasher  *
     ************************************/

    template <typename D>
    void DigestHasher<D>::blob_bytes_to(blob_type blob, std::byte* out)
    {
        m_digester.digest_start();

        auto [iter, remaining] = blob;
        while (remaining > 0)
        {
            const auto taken = std::min(remaining, digest_size);
            m_digester.digest_update(iter, taken);
            remaining -= taken;
            iter += taken;
        }
        return m_digester.digest_finalize_to(out);
    }

    template <typename D>
    auto DigestHasher<D>::blob_hex_str(blob_type blob) -> std::string
    {
        auto bytes = bytes_array{};
        blob_bytes_to(blob, bytes.data());
        return bytes_to_hex_str(bytes.data(), bytes.data() + bytes.size());
    }

    template <typename D>
    auto DigestHasher<D>::str_hex_str(std::string_view data) -> std::string
    {
        return blob_hex_str({ reinterpret_cast<const std::byte*>(data.data()), data.size() });
    }

    template <typename D>
    auto DigestHasher<D>::stream_hex_str(std::istream& in) -> std::pair<std::string, std::size_t>
    {
        m_digest_buffer.assign(digest_size, std::byte(0));
        m_digester.digest_start();

        std::size_t total = 0;
        while (in)
        {
            in.read(reinterpret_cast<char*>(m_digest_buffer.data()), digest_size);
            const auto count = static_cast<std::size_t>(in.gcount());
            if (!count)
            {
                break;
            }
            total += count;
            m_digester.digest_update(m_digest_buffer.data(), count);
        }

        auto bytes = bytes_array{};
        m_digester.digest_finalize_to(bytes.data());
        return { bytes_to_hex_str(bytes.data(), bytes.data() + bytes.size()), total };
    }
}
#endif
