// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>
#include <string_view>

#include <fmt/format.h>
#include <openssl/evp.h>

#include "ctrust/util/cryptography.hpp"

namespace ctrust::util::detail
{
    namespace
    {
        [[nodiscard]] auto message_digest(EVPDigester::Algorithm algo) -> const ::EVP_MD*
        {
            switch (algo)
            {
                case EVPDigester::Algorithm::sha256:
                    return ::EVP_sha256();
                case EVPDigester::Algorithm::sha512:
                    return ::EVP_sha512();
            }
            return nullptr;
        }

        void check_status(int status, std::string_view operation)
        {
            if (status != 1)
            {
                throw std::runtime_error(fmt::format("OpenSSL digest {} failed", operation));
            }
        }
    }

    void EVPDigester::EVPContextDeleter::operator()(::EVP_MD_CTX* ptr) const
    {
        ::EVP_MD_CTX_free(ptr);
    }

    EVPDigester::EVPDigester(Algorithm algo)
        : m_ctx(::EVP_MD_CTX_new())
        , m_algorithm(algo)
    {
        if (!m_ctx)
        {
            throw std::runtime_error("Cannot allocate an OpenSSL digest context");
        }
    }

    void EVPDigester::digest_start()
    {
        check_status(::EVP_DigestInit_ex(m_ctx.get(), message_digest(m_algorithm), nullptr), "initialization");
    }

    void EVPDigester::digest_update(const std::byte* buffer, std::size_t count)
    {
        check_status(::EVP_DigestUpdate(m_ctx.get(), buffer, count), "update");
    }

    void EVPDigester::digest_finalize_to(std::byte* hash)
    {
        check_status(
            ::EVP_DigestFinal_ex(m_ctx.get(), reinterpret_cast<unsigned char*>(hash), nullptr),
            "finalization"
        );
    }
}
