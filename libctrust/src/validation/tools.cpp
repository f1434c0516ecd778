// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdint>
#include <memory>
#include <regex>
#include <utility>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>

#include "ctrust/core/logging.hpp"
#include "ctrust/util/cryptography.hpp"
#include "ctrust/util/encoding.hpp"
#include "ctrust/validation/errors.hpp"
#include "ctrust/validation/tools.hpp"

namespace ctrust::validation
{
    namespace
    {
        struct EVPKeyDeleter
        {
            void operator()(::EVP_PKEY* ptr) const
            {
                ::EVP_PKEY_free(ptr);
            }
        };

        struct EVPKeyContextDeleter
        {
            void operator()(::EVP_PKEY_CTX* ptr) const
            {
                ::EVP_PKEY_CTX_free(ptr);
            }
        };

        struct EVPMDContextDeleter
        {
            void operator()(::EVP_MD_CTX* ptr) const
            {
                ::EVP_MD_CTX_free(ptr);
            }
        };

        using evp_key_ptr = std::unique_ptr<::EVP_PKEY, EVPKeyDeleter>;
        using evp_key_ctx_ptr = std::unique_ptr<::EVP_PKEY_CTX, EVPKeyContextDeleter>;
        using evp_md_ctx_ptr = std::unique_ptr<::EVP_MD_CTX, EVPMDContextDeleter>;

        template <size_t S, class B>
        [[nodiscard]] auto hex_to_bytes_arr(const B& buffer, int& error_code) noexcept
            -> std::array<std::byte, S>
        {
            auto out = std::array<std::byte, S>{};
            auto err = util::EncodingError::Ok;
            if (buffer.size() != 2 * S)
            {
                error_code = 1;
                return out;
            }
            util::hex_to_bytes_to(buffer, out.data(), err);
            error_code = err != util::EncodingError::Ok;
            return out;
        }

        [[nodiscard]] auto to_hex(const std::vector<unsigned char>& bytes) -> std::string
        {
            const auto data = reinterpret_cast<const std::byte*>(bytes.data());
            return util::bytes_to_hex_str(data, data + bytes.size());
        }

        [[nodiscard]] auto from_hex(std::string_view hex, int& error_code) -> std::vector<unsigned char>
        {
            auto bytes = util::hex_to_bytes(hex);
            if (!bytes)
            {
                error_code = 1;
                return {};
            }
            error_code = 0;
            const auto data = reinterpret_cast<const unsigned char*>(bytes->data());
            return { data, data + bytes->size() };
        }
    }

    auto sha256_hex(std::string_view data) -> std::string
    {
        auto hasher = util::Sha256Hasher();
        return hasher.str_hex_str(data);
    }

    auto ed25519_sig_hex_to_bytes(const std::string& sig_hex, int& error_code) noexcept
        -> std::array<std::byte, CTRUST_ED25519_SIGSIZE_BYTES>
    {
        return hex_to_bytes_arr<CTRUST_ED25519_SIGSIZE_BYTES>(sig_hex, error_code);
    }

    auto ed25519_key_hex_to_bytes(const std::string& key_hex, int& error_code) noexcept
        -> std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES>
    {
        return hex_to_bytes_arr<CTRUST_ED25519_KEYSIZE_BYTES>(key_hex, error_code);
    }

    auto generate_ed25519_keypair(std::byte* pk, std::byte* sk) -> int
    {
        std::size_t key_len = CTRUST_ED25519_KEYSIZE_BYTES;
        auto pctx = evp_key_ctx_ptr(::EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
        if (!pctx)
        {
            LOG_DEBUG << "Failed to create ED25519 key generation context";
            return 0;
        }

        int gen_status = ::EVP_PKEY_keygen_init(pctx.get());
        if (gen_status != 1)
        {
            LOG_DEBUG << "Failed to initialize ED25519 key pair generation";
            return gen_status;
        }

        ::EVP_PKEY* raw_key = nullptr;
        gen_status = ::EVP_PKEY_keygen(pctx.get(), &raw_key);
        auto pkey = evp_key_ptr(raw_key);
        if (gen_status != 1)
        {
            LOG_DEBUG << "Failed to generate ED25519 key pair";
            return gen_status;
        }

        int storage_status = ::EVP_PKEY_get_raw_public_key(
            pkey.get(),
            reinterpret_cast<unsigned char*>(pk),
            &key_len
        );
        if (storage_status != 1)
        {
            LOG_DEBUG << "Failed to store public key of generated ED25519 key pair";
            return storage_status;
        }
        storage_status = ::EVP_PKEY_get_raw_private_key(
            pkey.get(),
            reinterpret_cast<unsigned char*>(sk),
            &key_len
        );
        if (storage_status != 1)
        {
            LOG_DEBUG << "Failed to store private key of generated ED25519 key pair";
            return storage_status;
        }

        return 1;
    }

    auto generate_ed25519_keypair() -> std::pair<
        std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES>,
        std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES>>
    {
        std::array<std::byte, CTRUST_ED25519_KEYSIZE_BYTES> pk, sk;
        if (generate_ed25519_keypair(pk.data(), sk.data()) != 1)
        {
            throw crypto_error("ED25519 key pair generation failed");
        }
        return { pk, sk };
    }

    auto generate_ed25519_keypair_hex() -> std::pair<std::string, std::string>
    {
        auto [pk, sk] = generate_ed25519_keypair();
        return {
            util::bytes_to_hex_str(pk.data(), pk.data() + pk.size()),
            util::bytes_to_hex_str(sk.data(), sk.data() + sk.size()),
        };
    }

    auto generate_ecdsa_keypair_hex() -> std::pair<std::string, std::string>
    {
        auto pctx = evp_key_ctx_ptr(::EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
        if (!pctx || ::EVP_PKEY_keygen_init(pctx.get()) != 1)
        {
            LOG_DEBUG << "Failed to initialize ECDSA key pair generation";
            return {};
        }
        if (::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(), NID_X9_62_prime256v1) != 1)
        {
            LOG_DEBUG << "Failed to select the P-256 curve";
            return {};
        }

        ::EVP_PKEY* raw_key = nullptr;
        const int gen_status = ::EVP_PKEY_keygen(pctx.get(), &raw_key);
        auto pkey = evp_key_ptr(raw_key);
        if (gen_status != 1)
        {
            LOG_DEBUG << "Failed to generate ECDSA key pair";
            return {};
        }

        const int pub_len = ::i2d_PUBKEY(pkey.get(), nullptr);
        const int priv_len = ::i2d_PrivateKey(pkey.get(), nullptr);
        if (pub_len <= 0 || priv_len <= 0)
        {
            LOG_DEBUG << "Failed to encode generated ECDSA key pair";
            return {};
        }

        auto pub = std::vector<unsigned char>(static_cast<std::size_t>(pub_len));
        auto priv = std::vector<unsigned char>(static_cast<std::size_t>(priv_len));
        unsigned char* pub_out = pub.data();
        unsigned char* priv_out = priv.data();
        ::i2d_PUBKEY(pkey.get(), &pub_out);
        ::i2d_PrivateKey(pkey.get(), &priv_out);

        return { to_hex(pub), to_hex(priv) };
    }

    auto sign(std::string_view data, const std::byte* sk, std::byte* signature) -> int
    {
        auto ed_key = evp_key_ptr(::EVP_PKEY_new_raw_private_key(
            EVP_PKEY_ED25519,
            nullptr,
            reinterpret_cast<const unsigned char*>(sk),
            CTRUST_ED25519_KEYSIZE_BYTES
        ));
        if (!ed_key)
        {
            LOG_DEBUG << "Failed to read secret key raw buffer during signing step";
            return 0;
        }

        auto md_ctx = evp_md_ctx_ptr(::EVP_MD_CTX_new());
        int init_status = ::EVP_DigestSignInit(md_ctx.get(), nullptr, nullptr, nullptr, ed_key.get());
        if (init_status != 1)
        {
            LOG_DEBUG << "Failed to init signing step";
            return init_status;
        }

        std::size_t sig_len = CTRUST_ED25519_SIGSIZE_BYTES;
        int sign_status = ::EVP_DigestSign(
            md_ctx.get(),
            reinterpret_cast<unsigned char*>(signature),
            &sig_len,
            reinterpret_cast<const unsigned char*>(data.data()),
            data.size()
        );
        if (sign_status != 1)
        {
            LOG_DEBUG << "Failed to sign the data";
            return sign_status;
        }
        return 1;
    }

    auto sign(std::string_view data, const std::string& sk, std::string& signature) -> int
    {
        int error_code = 0;

        auto bin_sk = ed25519_key_hex_to_bytes(sk, error_code);
        if (error_code != 0)
        {
            LOG_DEBUG << "Invalid secret key";
            return 0;
        }

        std::array<std::byte, CTRUST_ED25519_SIGSIZE_BYTES> sig;
        error_code = sign(data, bin_sk.data(), sig.data());
        signature = util::bytes_to_hex_str(sig.data(), sig.data() + sig.size());

        return error_code;
    }

    auto sign_ecdsa(std::string_view data, const std::string& sk, std::string& signature) -> int
    {
        int error_code = 0;
        const auto der = from_hex(sk, error_code);
        if (error_code != 0)
        {
            LOG_DEBUG << "Invalid ECDSA secret key encoding";
            return 0;
        }

        const unsigned char* der_in = der.data();
        auto ec_key = evp_key_ptr(::d2i_AutoPrivateKey(nullptr, &der_in, static_cast<long>(der.size())));
        if (!ec_key)
        {
            LOG_DEBUG << "Failed to read ECDSA secret key during signing step";
            return 0;
        }

        auto md_ctx = evp_md_ctx_ptr(::EVP_MD_CTX_new());
        if (::EVP_DigestSignInit(md_ctx.get(), nullptr, ::EVP_sha256(), nullptr, ec_key.get()) != 1)
        {
            LOG_DEBUG << "Failed to init ECDSA signing step";
            return 0;
        }

        const auto* raw_data = reinterpret_cast<const unsigned char*>(data.data());
        std::size_t sig_len = 0;
        if (::EVP_DigestSign(md_ctx.get(), nullptr, &sig_len, raw_data, data.size()) != 1)
        {
            LOG_DEBUG << "Failed to compute ECDSA signature size";
            return 0;
        }

        auto sig = std::vector<unsigned char>(sig_len);
        if (::EVP_DigestSign(md_ctx.get(), sig.data(), &sig_len, raw_data, data.size()) != 1)
        {
            LOG_DEBUG << "Failed to sign the data with ECDSA";
            return 0;
        }
        sig.resize(sig_len);
        signature = to_hex(sig);
        return 1;
    }

    auto
    verify(const std::byte* data, std::size_t data_len, const std::byte* pk, const std::byte* signature)
        -> int
    {
        auto ed_key = evp_key_ptr(::EVP_PKEY_new_raw_public_key(
            EVP_PKEY_ED25519,
            nullptr,
            reinterpret_cast<const unsigned char*>(pk),
            CTRUST_ED25519_KEYSIZE_BYTES
        ));
        if (!ed_key)
        {
            LOG_DEBUG << "Failed to read public key raw buffer during verification step";
            return 0;
        }

        auto md_ctx = evp_md_ctx_ptr(::EVP_MD_CTX_new());
        int init_status = ::EVP_DigestVerifyInit(md_ctx.get(), nullptr, nullptr, nullptr, ed_key.get());
        if (init_status != 1)
        {
            LOG_DEBUG << "Failed to init verification step";
            return init_status;
        }

        int verif_status = ::EVP_DigestVerify(
            md_ctx.get(),
            reinterpret_cast<const unsigned char*>(signature),
            CTRUST_ED25519_SIGSIZE_BYTES,
            reinterpret_cast<const unsigned char*>(data),
            data_len
        );
        if (verif_status != 1)
        {
            LOG_DEBUG << "Failed to verify the data signature";
            return verif_status;
        }
        return 1;
    }

    auto verify(std::string_view data, const std::byte* pk, const std::byte* signature) -> int
    {
        auto raw_data = reinterpret_cast<const std::byte*>(data.data());
        return verify(raw_data, data.size(), pk, signature);
    }

    auto verify(std::string_view data, const std::string& pk, const std::string& signature) -> int
    {
        int error_code = 0;
        auto bin_signature = ed25519_sig_hex_to_bytes(signature, error_code);
        if (error_code != 0)
        {
            LOG_DEBUG << "Invalid signature '" << signature << "' for public key '" << pk << "'";
            return 0;
        }

        auto bin_pk = ed25519_key_hex_to_bytes(pk, error_code);
        if (error_code != 0)
        {
            LOG_DEBUG << "Invalid public key '" << pk << "'";
            return 0;
        }

        return verify(data, bin_pk.data(), bin_signature.data());
    }

    auto verify_ecdsa(std::string_view data, const std::string& pk, const std::string& signature)
        -> int
    {
        int key_error = 0;
        int sig_error = 0;
        const auto der = from_hex(pk, key_error);
        const auto sig = from_hex(signature, sig_error);
        if (key_error != 0 || sig_error != 0 || der.empty() || sig.empty())
        {
            LOG_DEBUG << "Invalid ECDSA public key or signature encoding";
            return 0;
        }

        const unsigned char* der_in = der.data();
        auto ec_key = evp_key_ptr(::d2i_PUBKEY(nullptr, &der_in, static_cast<long>(der.size())));
        if (!ec_key)
        {
            LOG_DEBUG << "Failed to read ECDSA public key '" << pk << "'";
            return 0;
        }

        auto md_ctx = evp_md_ctx_ptr(::EVP_MD_CTX_new());
        if (::EVP_DigestVerifyInit(md_ctx.get(), nullptr, ::EVP_sha256(), nullptr, ec_key.get()) != 1)
        {
            LOG_DEBUG << "Failed to init ECDSA verification step";
            return 0;
        }

        const int verif_status = ::EVP_DigestVerify(
            md_ctx.get(),
            sig.data(),
            sig.size(),
            reinterpret_cast<const unsigned char*>(data.data()),
            data.size()
        );
        if (verif_status != 1)
        {
            LOG_DEBUG << "Failed to verify the data ECDSA signature";
            return 0;
        }
        return 1;
    }

    auto generate_private_key(key_algorithm algo) -> PrivateKey
    {
        switch (algo)
        {
            case key_algorithm::ed25519:
            {
                auto [pk, sk] = generate_ed25519_keypair_hex();
                return Ed25519PrivateKey{ std::move(pk), std::move(sk) };
            }
            case key_algorithm::ecdsa:
            {
                auto [pk, sk] = generate_ecdsa_keypair_hex();
                if (pk.empty() || sk.empty())
                {
                    throw crypto_error("ECDSA key pair generation failed");
                }
                return EcdsaPrivateKey{ std::move(pk), std::move(sk) };
            }
        }
        throw crypto_error("unsupported key algorithm");
    }

    auto sign_payload(const PrivateKey& key, std::string_view payload) -> std::string
    {
        std::string signature;
        int status = 0;
        if (const auto* ed = std::get_if<Ed25519PrivateKey>(&key))
        {
            status = sign(payload, ed->private_keyval, signature);
        }
        else if (const auto* ec = std::get_if<EcdsaPrivateKey>(&key))
        {
            status = sign_ecdsa(payload, ec->private_keyval, signature);
        }

        if (status != 1)
        {
            const auto id = key_id(public_key_of(key));
            LOG_ERROR << "Failed to sign payload with key '" << id << "'";
            throw crypto_error("signing failed", id);
        }
        return signature;
    }

    auto verify_signature(const PublicKey& key, std::string_view payload, std::string_view signature_hex)
        -> bool
    {
        const auto sig = std::string(signature_hex);
        switch (algorithm_of(key))
        {
            case key_algorithm::ed25519:
                return verify(payload, keyval_of(key), sig) == 1;
            case key_algorithm::ecdsa:
                return verify_ecdsa(payload, keyval_of(key), sig) == 1;
        }
        return false;
    }

    auto format_timestamp(std::chrono::system_clock::time_point tp) -> std::string
    {
        const auto time = std::chrono::system_clock::to_time_t(tp);
        return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(time));
    }

    auto expiration_from_now(std::chrono::seconds duration) -> std::string
    {
        return format_timestamp(std::chrono::system_clock::now() + duration);
    }

    void check_timestamp_metadata_format(const std::string& ts)
    {
        std::regex timestamp_re("^[0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}Z$");

        if (!std::regex_match(ts, timestamp_re))
        {
            LOG_ERROR << "Invalid timestamp format '" << ts
                      << "', should be UTC ISO8601 ('<YYYY>-<MM>-<DD>T<HH>:<MM>:<SS>Z')";
            throw role_metadata_error("invalid timestamp '" + ts + "'");
        }
    }

    auto to_count(const nlohmann::json& value) -> std::optional<std::size_t>
    {
        if (value.is_number_unsigned())
        {
            return value.get<std::size_t>();
        }
        if (value.is_number_integer() && value.get<std::int64_t>() >= 0)
        {
            return static_cast<std::size_t>(value.get<std::int64_t>());
        }
        return std::nullopt;
    }

    auto get_count(const nlohmann::json& j, std::string_view field, std::string_view role)
        -> std::size_t
    {
        const auto it = j.find(std::string(field));
        if (it == j.end())
        {
            throw role_metadata_error(fmt::format("missing '{}' field", field), role);
        }
        if (const auto count = to_count(*it))
        {
            return *count;
        }
        LOG_ERROR << "Invalid '" << field << "' value in metadata: " << it->dump();
        throw role_metadata_error(
            fmt::format("'{}' must be a non-negative integer, got {}", field, it->dump()),
            role
        );
    }
}
