#include "tallow/crypto/hkdf.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <format>
#include <memory>

namespace tallow::transfer::crypto {

namespace {
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter>;

    Result<Unit, TransferFailure> RunHkdf(
        const char* mode,
        std::span<const uint8_t> key,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
        if (kdf == nullptr) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("Failed to fetch HKDF algorithm"));
        }
        EvpKdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
        EVP_KDF_free(kdf);
        if (!kctx) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("Failed to create HKDF context"));
        }

        OSSL_PARAM params[6];
        int param_idx = 0;
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_MODE, const_cast<char*>(mode), 0);
        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(key.data()), key.size());
        if (!salt.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
        }
        params[param_idx] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("HKDF key derivation failed"));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }
}

Result<Unit, TransferFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > kMaxOutputBytes) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("HKDF output size {} outside 1..{}", output.size(), kMaxOutputBytes)));
    }
    if (ikm.empty()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    return RunHkdf("EXTRACT_AND_EXPAND", ikm, output, salt, info);
}

Result<std::vector<uint8_t>, TransferFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, TransferFailure> Hkdf::DeriveLabeled(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::string_view label) {
    const std::span<const uint8_t> info(
        reinterpret_cast<const uint8_t*>(label.data()), label.size());
    return DeriveKeyBytes(ikm, output_size, salt, info);
}

Result<std::vector<uint8_t>, TransferFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {

    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidInput("HKDF input key material cannot be empty"));
    }
    std::vector<uint8_t> prk(kHashBytes);
    auto result = RunHkdf("EXTRACT_ONLY", ikm, prk, salt, {});
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(prk));
}

Result<Unit, TransferFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<uint8_t> output,
    std::span<const uint8_t> info) {

    if (prk.size() != kHashBytes) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("PRK must be exactly {} bytes", kHashBytes)));
    }
    if (output.empty() || output.size() > kMaxOutputBytes) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                std::format("HKDF output size {} outside 1..{}", output.size(), kMaxOutputBytes)));
    }
    return RunHkdf("EXPAND_ONLY", prk, output, {}, info);
}

}
