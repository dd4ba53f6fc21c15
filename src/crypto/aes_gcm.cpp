#include "tallow/crypto/aes_gcm.hpp"
#include "tallow/crypto/sodium_interop.hpp"
#include "tallow/core/constants.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <format>
#include <memory>
#include <string>
namespace tallow::transfer::crypto {
namespace {
    constexpr int kOpenSslSuccess = 1;

    struct EvpCipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

    std::string GetOpenSslError() {
        const unsigned long err = ERR_get_error();
        if (err == 0) {
            return "unknown OpenSSL error";
        }
        char buffer[kOpenSslErrorBufferBytes];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    Result<Unit, TransferFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    std::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    std::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    // Sets cipher, IV length, key/nonce and feeds the associated data.
    Result<EvpCipherCtxPtr, TransferFailure> PrepareContext(
        const bool encrypt,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<EvpCipherCtxPtr, TransferFailure>::Err(
                TransferFailure::Generic(
                    std::format("Failed to create cipher context: {}", GetOpenSslError())));
        }
        if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr,
                              encrypt ? 1 : 0) != kOpenSslSuccess) {
            return Result<EvpCipherCtxPtr, TransferFailure>::Err(
                TransferFailure::Generic(
                    std::format("Failed to initialize AES-256-GCM: {}", GetOpenSslError())));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != kOpenSslSuccess) {
            return Result<EvpCipherCtxPtr, TransferFailure>::Err(
                TransferFailure::Generic(
                    std::format("Failed to set nonce length: {}", GetOpenSslError())));
        }
        if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(),
                              encrypt ? 1 : 0) != kOpenSslSuccess) {
            return Result<EvpCipherCtxPtr, TransferFailure>::Err(
                TransferFailure::Generic(
                    std::format("Failed to set key and nonce: {}", GetOpenSslError())));
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            if (EVP_CipherUpdate(ctx.get(), nullptr, &outlen, associated_data.data(),
                                 static_cast<int>(associated_data.size())) != kOpenSslSuccess) {
                return Result<EvpCipherCtxPtr, TransferFailure>::Err(
                    TransferFailure::Generic(
                        std::format("Failed to add associated data: {}", GetOpenSslError())));
            }
        }
        return Result<EvpCipherCtxPtr, TransferFailure>::Ok(std::move(ctx));
    }
}

Result<std::vector<uint8_t>, TransferFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    using BytesResult = Result<std::vector<uint8_t>, TransferFailure>;
    TALLOW_TRY(ValidateKeyAndNonce(key, nonce));
    auto ctx_result = PrepareContext(true, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != kOpenSslSuccess) {
        WipeQuietly(output);
        return BytesResult::Err(
            TransferFailure::Generic(std::format("Encryption failed: {}", GetOpenSslError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != kOpenSslSuccess) {
        WipeQuietly(output);
        return BytesResult::Err(
            TransferFailure::Generic(
                std::format("Encryption finalization failed: {}", GetOpenSslError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != kOpenSslSuccess) {
        WipeQuietly(output);
        return BytesResult::Err(
            TransferFailure::Generic(
                std::format("Failed to get authentication tag: {}", GetOpenSslError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return BytesResult::Ok(std::move(output));
}

Result<std::vector<uint8_t>, TransferFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    using BytesResult = Result<std::vector<uint8_t>, TransferFailure>;
    TALLOW_TRY(ValidateKeyAndNonce(key, nonce));
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return BytesResult::Err(
            TransferFailure::InvalidInput(
                std::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                            ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    auto ctx_result = PrepareContext(false, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return BytesResult::Err(std::move(ctx_result).UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != kOpenSslSuccess) {
        WipeQuietly(output);
        return BytesResult::Err(
            TransferFailure::Generic(std::format("Decryption failed: {}", GetOpenSslError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kAesGcmTagBytes),
                            tag.data()) != kOpenSslSuccess) {
        WipeQuietly(output);
        return BytesResult::Err(
            TransferFailure::Generic(
                std::format("Failed to set authentication tag: {}", GetOpenSslError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != kOpenSslSuccess) {
        WipeQuietly(output);
        return BytesResult::Err(
            TransferFailure::Authentication("Authentication tag verification failed"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return BytesResult::Ok(std::move(output));
}
}
