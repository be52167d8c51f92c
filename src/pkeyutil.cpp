#include "pkeyutil.hpp"

#include <vector>
#include <fstream>
#include <iterator>
#include <memory>
#include <format>
#include <cstdio>

#include <openssl/pem.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

namespace {
    struct EVP_PKEY_Deleter {
        void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
    };

    struct EVP_PKEY_CTX_Deleter {
        void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
    };

    struct FILE_Deleter {
        void operator()(FILE* f) const {
            if (f) fclose(f);
        }
    };

    using unique_EVP_PKEY = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
    using unique_EVP_PKEY_CTX = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
    using unique_FILE = std::unique_ptr<FILE, FILE_Deleter>;

    unique_EVP_PKEY load_private_key(const std::string& path) {
        unique_FILE key_file(fopen(path.c_str(), "r"));
        if (!key_file) {
            return nullptr;
        }
        return unique_EVP_PKEY(PEM_read_PrivateKey(key_file.get(), nullptr, nullptr, nullptr));
    }
}

namespace pkey {

std::expected<std::string, std::string> decrypt_file(std::string_view filename, std::string_view private_key_file) noexcept {
    try {
        std::ifstream encrypted_file(std::string(filename), std::ios::binary);
        if (!encrypted_file) {
            return std::unexpected(std::format("could not open encrypted file '{}'", filename));
        }

        const std::vector<unsigned char> encrypted_data(
            (std::istreambuf_iterator<char>(encrypted_file)),
            std::istreambuf_iterator<char>()
        );
        if (encrypted_data.empty()) {
            return std::unexpected(std::format("encrypted file '{}' is empty", filename));
        }

        const unique_EVP_PKEY private_key = load_private_key(std::string(private_key_file));
        if (!private_key) {
            return std::unexpected(std::format("failed to read private key '{}'", private_key_file));
        }

        const unique_EVP_PKEY_CTX dec_ctx(EVP_PKEY_CTX_new(private_key.get(), nullptr));
        if (!dec_ctx) {
            return std::unexpected("failed to create EVP_PKEY_CTX");
        }
        if (EVP_PKEY_decrypt_init(dec_ctx.get()) <= 0) {
            return std::unexpected("failed to initialize decryption");
        }
        if (EVP_PKEY_CTX_set_rsa_padding(dec_ctx.get(), RSA_PKCS1_PADDING) <= 0) {
            return std::unexpected("failed to set RSA padding");
        }

        size_t decrypted_len = 0;
        if (EVP_PKEY_decrypt(dec_ctx.get(), nullptr, &decrypted_len, encrypted_data.data(), encrypted_data.size()) <= 0) {
            return std::unexpected("failed to determine decrypted data length");
        }

        std::vector<unsigned char> decrypted(decrypted_len);
        if (EVP_PKEY_decrypt(dec_ctx.get(), decrypted.data(), &decrypted_len, encrypted_data.data(), encrypted_data.size()) <= 0) {
            return std::unexpected(std::format("decryption of '{}' failed", filename));
        }
        decrypted.resize(decrypted_len);

        return std::string(reinterpret_cast<const char*>(decrypted.data()), decrypted.size());
    } catch (const std::exception& e) {
        return std::unexpected(std::format("decryption of '{}' failed: {}", filename, e.what()));
    }
}

} // namespace pkey
