#ifndef PKEYUTIL_HPP
#define PKEYUTIL_HPP

#include <string>
#include <string_view>
#include <expected>

namespace pkey {

inline constexpr std::string_view default_private_key = "private.pem";

/**
 * @brief Decrypts a file encrypted with an RSA public key (PKCS#1 v1.5 padding).
 *
 * Used by env::get for configuration values that name an ".enc" file, so
 * secrets such as a production allow-list need not sit in the environment in
 * clear text.
 *
 * @param filename The path to the encrypted file.
 * @param private_key_file The PEM private key matching the encrypting public key.
 * @return The decrypted text, or an error message.
 */
[[nodiscard]] std::expected<std::string, std::string> decrypt_file(
    std::string_view filename,
    std::string_view private_key_file = default_private_key) noexcept;

} // namespace pkey

#endif // PKEYUTIL_HPP
