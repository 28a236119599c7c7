// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include <beacon/pii/pii_redactor.hpp>

#include <utility>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <beacon/common/assert.hpp>
#include <beacon/common/string_utils.hpp>

namespace beacon {

namespace {

std::string openssl_error_message(const char* context) {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return std::string(context) + ": unknown OpenSSL error";
    }
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(context) + ": " + buf;
}

}  // namespace

std::string sha512_hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha512(), nullptr) != 1) {
        BEACON_THROW("{}", openssl_error_message("EVP_Digest(sha512)"));
    }
    return to_upper_hex(digest, digest_len);
}

PiiRedactor::PiiRedactor(std::shared_ptr<const ConfigProvider> config) : config_(std::move(config)) {
    BEACON_FATAL(config_ != nullptr, "PiiRedactor requires a configuration provider");
}

std::string PiiRedactor::redact(std::string_view plain_text) const {
    if (config_->get_bool(ConfigKey::DisablePiiProtection)) {
        return std::string(plain_text);
    }
    return sha512_hex(plain_text);
}

std::string PiiRedactor::redact(const char* plain_text) const {
    return redact(plain_text == nullptr ? std::string_view() : std::string_view(plain_text));
}

}  // namespace beacon
