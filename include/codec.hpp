#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <vector>
#include <optional>
#include <iomanip>
#include <sstream>
#include <boost/json.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace pea {

// Text encodings, digests and signature checks shared by the agent components.
class Codec {
public:
    static std::string to_hex(const unsigned char* data, size_t len) {
        std::stringstream ss;
        for (size_t i = 0; i < len; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
        }
        return ss.str();
    }

    static std::string to_hex(const std::vector<unsigned char>& data) {
        return to_hex(data.data(), data.size());
    }

    // Hex SHA-256 of an arbitrary byte string.
    static std::string sha256_hex(const std::string& data) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
        return to_hex(hash, SHA256_DIGEST_LENGTH);
    }

    static std::string base64_encode(const unsigned char* data, size_t len) {
        std::string out;
        out.resize(boost::beast::detail::base64::encoded_size(len));
        out.resize(boost::beast::detail::base64::encode(&out[0], data, len));
        return out;
    }

    static std::string base64_encode(const std::vector<unsigned char>& data) {
        return base64_encode(data.data(), data.size());
    }

    static std::string base64_encode(const std::string& data) {
        return base64_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    }

    /**
     * Decodes standard base64 (padding optional).
     * @return std::nullopt if the input contains characters outside the alphabet.
     */
    static std::optional<std::vector<unsigned char>> base64_decode(const std::string& input) {
        size_t len = input.size();
        while (len > 0 && input[len - 1] == '=') --len;

        // Rounded up so an unpadded final group still fits.
        std::vector<unsigned char> out(boost::beast::detail::base64::decoded_size(len + 3));
        auto result = boost::beast::detail::base64::decode(out.data(), input.data(), len);
        if (result.second != len) return std::nullopt;
        out.resize(result.first);
        return out;
    }

    // Decodes the URL-safe alphabet used by JWT segments.
    static std::optional<std::vector<unsigned char>> base64url_decode(const std::string& input) {
        std::string standard(input);
        std::replace(standard.begin(), standard.end(), '-', '+');
        std::replace(standard.begin(), standard.end(), '_', '/');
        return base64_decode(standard);
    }

    /**
     * Verifies an Ed25519 signature over a message.
     * Used by tests and by diagnostics to check the agent's own signatures.
     */
    static bool verify_ed25519(const std::vector<unsigned char>& pubkey,
                               const std::string& message,
                               const std::vector<unsigned char>& signature) {
        if (pubkey.size() != 32 || signature.size() != 64) return false;

        EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, NULL, pubkey.data(), pubkey.size());
        if (!pkey) return false;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        bool result = false;

        if (ctx && EVP_DigestVerifyInit(ctx, NULL, NULL, NULL, pkey) == 1) {
            if (EVP_DigestVerify(ctx, signature.data(), signature.size(),
                                 reinterpret_cast<const unsigned char*>(message.data()), message.size()) == 1) {
                result = true;
            }
        }

        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        return result;
    }

    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    /**
     * JSON parsing with a recursion depth limit, for server responses and token claims.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
