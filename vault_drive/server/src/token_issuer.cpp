#include "token_issuer.hpp"

#include "base64.hpp"
#include "errors.hpp"

#include <openssl/crypto.h>
#include <openssl/hmac.h>

#include <array>
#include <cctype>
#include <chrono>
#include <sstream>

namespace {

std::string extract_json_string(const std::string& payload, const std::string& key) {
    const std::string pattern = "\"" + key + "\":\"";
    const auto pos = payload.find(pattern);
    if (pos == std::string::npos) {
        return {};
    }
    std::string value;
    for (auto idx = pos + pattern.size(); idx < payload.size(); ++idx) {
        const char ch = payload[idx];
        if (ch == '\\' && idx + 1 < payload.size()) {
            value.push_back(payload[++idx]);
            continue;
        }
        if (ch == '"') {
            return value;
        }
        value.push_back(ch);
    }
    return {};
}

std::uint64_t extract_json_number(const std::string& payload, const std::string& key) {
    const std::string pattern = "\"" + key + "\":";
    const auto pos = payload.find(pattern);
    if (pos == std::string::npos) {
        return 0;
    }
    std::size_t idx = pos + pattern.size();
    while (idx < payload.size() && std::isspace(static_cast<unsigned char>(payload[idx]))) {
        ++idx;
    }
    std::size_t end = idx;
    while (end < payload.size() && std::isdigit(static_cast<unsigned char>(payload[end]))) {
        ++end;
    }
    if (end == idx) {
        return 0;
    }
    return std::stoull(payload.substr(idx, end - idx));
}

std::uint64_t now_seconds() {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

}  // namespace

namespace vault::server {

std::string join_url(std::initializer_list<std::string_view> parts) {
    std::string joined;
    std::size_t index = 0;
    for (const auto part : parts) {
        joined.append(part);
        ++index;
        if (index != parts.size() && (part.empty() || part.back() != '/')) {
            joined.push_back('/');
        }
    }
    return joined;
}

TokenIssuer::TokenIssuer(TokenOptions options) : options_(std::move(options)) {}

std::string TokenIssuer::escape_json(const std::string& raw) {
    std::string escaped;
    escaped.reserve(raw.size());
    for (char ch : raw) {
        if (ch == '"' || ch == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

std::string TokenIssuer::sign(const std::string& signing_input) const {
    if (options_.transfer_shared_secret.empty()) {
        throw UploadError(ErrorCode::kTokenSigning, "error signing transfer token", "no shared secret configured");
    }
    unsigned int len = 0;
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    const auto* result =
        HMAC(EVP_sha256(), options_.transfer_shared_secret.data(),
             static_cast<int>(options_.transfer_shared_secret.size()),
             reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), digest.data(), &len);
    if (result == nullptr) {
        throw UploadError(ErrorCode::kTokenSigning, "error signing transfer token", "HMAC-SHA256 failed");
    }
    return util::base64url_encode(std::string_view(reinterpret_cast<const char*>(digest.data()), len));
}

std::string TokenIssuer::issue(const std::string& target) const {
    const auto now = now_seconds();
    const auto exp = now + options_.transfer_expires;

    const std::string header = R"({"alg":"HS256","typ":"JWT"})";
    std::ostringstream payload;
    payload << "{\"aud\":\"" << escape_json(options_.audience) << "\","
            << "\"exp\":" << exp << ","
            << "\"iat\":" << now << ","
            << "\"iss\":\"" << escape_json(options_.issuer) << "\","
            << "\"target\":\"" << escape_json(target) << "\"}";

    const std::string signing_input = util::base64url_encode(header) + "." + util::base64url_encode(payload.str());
    return signing_input + "." + sign(signing_input);
}

std::optional<TransferClaims> TokenIssuer::verify(const std::string& token) const {
    const auto first_dot = token.find('.');
    if (first_dot == std::string::npos) {
        return std::nullopt;
    }
    const auto second_dot = token.find('.', first_dot + 1);
    if (second_dot == std::string::npos) {
        return std::nullopt;
    }

    const std::string header_part = token.substr(0, first_dot);
    const std::string payload_part = token.substr(first_dot + 1, second_dot - first_dot - 1);
    const std::string signature_part = token.substr(second_dot + 1);

    std::string decoded_header;
    std::string payload;
    try {
        decoded_header = util::base64url_decode(header_part);
        payload = util::base64url_decode(payload_part);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    if (decoded_header.find("\"HS256\"") == std::string::npos) {
        return std::nullopt;
    }

    const std::string expected_signature = sign(header_part + "." + payload_part);
    if (expected_signature.size() != signature_part.size() ||
        CRYPTO_memcmp(expected_signature.data(), signature_part.data(), expected_signature.size()) != 0) {
        return std::nullopt;
    }

    TransferClaims claims;
    claims.issuer = extract_json_string(payload, "iss");
    claims.audience = extract_json_string(payload, "aud");
    claims.target = extract_json_string(payload, "target");
    claims.issued_at = extract_json_number(payload, "iat");
    claims.expires_at = extract_json_number(payload, "exp");

    if (claims.target.empty() || claims.expires_at == 0 || claims.audience != options_.audience) {
        return std::nullopt;
    }
    if (claims.expires_at < now_seconds()) {
        return std::nullopt;
    }
    return claims;
}

std::string TokenIssuer::upload_url(const std::string& upload_id) const {
    const std::string target = join_url({options_.download_endpoint, "tus/", upload_id});
    return join_url({options_.data_gateway_endpoint, issue(target)});
}

}  // namespace vault::server
