#pragma once

#include "config_loader.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace vault::server {

struct TransferClaims {
    std::string issuer;
    std::string audience;
    std::string target;
    std::uint64_t expires_at{};
    std::uint64_t issued_at{};
};

// Issues HS256-signed transfer tokens granting scoped access to one upload's bytes.
class TokenIssuer {
public:
    explicit TokenIssuer(TokenOptions options);

    std::string issue(const std::string& target) const;
    std::optional<TransferClaims> verify(const std::string& token) const;

    // Signed gateway URL for the upload: <gateway>/<token{target=<download>/tus/<id>}>.
    std::string upload_url(const std::string& upload_id) const;

private:
    std::string sign(const std::string& signing_input) const;
    static std::string escape_json(const std::string& raw);

    TokenOptions options_;
};

std::string join_url(std::initializer_list<std::string_view> parts);

}  // namespace vault::server
