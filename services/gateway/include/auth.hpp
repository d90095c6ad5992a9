#pragma once
#include <cstdint>
#include <map>
#include <string>

enum class AuthStatus {
    Ok,
    Missing,
    Expired,
    InvalidSignature,
};

// Reason body sent with the 401 response.
const char* to_string(AuthStatus status);

struct AuthConfig {
    std::string secret;             // empty disables authentication
    std::int64_t tolerance_secs{300};
};

// Lower-case hex HMAC-SHA256 of the timestamp string keyed by the secret.
std::string sign_timestamp(const std::string& secret, const std::string& ts);

// Checks the handshake parameters `ts` and `sig` (aliases `X-Api-Ts` and
// `X-Api-Sign`). A timestamp outside the tolerance window is Expired even
// when its signature is valid.
AuthStatus authenticate(const AuthConfig& cfg, const std::map<std::string, std::string>& params,
                        std::int64_t now);

// Splits and percent-decodes the query part of a request target.
std::map<std::string, std::string> parse_query_string(const std::string& target);
