#include "../include/auth.hpp"
#include "util.hpp"
#include <openssl/crypto.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>

const char* to_string(AuthStatus status) {
    switch (status) {
        case AuthStatus::Ok: return "ok";
        case AuthStatus::Missing: return "missing ts/sig";
        case AuthStatus::Expired: return "timestamp out of range";
        case AuthStatus::InvalidSignature: return "bad signature";
    }
    return "unauthorized";
}

std::string sign_timestamp(const std::string& secret, const std::string& ts) {
    return hmac_sha256_hex(secret, ts);
}

static const std::string* find_param(const std::map<std::string, std::string>& params,
                                     const char* name, const char* alias) {
    auto it = params.find(name);
    if (it == params.end()) it = params.find(alias);
    return it == params.end() ? nullptr : &it->second;
}

// Unparseable or out-of-range timestamps count as 0 and so fall outside the window.
static std::int64_t parse_ts(const std::string& ts) {
    if (ts.empty()) return 0;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(ts.c_str(), &end, 10);
    if (errno == ERANGE || !end || *end != '\0') return 0;
    return (std::int64_t)v;
}

AuthStatus authenticate(const AuthConfig& cfg, const std::map<std::string, std::string>& params,
                        std::int64_t now) {
    if (cfg.secret.empty()) return AuthStatus::Ok;
    const std::string* ts = find_param(params, "ts", "X-Api-Ts");
    const std::string* sig = find_param(params, "sig", "X-Api-Sign");
    if (!ts || !sig) return AuthStatus::Missing;

    // The client value is never subtracted; only trusted bounds are computed.
    const std::int64_t sent = parse_ts(*ts);
    if (sent < now - cfg.tolerance_secs || sent > now + cfg.tolerance_secs) return AuthStatus::Expired;

    const std::string expected = sign_timestamp(cfg.secret, *ts);
    if (expected.size() != sig->size() ||
        CRYPTO_memcmp(expected.data(), sig->data(), expected.size()) != 0) {
        return AuthStatus::InvalidSignature;
    }
    return AuthStatus::Ok;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() && hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out.push_back((char)(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::map<std::string, std::string> parse_query_string(const std::string& target) {
    std::map<std::string, std::string> out;
    auto q = target.find('?');
    if (q == std::string::npos) return out;
    std::string query = target.substr(q + 1);
    auto hash = query.find('#');
    if (hash != std::string::npos) query.erase(hash);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string val = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            out.emplace(std::move(key), std::move(val));
        }
        pos = amp + 1;
    }
    return out;
}
