#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
std::string read_text_file(const std::filesystem::path& p);

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
// Trim, case-fold and collapse internal whitespace runs to one space.
std::string normalize_query(const std::string& text);
std::vector<std::string> split_words(const std::string& text);

std::string sha256_hex(const std::string& data);
std::string hmac_sha256_hex(const std::string& key, const std::string& data);
// RFC 4122 shaped id derived from the SHA-256 of `seed`.
std::string uuid_from_seed(const std::string& seed);
std::string random_id();

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);
double jaro_winkler(const std::string& a, const std::string& b);

std::int64_t unix_now();
