#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

// Parameter sets are JSON objects; key order never affects the result.
using Params = nlohmann::json;

// Serializes params with keys sorted at every nesting level.
// Throws MalformedInputError when params is not an object (null counts as {})
// or cannot be serialized.
std::string canonical_params(const Params& params);

// SHA-256 over "subject:query_kind:canonical_params", lowercase hex.
std::string fingerprint(const std::string& subject, const std::string& query_kind, const Params& params);

// SHA-256 of raw document bytes, lowercase hex.
std::string content_hash(const std::string& bytes);
std::string content_hash_file(const std::filesystem::path& p);
