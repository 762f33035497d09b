#pragma once
#include <cstdint>
#include <string>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);
std::string read_file_bytes(const std::filesystem::path& p);
std::size_t count_words(const std::string& text);
// "YYYY-MM-DD HH:MM:SS" in UTC.
std::string format_timestamp(int64_t unix_seconds);
std::string to_hex(const unsigned char* data, std::size_t len);
