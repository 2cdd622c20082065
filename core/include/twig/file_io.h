#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace twig {

std::string read_text_file(const std::filesystem::path& path);
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

// Writes to a sibling temp file and renames it over path.
bool write_text_file_atomic(const std::filesystem::path& path,
                            const std::string& contents,
                            std::string& error);

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);

int64_t epoch_seconds_now();
std::string iso_utc(int64_t epoch_seconds);
// YYYYmmdd-HHMMSS in UTC, used for backup ref names.
std::string compact_utc_stamp(int64_t epoch_seconds);

std::string trim(const std::string& text);

} // namespace twig
