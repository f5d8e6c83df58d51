#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gr4ft::util {

// file reading/writing utilities (binary, no newline translation)
std::optional<std::string> read_file(const std::filesystem::path& file_path);

// write through a temporary sibling and rename it into place, so readers never see a partial file
bool write_file_atomic(const std::filesystem::path& file_path, std::string_view data, std::string& error);

// copy source over destination the same way; destination takes the source's permissions
bool copy_file_atomic(const std::filesystem::path& source, const std::filesystem::path& destination, std::string& error);

// file system utilities
bool file_exists(const std::filesystem::path& file_path);
bool files_equal(const std::filesystem::path& lhs, const std::filesystem::path& rhs);

} // namespace gr4ft::util
