#include "file_utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <system_error>

namespace gr4ft::util {

namespace {

std::filesystem::path make_temp_sibling(const std::filesystem::path& file_path) {
  static std::atomic<uint64_t> counter{0};
  auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  uint64_t suffix = counter.fetch_add(1, std::memory_order_relaxed);
  return file_path.string() + ".gr4ft.tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace

std::optional<std::string> read_file(const std::filesystem::path& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::string content;
  content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::nullopt;
  }
  return content;
}

bool write_file_atomic(const std::filesystem::path& file_path, std::string_view data, std::string& error) {
  std::error_code ec;
  auto parent = file_path.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      error = "failed to create directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  auto temp_path = make_temp_sibling(file_path);
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      error = "failed to open temp file '" + temp_path.string() + "'";
      return false;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out.good()) {
      out.close();
      std::filesystem::remove(temp_path, ec);
      error = "failed to write temp file '" + temp_path.string() + "'";
      return false;
    }
  }

  // keep the permission bits of the file being replaced
  auto existing = std::filesystem::status(file_path, ec);
  if (!ec && std::filesystem::exists(existing)) {
    std::filesystem::permissions(temp_path, existing.permissions(), std::filesystem::perm_options::replace, ec);
  }

  ec.clear();
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    error = "failed to move '" + temp_path.string() + "' into place: " + ec.message();
    return false;
  }
  return true;
}

bool copy_file_atomic(const std::filesystem::path& source, const std::filesystem::path& destination, std::string& error) {
  std::error_code ec;
  auto parent = destination.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      error = "failed to create directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  auto temp_path = make_temp_sibling(destination);
  std::filesystem::copy_file(source, temp_path, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    error = "failed to copy '" + source.string() + "': " + ec.message();
    return false;
  }

  std::filesystem::rename(temp_path, destination, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    error = "failed to move '" + temp_path.string() + "' into place: " + ec.message();
    return false;
  }
  return true;
}

bool file_exists(const std::filesystem::path& file_path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(file_path, ec);
}

bool files_equal(const std::filesystem::path& lhs, const std::filesystem::path& rhs) {
  std::error_code ec;
  auto lhs_size = std::filesystem::file_size(lhs, ec);
  if (ec) {
    return false;
  }
  auto rhs_size = std::filesystem::file_size(rhs, ec);
  if (ec || lhs_size != rhs_size) {
    return false;
  }

  auto lhs_data = read_file(lhs);
  auto rhs_data = read_file(rhs);
  return lhs_data && rhs_data && *lhs_data == *rhs_data;
}

} // namespace gr4ft::util
