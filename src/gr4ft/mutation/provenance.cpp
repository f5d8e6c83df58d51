#include "provenance.hpp"
#include <redlog.hpp>
#include <fstream>
#include <system_error>

namespace gr4ft::mutation {

using engine::error_code;
using engine::make_status;
using engine::ok_status;
using engine::status;

namespace {

std::filesystem::path sidecar(const std::filesystem::path& target, std::string_view layer, std::string_view suffix) {
  std::string path = target.string();
  path += ".gr4ft.";
  path += layer;
  path += suffix;
  return path;
}

} // namespace

std::filesystem::path original_sidecar(const std::filesystem::path& target, std::string_view layer) {
  return sidecar(target, layer, ".orig");
}

std::filesystem::path absent_sidecar(const std::filesystem::path& target, std::string_view layer) {
  return sidecar(target, layer, ".none");
}

provenance recorded_provenance(const std::filesystem::path& target, std::string_view layer) {
  std::error_code ec;
  if (std::filesystem::is_regular_file(original_sidecar(target, layer), ec)) {
    return provenance::original_file;
  }
  if (std::filesystem::is_regular_file(absent_sidecar(target, layer), ec)) {
    return provenance::absent;
  }
  return provenance::none;
}

engine::result<bool> record_original(const std::filesystem::path& target, std::string_view layer) {
  auto log = redlog::get_logger("gr4ft.provenance");

  if (recorded_provenance(target, layer) != provenance::none) {
    log.trc("original already recorded", redlog::field("target", target.string()), redlog::field("layer", std::string(layer)));
    return engine::ok_result(false);
  }

  std::error_code ec;
  if (std::filesystem::exists(target, ec)) {
    if (!std::filesystem::is_regular_file(target, ec)) {
      return engine::error_result<bool>(error_code::mutation_error, "target is not a regular file: " + target.string());
    }
    std::filesystem::copy_file(
        target, original_sidecar(target, layer), std::filesystem::copy_options::overwrite_existing, ec
    );
    if (ec) {
      return engine::error_result<bool>(
          error_code::io_error, "failed to back up " + target.string() + ": " + ec.message()
      );
    }
    log.trc("recorded original file", redlog::field("target", target.string()));
    return engine::ok_result(true);
  }

  auto parent = target.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return engine::error_result<bool>(
          error_code::io_error, "failed to create " + parent.string() + ": " + ec.message()
      );
    }
  }

  std::ofstream marker(absent_sidecar(target, layer), std::ios::binary | std::ios::trunc);
  if (!marker.is_open()) {
    return engine::error_result<bool>(error_code::io_error, "failed to write marker for " + target.string());
  }
  log.trc("recorded absent target", redlog::field("target", target.string()));
  return engine::ok_result(true);
}

status restore_original(const std::filesystem::path& target, std::string_view layer) {
  std::error_code ec;
  switch (recorded_provenance(target, layer)) {
  case provenance::original_file:
    std::filesystem::rename(original_sidecar(target, layer), target, ec);
    if (ec) {
      return make_status(error_code::io_error, "failed to restore " + target.string() + ": " + ec.message());
    }
    return ok_status();
  case provenance::absent:
    std::filesystem::remove(target, ec);
    if (ec) {
      return make_status(error_code::io_error, "failed to remove " + target.string() + ": " + ec.message());
    }
    std::filesystem::remove(absent_sidecar(target, layer), ec);
    if (ec) {
      return make_status(error_code::io_error, "failed to drop marker for " + target.string() + ": " + ec.message());
    }
    return ok_status();
  case provenance::none:
    break;
  }
  return make_status(error_code::mutation_error, "no recorded original for " + target.string());
}

void forget_original(const std::filesystem::path& target, std::string_view layer) {
  std::error_code ec;
  std::filesystem::remove(original_sidecar(target, layer), ec);
  std::filesystem::remove(absent_sidecar(target, layer), ec);
}

} // namespace gr4ft::mutation
