#pragma once

#include "engine/result.hpp"
#include <filesystem>
#include <string_view>

namespace gr4ft::mutation {

// what was at a target path before a given layer of gr4ft mutated it.
// recorded in sidecar files next to the target, one pair per layer:
//   <target>.gr4ft.<layer>.orig  bytes of the file as the layer found it
//   <target>.gr4ft.<layer>.none  marker meaning no file existed
// layers stack, so a copy followed by an annotation removal on the same file unwinds in order.
// sidecars of files under the webroot are themselves served unless the server denies *.gr4ft.*
enum class provenance { none, original_file, absent };

std::filesystem::path original_sidecar(const std::filesystem::path& target, std::string_view layer);
std::filesystem::path absent_sidecar(const std::filesystem::path& target, std::string_view layer);

provenance recorded_provenance(const std::filesystem::path& target, std::string_view layer);

// record the current state of target. a no-op when a record already exists so the
// pristine state survives an interrupted run; value is true when a new record was written
engine::result<bool> record_original(const std::filesystem::path& target, std::string_view layer);

// put target back into its recorded state and drop the record
engine::status restore_original(const std::filesystem::path& target, std::string_view layer);

// drop the record without touching target; used to roll back a failed apply
void forget_original(const std::filesystem::path& target, std::string_view layer);

} // namespace gr4ft::mutation
