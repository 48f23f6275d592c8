#include "sortie/version.hpp"

#include "sortie/hash.hpp"
#include "sortie/jsonlite.hpp"

namespace sortie {
namespace version {

VersionManifest current_manifest() {
  VersionManifest m;
  m.hash_library_version = blake3_library_version();
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  jsonlite::Object o{{"engine_semver", m.engine_semver},
                     {"scoring", jsonlite::Value{static_cast<std::uint64_t>(m.scoring)}},
                     {"config", jsonlite::Value{static_cast<std::uint64_t>(m.config)}},
                     {"event_schema", jsonlite::Value{static_cast<std::uint64_t>(m.event_schema)}},
                     {"hash_primitive", m.hash_primitive},
                     {"hash_library_version", m.hash_library_version},
                     {"build_timestamp", m.build_timestamp}};
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace version
}  // namespace sortie
