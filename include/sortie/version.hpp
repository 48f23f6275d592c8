#pragma once

// sortie/version.hpp: Version manifest for every serialized surface.
//
// INVARIANT: constants are compile-time. Bump the matching constant whenever
// its format or algorithm changes; readers compare before trusting data.

#include <cstdint>
#include <string>

namespace sortie {
namespace version {

constexpr const char* ENGINE_SEMVER = "0.3.0";

// Scoring weights and tie-break order of the result comparator. Two rankings
// are only comparable when their scoring versions match.
constexpr std::uint32_t SCORING_VERSION = 1;

// EngineConfig JSON layout.
constexpr std::uint32_t CONFIG_VERSION = 1;

// EngineEvent JSONL layout.
constexpr std::uint32_t EVENT_SCHEMA_VERSION = 1;

struct VersionManifest {
  std::string engine_semver{ENGINE_SEMVER};
  std::uint32_t scoring{SCORING_VERSION};
  std::uint32_t config{CONFIG_VERSION};
  std::uint32_t event_schema{EVENT_SCHEMA_VERSION};
  std::string hash_primitive{"blake3"};
  std::string hash_library_version;
  std::string build_timestamp;
};

VersionManifest current_manifest();
std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace sortie
