#pragma once

// sortie/hash.hpp: BLAKE3 hashing and identifier generation.
//
// DESIGN:
//   BLAKE3 is the only hash primitive. Domain prefixes ("id:", "rank:")
//   keep identifier hashing and ranking digests from colliding.

#include <string>
#include <string_view>

namespace sortie {

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string blake3_library_version();

// Returns "<prefix>-<16 hex chars>". Unique within the process: the hash
// input mixes the pid, a process-wide counter and the steady clock.
std::string make_id(std::string_view prefix, std::string_view seed = {});

}  // namespace sortie
