#include "sortie/hash.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>

#include <unistd.h>

extern "C" {
#include <blake3.h>
}

namespace sortie {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::atomic<std::uint64_t> g_id_counter{0};

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

std::string make_id(std::string_view prefix, std::string_view seed) {
  const auto n = g_id_counter.fetch_add(1, std::memory_order_relaxed);
  const auto t = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string material;
  material.reserve(seed.size() + 64);
  material.append(seed);
  material += '|';
  material += std::to_string(static_cast<long long>(::getpid()));
  material += '|';
  material += std::to_string(n);
  material += '|';
  material += std::to_string(static_cast<long long>(t));
  std::string out(prefix);
  out += '-';
  out += hash_domain("id:", material).substr(0, 16);
  return out;
}

}  // namespace sortie
