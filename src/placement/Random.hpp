// src/placement/Random.hpp
#pragma once
#include <cstdint>
#include <string_view>

namespace roomscatter::placement {

// PCG32 (O'Neill): 64-bit state, 32-bit output, selectable stream.
struct Pcg32 {
  using result_type = std::uint32_t;

  std::uint64_t state = 0x853c49e6748fea9bULL;
  std::uint64_t inc   = 0xda3e39cb94b95bdbULL; // always odd

  Pcg32() = default;
  explicit Pcg32(std::uint64_t seed, std::uint64_t seq = 1u) noexcept { seed_rng(seed, seq); }

  static constexpr result_type min() noexcept { return 0u; }
  static constexpr result_type max() noexcept { return 0xFFFFFFFFu; }

  inline void seed_rng(std::uint64_t seed, std::uint64_t seq = 1u) noexcept {
    state = 0u;
    inc   = (seq << 1u) | 1u;
    next();
    state += seed;
    next();
  }

  inline result_type next() noexcept {
    const std::uint64_t old = state;
    state = old * 6364136223846793005ULL + inc;
    const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
    const auto rot        = static_cast<std::uint32_t>(old >> 59u);
    return (xorshifted >> rot) | (xorshifted << ((-static_cast<std::int32_t>(rot)) & 31));
  }

  inline result_type operator()() noexcept { return next(); }

  // Uniform in [0, bound) without modulo bias.
  inline std::uint32_t next_bounded(std::uint32_t bound) noexcept {
    if (bound == 0u) return 0u;
    std::uint64_t m = static_cast<std::uint64_t>(next()) * bound;
    auto l = static_cast<std::uint32_t>(m);
    if (l < bound) {
      const std::uint32_t thresh = static_cast<std::uint32_t>(-bound) % bound;
      while (l < thresh) {
        m = static_cast<std::uint64_t>(next()) * bound;
        l = static_cast<std::uint32_t>(m);
      }
    }
    return static_cast<std::uint32_t>(m >> 32);
  }

  // [0,1) with 24 bits of precision.
  inline float next_float01() noexcept {
    return static_cast<float>(next() >> 8) * (1.0f / 16777216.0f);
  }
};

// Uniform float in [lo, hi). Returns lo for an empty interval.
inline float randf(Pcg32& rng, float lo, float hi) noexcept {
  if (!(hi > lo)) return lo;
  return lo + (hi - lo) * rng.next_float01();
}

// Uniform int in [lo, hi] inclusive.
inline int randi(Pcg32& rng, int lo, int hi) noexcept {
  if (hi <= lo) return lo;
  const auto span = static_cast<std::uint32_t>(static_cast<std::uint64_t>(hi - lo) + 1ull);
  return lo + static_cast<int>(rng.next_bounded(span));
}

inline constexpr std::uint64_t splitmix64(std::uint64_t x) noexcept {
  x += 0x9E3779B97F4A7C15ULL;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
  return x ^ (x >> 31);
}

// FNV-1a 64-bit; used to turn category ids into stream salts.
inline constexpr std::uint64_t fnv1a64(std::string_view s) noexcept {
  std::uint64_t h = 14695981039346656037ull;
  for (const char ch : s) {
    h ^= static_cast<unsigned char>(ch);
    h *= 1099511628211ull;
  }
  return h;
}

// Deterministic child stream of `parent` keyed by `salt`. Does not advance the parent.
inline Pcg32 sub_rng(const Pcg32& parent, std::uint64_t salt) noexcept {
  const std::uint64_t seed = splitmix64(parent.state ^ (salt + 0x9E3779B97F4A7C15ULL));
  const std::uint64_t seq  = splitmix64(parent.inc   ^ (salt ^ 0xBF58476D1CE4E5B9ULL));
  return Pcg32(seed, seq);
}

// Stream for one category within one run.
inline Pcg32 category_rng(std::uint64_t seed, std::uint64_t generation, std::string_view categoryId) noexcept {
  const Pcg32 root(splitmix64(seed), splitmix64(generation ^ 0x6a09e667f3bcc909ull));
  return sub_rng(root, fnv1a64(categoryId));
}

} // namespace roomscatter::placement
