#include <tender/crypto/keccak.hpp>

#include <algorithm>

namespace tender::crypto {

namespace {

constexpr auto kRoundConstants = std::array<uint64_t, 24>{
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr auto kPiLane = std::array<int, 24>{10, 7,  11, 17, 18, 3,  5,  16,
                                             8,  21, 24, 4,  15, 23, 19, 13,
                                             12, 2,  20, 14, 22, 9,  6,  1};

constexpr auto kRhoRotation =
    std::array<int, 24>{1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
                        27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};

inline uint64_t rotl64(const uint64_t x, const int i) {
  return (x << i) | (x >> (64 - i));
}

void keccak_f1600(std::array<uint64_t, 25>& st) {
  for (const auto round_constant : kRoundConstants) {
    auto bc = std::array<uint64_t, 5>{};

    // theta
    for (int i = 0; i < 5; ++i) {
      bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
    }
    for (int i = 0; i < 5; ++i) {
      auto t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
      for (int j = 0; j < 25; j += 5) {
        st[j + i] ^= t;
      }
    }

    // rho + pi
    auto t = st[1];
    for (int i = 0; i < 24; ++i) {
      auto lane = kPiLane[i];
      auto next = st[lane];
      st[lane] = rotl64(t, kRhoRotation[i]);
      t = next;
    }

    // chi
    for (int j = 0; j < 25; j += 5) {
      for (int i = 0; i < 5; ++i) {
        bc[i] = st[j + i];
      }
      for (int i = 0; i < 5; ++i) {
        st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
      }
    }

    // iota
    st[0] ^= round_constant;
  }
}

}  // namespace

void keccak256_hasher::absorb_block(const uint8_t* block) {
  for (std::size_t i = 0; i < kRate / 8; ++i) {
    auto lane = uint64_t{0};
    for (std::size_t j = 0; j < 8; ++j) {
      lane |= static_cast<uint64_t>(block[(i * 8) + j]) << (8 * j);
    }
    state_[i] ^= lane;
  }
  keccak_f1600(state_);
}

keccak256_hasher& keccak256_hasher::update(
    const tender::schema::bytes_view_t& bytes) {
  auto remaining = bytes;
  while (!remaining.empty()) {
    auto take = std::min(kRate - buffered_, remaining.size());
    std::copy_n(remaining.data(), take, buffer_.data() + buffered_);
    buffered_ += take;
    remaining = remaining.subspan(take);
    if (buffered_ == kRate) {
      absorb_block(buffer_.data());
      buffered_ = 0;
    }
  }
  return *this;
}

keccak256_hasher& keccak256_hasher::update(const std::string_view& str) {
  return update(tender::schema::make_bytes_view(str));
}

tender::schema::hash32_t keccak256_hasher::finalize() {
  std::fill(std::begin(buffer_) + static_cast<std::ptrdiff_t>(buffered_),
            std::end(buffer_), uint8_t{0});
  buffer_[buffered_] |= 0x01;
  buffer_[kRate - 1] |= 0x80;
  absorb_block(buffer_.data());

  auto digest = tender::schema::hash32_t{};
  for (std::size_t i = 0; i < digest.size(); ++i) {
    digest[i] = static_cast<uint8_t>(state_[i / 8] >> (8 * (i % 8)));
  }

  state_ = {};
  buffer_ = {};
  buffered_ = 0;
  return digest;
}

tender::schema::hash32_t keccak256(const tender::schema::bytes_view_t& bytes) {
  return keccak256_hasher{}.update(bytes).finalize();
}

tender::schema::hash32_t keccak256(const std::string_view& str) {
  return keccak256_hasher{}.update(str).finalize();
}

}  // namespace tender::crypto
