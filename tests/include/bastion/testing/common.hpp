#pragma once

#include <bastion/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace bastion::testing {

inline bastion::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = bastion::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline bastion::schema::identity_t make_identity(const uint8_t seed) {
  auto identity = bastion::schema::identity_t{};
  identity[0] = seed;
  identity[31] = 0x5a;
  return identity;
}

inline bastion::schema::routing_key_t make_routing_key(const uint8_t seed) {
  return bastion::schema::routing_key_t{seed, 0x00, 0x00, 0x01};
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes the directory when it goes out of scope. Declare it before the
/// storage that lives in it.
class temporary_path final {
 public:
  explicit temporary_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  ~temporary_path() { remove_path(path_); }

  temporary_path(const temporary_path&) = delete;
  temporary_path& operator=(const temporary_path&) = delete;

  const std::string& string() const { return path_; }

 private:
  std::string path_;
};

}  // namespace bastion::testing
