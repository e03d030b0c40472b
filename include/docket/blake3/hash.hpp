#pragma once
#include <docket/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace docket::blake3 {

docket::schema::hash32_t hash(const std::string_view& str);
docket::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

class hasher final {
 public:
  hasher();
  ~hasher();
  hasher(hasher&&) noexcept;
  hasher& operator=(hasher&&) noexcept;

  hasher& update(const std::span<const uint8_t>& bytes);
  hasher& update(const std::string_view& str);

  docket::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

}  // namespace docket::blake3
