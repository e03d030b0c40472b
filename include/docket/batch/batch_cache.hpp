#pragma once
#include <docket/batch/batch.hpp>
#include <docket/decoder/action_decoder.hpp>
#include <docket/schema/decoded_action.hpp>
#include <docket/schema/primitives.hpp>

#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace docket::batch {

/// Bounded least-recently-used cache of decoded batches.
///
/// Keys pair the batch fingerprint with the registry generation the batch
/// was decoded against, so any registration makes older results unreachable;
/// they age out as new batches are inserted. A capacity of zero disables
/// caching.
class batch_cache final {
 public:
  using actions_t = std::vector<schema::decoded_action>;

  explicit batch_cache(std::size_t capacity);

  batch_cache(const batch_cache&) = delete;
  batch_cache& operator=(const batch_cache&) = delete;

  /// Cached result or nullptr.
  std::shared_ptr<const actions_t> find(const schema::hash32_t& fingerprint,
                                        uint64_t generation);

  void insert(const schema::hash32_t& fingerprint,
              uint64_t generation,
              std::shared_ptr<const actions_t> actions);

  /// Cached result for `batch`, decoding and correlating it on a miss.
  std::shared_ptr<const actions_t> decode(
      const decoder::action_decoder& decoder,
      const batch_t& batch);

  std::size_t size() const;
  std::size_t capacity() const;
  void clear();

 private:
  using key_t = std::pair<schema::hash32_t, uint64_t>;
  using entry_t = std::pair<key_t, std::shared_ptr<const actions_t>>;

  mutable std::mutex mutex_;
  std::size_t capacity_;
  // Most recently used first.
  std::list<entry_t> entries_;
  std::map<key_t, std::list<entry_t>::iterator> index_;
};

}  // namespace docket::batch
