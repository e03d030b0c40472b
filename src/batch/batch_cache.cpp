#include <docket/batch/batch_cache.hpp>

#include <spdlog/spdlog.h>

namespace docket::batch {

batch_cache::batch_cache(const std::size_t capacity) : capacity_{capacity} {}

std::shared_ptr<const batch_cache::actions_t> batch_cache::find(
    const schema::hash32_t& fingerprint,
    const uint64_t generation) {
  auto lock = std::scoped_lock{mutex_};
  auto it = index_.find(key_t{fingerprint, generation});
  if (it == std::end(index_)) {
    return nullptr;
  }
  entries_.splice(std::begin(entries_), entries_, it->second);
  return it->second->second;
}

void batch_cache::insert(const schema::hash32_t& fingerprint,
                         const uint64_t generation,
                         std::shared_ptr<const actions_t> actions) {
  if (capacity_ == 0) {
    return;
  }
  auto lock = std::scoped_lock{mutex_};
  auto key = key_t{fingerprint, generation};
  if (auto it = index_.find(key); it != std::end(index_)) {
    it->second->second = std::move(actions);
    entries_.splice(std::begin(entries_), entries_, it->second);
    return;
  }
  entries_.emplace_front(key, std::move(actions));
  index_.emplace(key, std::begin(entries_));
  while (entries_.size() > capacity_) {
    index_.erase(entries_.back().first);
    entries_.pop_back();
  }
}

std::shared_ptr<const batch_cache::actions_t> batch_cache::decode(
    const decoder::action_decoder& decoder,
    const batch_t& batch) {
  auto key = fingerprint(batch);
  auto generation = decoder.registry().generation();
  if (auto cached = find(key, generation); cached) {
    spdlog::debug("Batch cache hit for {}", schema::to_hex(key));
    return cached;
  }
  spdlog::debug("Batch cache miss; decoding {} action(s)", batch.size());
  auto actions =
      std::make_shared<const actions_t>(decode_batch(decoder, batch));
  insert(key, generation, actions);
  return actions;
}

std::size_t batch_cache::size() const {
  auto lock = std::scoped_lock{mutex_};
  return entries_.size();
}

std::size_t batch_cache::capacity() const {
  return capacity_;
}

void batch_cache::clear() {
  auto lock = std::scoped_lock{mutex_};
  entries_.clear();
  index_.clear();
}

}  // namespace docket::batch
