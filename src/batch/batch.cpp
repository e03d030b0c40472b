#include <docket/batch/batch.hpp>
#include <docket/blake3/hash.hpp>
#include <docket/correlation/batch_correlator.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace docket::batch {

namespace {

constexpr auto kFieldCount = std::size_t{4};

std::vector<std::string> split_fields(const std::string_view line) {
  auto fields = std::vector<std::string>{};
  auto start = std::size_t{0};
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == '\t') {
      fields.emplace_back(line.substr(start, i - start));
      start = i + 1;
    }
  }
  return fields;
}

void collect_addresses(const schema::decoded_value& value,
                       std::vector<std::string>& out) {
  if (const auto* address = std::get_if<schema::address_t>(&value.value)) {
    auto text = schema::to_string(*address);
    if (std::ranges::find(out, text) == std::end(out)) {
      out.push_back(std::move(text));
    }
  } else if (const auto* elements =
                 std::get_if<schema::decoded_array_t>(&value.value)) {
    for (const auto& element : *elements) {
      collect_addresses(element, out);
    }
  }
}

void update_framed(blake3::hasher& hasher, const std::string_view field) {
  auto length = static_cast<uint64_t>(field.size());
  auto frame = std::array<uint8_t, 8>{};
  for (std::size_t i = 0; i < frame.size(); ++i) {
    frame[i] = static_cast<uint8_t>(length >> (8 * i));
  }
  hasher.update(frame);
  hasher.update(field);
}

}  // namespace

batch_t make_batch(const std::vector<std::string>& targets,
                   const std::vector<std::string>& values,
                   const std::vector<std::string>& signatures,
                   const std::vector<std::string>& calldatas) {
  auto size = std::min({targets.size(), values.size(), signatures.size(),
                        calldatas.size()});
  auto batch = batch_t{};
  batch.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    batch.push_back(schema::call_descriptor{.target = targets[i],
                                            .value = values[i],
                                            .signature = signatures[i],
                                            .calldata = calldatas[i]});
  }
  return batch;
}

batch_t read_batch(std::istream& input) {
  auto batch = batch_t{};
  auto line = std::string{};
  auto number = std::size_t{0};
  while (std::getline(input, line)) {
    ++number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.starts_with('#')) {
      continue;
    }
    auto fields = split_fields(line);
    if (fields.size() > kFieldCount) {
      spdlog::warn("Skipping batch line {}: {} fields", number, fields.size());
      continue;
    }
    fields.resize(kFieldCount);
    batch.push_back(schema::call_descriptor{
        .target = std::move(fields[0]),
        .value = std::move(fields[1]),
        .signature = std::move(fields[2]),
        .calldata = std::move(fields[3]),
    });
  }
  return batch;
}

std::vector<schema::decoded_action> decode_batch(
    const decoder::action_decoder& decoder,
    const batch_t& batch) {
  return decode_batch(decoder, batch, [](std::function<void()> work) {
    return std::thread{std::move(work)};
  });
}

std::vector<schema::decoded_action> decode_batch(
    const decoder::action_decoder& decoder,
    const batch_t& batch,
    const thread_launcher_t& launch) {
  auto actions = std::vector<schema::decoded_action>(batch.size());
  auto workers =
      std::min(std::max<std::size_t>(decoder.config().parallelism, 1),
               batch.size());
  auto decode_stride = [&](const std::size_t first, const std::size_t step) {
    for (auto i = first; i < batch.size(); i += step) {
      actions[i] = decoder.decode(batch[i]);
    }
  };

  if (workers <= 1) {
    decode_stride(0, 1);
  } else {
    spdlog::debug("Decoding {} action(s) on {} threads", batch.size(),
                  workers);
    auto threads = std::vector<std::thread>{};
    threads.reserve(workers);
    try {
      for (std::size_t worker = 0; worker < workers; ++worker) {
        threads.push_back(
            launch([&, worker] { decode_stride(worker, workers); }));
      }
    } catch (const std::system_error& e) {
      spdlog::warn("Started {} of {} decode threads: {}", threads.size(),
                   workers, e.what());
    }
    auto started = threads.size();
    for (auto& t : threads) {
      t.join();
    }
    for (auto worker = started; worker < workers; ++worker) {
      decode_stride(worker, workers);
    }
  }

  return correlation::correlate(std::move(actions));
}

std::vector<std::string> extract_recipients(
    const std::vector<schema::decoded_action>& actions) {
  auto out = std::vector<std::string>{};
  for (const auto& action : actions) {
    for (const auto& parameter : action.parameters) {
      if (parameter.is_recipient) {
        collect_addresses(parameter.raw_value, out);
      }
    }
  }
  return out;
}

std::string summarize(const std::vector<schema::decoded_action>& actions) {
  if (actions.empty()) {
    return "No actions";
  }
  if (actions.size() == 1) {
    return actions.front().summary;
  }
  auto out = actions[0].summary + ", " + actions[1].summary;
  if (auto remaining = actions.size() - 2; remaining > 0) {
    out += fmt::format(", and {} more action{}", remaining,
                       remaining == 1 ? "" : "s");
  }
  return out;
}

schema::hash32_t fingerprint(const batch_t& batch) {
  auto hasher = blake3::hasher{};
  update_framed(hasher, std::to_string(batch.size()));
  for (const auto& descriptor : batch) {
    update_framed(hasher, descriptor.target);
    update_framed(hasher, descriptor.value);
    update_framed(hasher, descriptor.signature);
    update_framed(hasher, descriptor.calldata);
  }
  return hasher.finalize();
}

}  // namespace docket::batch
