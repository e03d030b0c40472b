#include <gtest/gtest.h>
#include <docket/batch/batch.hpp>
#include <docket/testing/proposals.hpp>

#include <functional>
#include <sstream>
#include <system_error>
#include <thread>

TEST(batch, make_batch_truncates_to_shortest_array) {
  auto batch = docket::batch::make_batch({"0xa", "0xb", "0xc"}, {"0", "1"},
                                         {"f()", "g()", "h()"},
                                         {"0x", "0x", "0x"});
  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch[1], (docket::schema::call_descriptor{
                          .target = "0xb",
                          .value = "1",
                          .signature = "g()",
                          .calldata = "0x"}));
}

TEST(batch, read_batch_parses_tab_separated_lines) {
  auto input = std::istringstream{
      "# proposal 42\n"
      "\n"
      "0xa\t0\ttransfer(address,uint256)\t0x1234\r\n"
      "0xb\t5\n"
      "0xc\t0\tf()\t0x\textra\n"};
  auto batch = docket::batch::read_batch(input);
  ASSERT_EQ(batch.size(), 2u);
  EXPECT_EQ(batch[0].signature, "transfer(address,uint256)");
  EXPECT_EQ(batch[0].calldata, "0x1234");
  EXPECT_EQ(batch[1].target, "0xb");
  EXPECT_EQ(batch[1].value, "5");
  EXPECT_TRUE(batch[1].signature.empty());
  EXPECT_TRUE(batch[1].calldata.empty());
}

TEST(batch, decode_batch_correlates_stream_funding) {
  auto registry = docket::registry::schema_registry{};
  auto decoder = docket::decoder::action_decoder{registry};
  auto actions = docket::batch::decode_batch(
      decoder, docket::testing::make_stream_proposal());
  ASSERT_EQ(actions.size(), 2u);
  EXPECT_EQ(actions[1].category, docket::schema::action_category::stream);
  EXPECT_EQ(actions[1].summary, "Fund stream #1 with $9,000.00");
}

TEST(batch, parallel_decode_matches_sequential_decode) {
  auto registry = docket::registry::schema_registry{};
  auto sequential = docket::decoder::action_decoder{registry};
  auto config = docket::config::decoder_config{};
  config.parallelism = 4;
  auto parallel = docket::decoder::action_decoder{registry, config};

  auto batch = docket::testing::make_stream_proposal();
  for (auto i = 0; i < 10; ++i) {
    batch.push_back(docket::testing::make_usdc_transfer(
        docket::testing::kBob, 1'000'000 + static_cast<uint64_t>(i)));
  }
  EXPECT_EQ(docket::batch::decode_batch(parallel, batch),
            docket::batch::decode_batch(sequential, batch));
}

TEST(batch, decode_batch_covers_workers_that_fail_to_start) {
  auto registry = docket::registry::schema_registry{};
  auto sequential = docket::decoder::action_decoder{registry};
  auto config = docket::config::decoder_config{};
  config.parallelism = 4;
  auto parallel = docket::decoder::action_decoder{registry, config};

  auto batch = docket::testing::make_stream_proposal();
  for (auto i = 0; i < 6; ++i) {
    batch.push_back(docket::testing::make_usdc_transfer(
        docket::testing::kBob, 1'000'000 + static_cast<uint64_t>(i)));
  }

  auto launched = 0;
  auto launch = [&launched](std::function<void()> work) {
    if (launched++ == 1) {
      throw std::system_error{
          std::make_error_code(std::errc::resource_unavailable_try_again)};
    }
    return std::thread{std::move(work)};
  };
  EXPECT_EQ(docket::batch::decode_batch(parallel, batch, launch),
            docket::batch::decode_batch(sequential, batch));
  EXPECT_EQ(launched, 2);
}

TEST(batch, extract_recipients_deduplicates_in_order) {
  auto registry = docket::registry::schema_registry{};
  auto decoder = docket::decoder::action_decoder{registry};
  auto batch = docket::testing::make_stream_proposal();
  batch.push_back(
      docket::testing::make_usdc_transfer(docket::testing::kAlice, 1));
  auto recipients = docket::batch::extract_recipients(
      docket::batch::decode_batch(decoder, batch));
  EXPECT_EQ(recipients, (std::vector<std::string>{
                            std::string{docket::testing::kAlice},
                            std::string{docket::testing::kPredictedStream}}));
}

TEST(batch, summarize_lists_at_most_two_actions) {
  auto action = [](std::string summary) {
    return docket::schema::decoded_action{.summary = std::move(summary)};
  };
  EXPECT_EQ(docket::batch::summarize({}), "No actions");
  EXPECT_EQ(docket::batch::summarize({action("a")}), "a");
  EXPECT_EQ(docket::batch::summarize({action("a"), action("b")}), "a, b");
  EXPECT_EQ(docket::batch::summarize({action("a"), action("b"), action("c")}),
            "a, b, and 1 more action");
  EXPECT_EQ(docket::batch::summarize(
                {action("a"), action("b"), action("c"), action("d")}),
            "a, b, and 2 more actions");
}

TEST(batch, fingerprint_depends_on_every_field_and_order) {
  auto batch = docket::testing::make_stream_proposal();
  auto base = docket::batch::fingerprint(batch);
  EXPECT_EQ(docket::batch::fingerprint(batch), base);

  auto changed = batch;
  changed[1].value = "1";
  EXPECT_NE(docket::batch::fingerprint(changed), base);

  auto reordered = batch;
  std::swap(reordered[0], reordered[1]);
  EXPECT_NE(docket::batch::fingerprint(reordered), base);
}

TEST(batch, fingerprint_frames_fields) {
  auto left = docket::batch::make_batch({"ab"}, {"c"}, {""}, {""});
  auto right = docket::batch::make_batch({"a"}, {"bc"}, {""}, {""});
  EXPECT_NE(docket::batch::fingerprint(left),
            docket::batch::fingerprint(right));
  EXPECT_NE(docket::batch::fingerprint({}),
            docket::batch::fingerprint(docket::batch::make_batch(
                {""}, {""}, {""}, {""})));
}
