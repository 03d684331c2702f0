#include <gtest/gtest.h>

#include "vimeo/upload_progress.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

using vimeo::next_offset;
using vimeo::ProgressStatus;
using vimeo::ProgressUpdate;
using vimeo::TransferWindow;

TEST(NextOffsetTest, ReadsNumberAfterHyphen) {
  EXPECT_EQ(next_offset("0-499", 0, 1000), (ProgressUpdate{499, true}));
  EXPECT_EQ(next_offset("bytes 0-1000", 499, 1000), (ProgressUpdate{1000, true}));
  EXPECT_EQ(next_offset("bytes 0- 250 ", 0, 1000), (ProgressUpdate{250, true}));
}

TEST(NextOffsetTest, KeepsPreviousOffsetForUnusableHeaders) {
  EXPECT_EQ(next_offset("bytes-garbage", 120, 1000), (ProgressUpdate{120, false}));
  EXPECT_EQ(next_offset("", 120, 1000), (ProgressUpdate{120, false}));
  EXPECT_EQ(next_offset("bytes 0", 120, 1000), (ProgressUpdate{120, false}));
  EXPECT_EQ(next_offset("bytes 0-", 120, 1000), (ProgressUpdate{120, false}));
  EXPECT_EQ(next_offset("bytes 0--5", 120, 1000), (ProgressUpdate{120, false}));
  EXPECT_EQ(next_offset("bytes 0-12abc", 120, 1000), (ProgressUpdate{120, false}));
}

TEST(NextOffsetTest, ValueBeyondTotalIsNotProgress) {
  EXPECT_EQ(next_offset("bytes 0-1001", 10, 1000), (ProgressUpdate{10, false}));
}

TEST(NextOffsetTest, RegressedValueIsAcceptedAsReported) {
  EXPECT_EQ(next_offset("bytes 0-100", 400, 1000), (ProgressUpdate{100, true}));
}

TEST(TransferWindowTest, ReportsProgressAndCompletion) {
  TransferWindow window;
  window.total_length = 1000;

  auto first = window.advance(std::string_view("bytes 0-400"), 3);
  EXPECT_EQ(first.status, ProgressStatus::Progress);
  EXPECT_EQ(first.offset, 400u);
  EXPECT_EQ(first.stalled_rounds, 0u);
  window.apply(first);
  EXPECT_FALSE(window.complete());

  auto second = window.advance(std::string_view("bytes 0-1000"), 3);
  EXPECT_EQ(second.status, ProgressStatus::Complete);
  window.apply(second);
  EXPECT_TRUE(window.complete());
  EXPECT_EQ(window.confirmed_offset, 1000u);
}

TEST(TransferWindowTest, MissingHeaderStallsThenAborts) {
  TransferWindow window;
  window.total_length = 10;

  auto first = window.advance(std::nullopt, 2);
  EXPECT_EQ(first.status, ProgressStatus::NoProgressRetry);
  EXPECT_EQ(first.stalled_rounds, 1u);
  EXPECT_EQ(first.offset, 0u);
  window.apply(first);

  auto second = window.advance(std::string_view("garbage"), 2);
  EXPECT_EQ(second.status, ProgressStatus::Abort);
  EXPECT_EQ(second.stalled_rounds, 2u);
}

TEST(TransferWindowTest, ProgressResetsStallCount) {
  TransferWindow window;
  window.total_length = 100;
  window.confirmed_offset = 20;
  window.stalled_rounds = 4;

  auto decision = window.advance(std::string_view("bytes 0-60"), 5);
  EXPECT_EQ(decision.status, ProgressStatus::Progress);
  EXPECT_EQ(decision.stalled_rounds, 0u);
  window.apply(decision);
  EXPECT_EQ(window.stalled_rounds, 0u);
}

TEST(TransferWindowTest, RepeatedOffsetCountsAsStall) {
  TransferWindow window;
  window.total_length = 100;
  window.confirmed_offset = 60;

  auto decision = window.advance(std::string_view("bytes 0-60"), 5);
  EXPECT_EQ(decision.status, ProgressStatus::NoProgressRetry);
  EXPECT_EQ(decision.offset, 60u);
  EXPECT_EQ(decision.stalled_rounds, 1u);
}

TEST(TransferWindowTest, RegressedOffsetIsAdoptedButStalls) {
  TransferWindow window;
  window.total_length = 100;
  window.confirmed_offset = 60;

  auto decision = window.advance(std::string_view("bytes 0-30"), 5);
  EXPECT_EQ(decision.status, ProgressStatus::NoProgressRetry);
  EXPECT_EQ(decision.offset, 30u);
  window.apply(decision);
  EXPECT_EQ(window.confirmed_offset, 30u);
}

TEST(TransferWindowTest, MonotonicConfirmationsReachTotalExactlyOnce) {
  for (std::uint64_t total : {1u, 7u, 1000u}) {
    TransferWindow window;
    window.total_length = total;
    int completions = 0;
    std::uint64_t step = total / 3 + 1;
    while (!window.complete()) {
      std::uint64_t next = std::min(total, window.confirmed_offset + step);
      std::string header = "bytes 0-" + std::to_string(next);
      auto decision = window.advance(std::string_view(header), 3);
      ASSERT_NE(decision.status, ProgressStatus::Abort);
      if (decision.status == ProgressStatus::Complete) {
        ++completions;
      }
      window.apply(decision);
    }
    EXPECT_EQ(window.confirmed_offset, total);
    EXPECT_EQ(completions, 1);
  }
}
