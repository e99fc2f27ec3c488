#include "BoardShim.hpp"
#include "Board/SyntheticBoard.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <numeric>
#include <thread>

namespace {

const int kSynthetic = static_cast<int>(BoardIds::SYNTHETIC_BOARD);

class BoardShimTest : public ::testing::Test {
protected:
    void SetUp() override { BoardShim::DisableBoardLogger(); }
};

} // namespace

TEST_F(BoardShimTest, UnknownBoardIsRejected) {
    EXPECT_TRUE(test_utils::ThrowsBoardError(StreamExitCodes::UNSUPPORTED_BOARD_ERROR,
                                             []() { BoardShim boardShim(17, ""); }));
}

TEST_F(BoardShimTest, LifecycleErrors) {
    using test_utils::ThrowsBoardError;
    BoardShim boardShim(kSynthetic, "");

    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::BOARD_NOT_CREATED_ERROR,
                                 [&]() { boardShim.StartStream(100); }));
    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::BOARD_NOT_CREATED_ERROR,
                                 [&]() { boardShim.GetBoardDataCount(); }));

    boardShim.PrepareSession();
    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::STREAM_THREAD_IS_NOT_RUNNING,
                                 [&]() { boardShim.StopStream(); }));
    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::EMPTY_BUFFER_ERROR,
                                 [&]() { boardShim.GetBoardData(); }));
    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::INVALID_BUFFER_SIZE_ERROR,
                                 [&]() { boardShim.StartStream(0); }));
    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::INVALID_BUFFER_SIZE_ERROR,
                                 [&]() { boardShim.StartStream(Board::MAX_CAPTURE_SAMPLES + 1); }));

    boardShim.StartStream(100);
    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::STREAM_ALREADY_RUN_ERROR,
                                 [&]() { boardShim.StartStream(100); }));
    EXPECT_TRUE(ThrowsBoardError(StreamExitCodes::INVALID_ARGUMENTS_ERROR,
                                 [&]() { boardShim.GetCurrentBoardData(0); }));

    // Release while streaming stops the stream
    boardShim.ReleaseSession();
    boardShim.ReleaseSession();
    EXPECT_FALSE(boardShim.IsPrepared());
}

TEST_F(BoardShimTest, LogLevelOutOfRange) {
    EXPECT_TRUE(test_utils::ThrowsBoardError(StreamExitCodes::INVALID_ARGUMENTS_ERROR,
                                             []() { BoardShim::SetLogLevel(7); }));
    EXPECT_TRUE(test_utils::ThrowsBoardError(StreamExitCodes::INVALID_ARGUMENTS_ERROR,
                                             []() { BoardShim::SetLogLevel(-1); }));
}

TEST_F(BoardShimTest, SyntheticStreaming) {
    BoardShim boardShim(kSynthetic, "");
    boardShim.PrepareSession();
    boardShim.StartStream(3600);
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));

    SampleMatrix latest = boardShim.GetCurrentBoardData(10);
    SampleMatrix immediate = boardShim.GetImmediateBoardData();
    boardShim.StopStream();

    ASSERT_EQ(latest.size(), 13u);
    EXPECT_EQ(latest[0].size(), 10u);
    EXPECT_EQ(immediate[0].size(), 1u);

    int count = boardShim.GetBoardDataCount();
    // 250 Hz for one second, allow for scheduling jitter
    EXPECT_GT(count, 150);
    EXPECT_LE(count, 300);

    SampleMatrix data = boardShim.GetBoardData();
    ASSERT_EQ(data.size(), 13u);
    ASSERT_EQ(data[0].size(), static_cast<size_t>(count));
    EXPECT_EQ(boardShim.GetBoardDataCount(), 0);

    for (size_t i = 1; i < data[12].size(); ++i) {
        ASSERT_GE(data[12][i], data[12][i - 1]) << "sample " << i;
    }
    double mean = std::accumulate(data[1].begin(), data[1].end(), 0.0) / data[1].size();
    EXPECT_NEAR(mean, SyntheticBoard::DC_OFFSET_UV, 5.0);

    // A stopped stream can be restarted with a new buffer
    boardShim.StartStream(10);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    boardShim.StopStream();
    EXPECT_EQ(boardShim.GetBoardDataCount(), 10);

    boardShim.ReleaseSession();
}
