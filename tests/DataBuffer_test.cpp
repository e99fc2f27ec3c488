#include "DataBuffer/DataBuffer.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

const size_t kPackageLength = 4;

std::vector<float> MakePackage(float first) {
    std::vector<float> package(kPackageLength);
    for (size_t i = 0; i < kPackageLength; ++i) {
        package[i] = first + static_cast<float>(i);
    }
    return package;
}

// Capacity 3 after five writes: timestamps 102, 103, 104 remain
void FillOverCapacity(DataBuffer& buffer) {
    for (int i = 0; i < 5; ++i) {
        std::vector<float> package = MakePackage(static_cast<float>(i * 10));
        buffer.AddData(100.0 + i, package.data());
    }
}

} // namespace

TEST(DataBufferTest, ZeroCapacityIsNotReady) {
    DataBuffer empty(0, kPackageLength);
    EXPECT_FALSE(empty.IsReady());

    std::vector<float> packages;
    std::vector<double> timestamps;
    EXPECT_EQ(empty.GetData(10, packages, timestamps), 0u);
    EXPECT_EQ(empty.GetDataCount(), 0u);
}

TEST(DataBufferTest, OverwritesOldestWhenFull) {
    DataBuffer buffer(3, kPackageLength);
    ASSERT_TRUE(buffer.IsReady());
    FillOverCapacity(buffer);
    EXPECT_EQ(buffer.GetDataCount(), 3u);
}

TEST(DataBufferTest, CurrentDataPeeksNewestSamples) {
    DataBuffer buffer(3, kPackageLength);
    FillOverCapacity(buffer);

    std::vector<float> packages;
    std::vector<double> timestamps;
    ASSERT_EQ(buffer.GetCurrentData(2, packages, timestamps), 2u);
    EXPECT_EQ(timestamps[0], 103.0);
    EXPECT_EQ(timestamps[1], 104.0);
    EXPECT_EQ(packages[0], 30.0f);
    EXPECT_EQ(buffer.GetDataCount(), 3u) << "GetCurrentData must not drain the buffer";
}

TEST(DataBufferTest, GetDataDrainsOldestFirstAcrossWrap) {
    DataBuffer buffer(3, kPackageLength);
    FillOverCapacity(buffer);

    std::vector<float> packages;
    std::vector<double> timestamps;
    ASSERT_EQ(buffer.GetData(2, packages, timestamps), 2u);
    EXPECT_EQ(timestamps[0], 102.0);
    EXPECT_EQ(timestamps[1], 103.0);
    ASSERT_EQ(packages.size(), 2 * kPackageLength);
    EXPECT_EQ(packages[kPackageLength], 30.0f);
    EXPECT_EQ(packages[2 * kPackageLength - 1], 33.0f);
    EXPECT_EQ(buffer.GetDataCount(), 1u);

    std::vector<float> package = MakePackage(50.0f);
    buffer.AddData(105.0, package.data());
    ASSERT_EQ(buffer.GetData(10, packages, timestamps), 2u);
    EXPECT_EQ(timestamps[0], 104.0);
    EXPECT_EQ(timestamps[1], 105.0);
    EXPECT_EQ(buffer.GetDataCount(), 0u);
}
