#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

#include "SignalStore.hpp"

class SignalStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "signal_store_test_" + std::to_string(::getpid()) + ".ir";
    }
    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(SignalStoreTest, FileHoldsExactlyTheCapturedBytes) {
    LearnedSignal signal{Bytes{0x00, 0x68, 0x64, 0xFF, 0x0A, 0x0D}, SignalKind::Infrared};
    ASSERT_TRUE(SignalStore::save(path_, signal));

    std::ifstream in(path_, std::ios::binary);
    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_EQ(raw.size(), signal.bytes.size());
    EXPECT_TRUE(std::equal(raw.begin(), raw.end(), signal.bytes.begin(),
                           [](char c, uint8_t b) { return static_cast<uint8_t>(c) == b; }));
}

TEST_F(SignalStoreTest, LoadReturnsSavedBytesWithRequestedKind) {
    LearnedSignal signal{Bytes(700, 0x5A), SignalKind::RF433};
    ASSERT_TRUE(SignalStore::save(path_, signal));

    auto loaded = SignalStore::load(path_, SignalKind::RF433);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->bytes, signal.bytes);
    EXPECT_EQ(loaded->kind, SignalKind::RF433);
}

TEST_F(SignalStoreTest, SaveOverwritesPreviousSignal) {
    ASSERT_TRUE(SignalStore::save(path_, LearnedSignal{Bytes(50, 0x01), SignalKind::Infrared}));
    ASSERT_TRUE(SignalStore::save(path_, LearnedSignal{Bytes{0x02}, SignalKind::Infrared}));
    auto loaded = SignalStore::load(path_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->bytes, Bytes{0x02});
}

TEST_F(SignalStoreTest, MissingFileIsAbsent) {
    EXPECT_FALSE(SignalStore::load(path_ + ".missing").has_value());
}

TEST_F(SignalStoreTest, UnwritablePathFails) {
    EXPECT_FALSE(SignalStore::save("/nonexistent-dir/signal.ir", LearnedSignal{Bytes{0x01}, SignalKind::Infrared}));
}
