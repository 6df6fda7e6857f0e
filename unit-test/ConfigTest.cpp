#include <cmath>
#include <stdexcept>
#include "gtest/gtest.h"
#include "config.hpp"

using namespace std;
using namespace runner;

class ConfigTest : public ::testing::Test {
protected:
    double time_limit, max_time_limit;
    int memory_limit, max_memory_limit, file_limit, stream_size, workers;

    void SetUp() override {
        time_limit = TIME_LIMIT;
        max_time_limit = MAX_TIME_LIMIT;
        memory_limit = MEMORY_LIMIT;
        max_memory_limit = MAX_MEMORY_LIMIT;
        file_limit = FILE_LIMIT;
        stream_size = STREAM_SIZE;
        workers = WORKERS;
    }

    void TearDown() override {
        TIME_LIMIT = time_limit;
        MAX_TIME_LIMIT = max_time_limit;
        MEMORY_LIMIT = memory_limit;
        MAX_MEMORY_LIMIT = max_memory_limit;
        FILE_LIMIT = file_limit;
        STREAM_SIZE = stream_size;
        WORKERS = workers;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    EXPECT_NO_THROW(check_config());
}

TEST_F(ConfigTest, NegativeWorkersAreRejected) {
    WORKERS = -1;
    EXPECT_THROW(check_config(), invalid_argument);
    WORKERS = 0;
    EXPECT_THROW(check_config(), invalid_argument);
}

TEST_F(ConfigTest, TimeLimitMustBePositiveAndBounded) {
    TIME_LIMIT = 0;
    EXPECT_THROW(check_config(), invalid_argument);
    TIME_LIMIT = NAN;
    EXPECT_THROW(check_config(), invalid_argument);
    TIME_LIMIT = MAX_TIME_LIMIT + 1;
    EXPECT_THROW(check_config(), invalid_argument);
    TIME_LIMIT = MAX_TIME_LIMIT;
    EXPECT_NO_THROW(check_config());

    MAX_TIME_LIMIT = INFINITY;
    EXPECT_THROW(check_config(), invalid_argument);
}

TEST_F(ConfigTest, MemoryLimitMustBePositiveAndBounded) {
    MEMORY_LIMIT = -5;
    EXPECT_THROW(check_config(), invalid_argument);
    MEMORY_LIMIT = MAX_MEMORY_LIMIT + 1;
    EXPECT_THROW(check_config(), invalid_argument);
    MEMORY_LIMIT = 256;
    MAX_MEMORY_LIMIT = 0;
    EXPECT_THROW(check_config(), invalid_argument);
}

TEST_F(ConfigTest, ErrorMessageNamesTheValue) {
    FILE_LIMIT = 0;
    try {
        check_config();
        FAIL() << "file limit 0 should be rejected";
    } catch (invalid_argument &e) {
        EXPECT_STREQ(e.what(), "file limit must be positive, got 0");
    }
}
