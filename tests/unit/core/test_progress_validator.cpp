/**
 * @file test_progress_validator.cpp
 * @brief Unit tests for progress snapshot validation
 */

#include <gtest/gtest.h>

#include <kcenon/batch_import/core/progress_validator.h>

#include <limits>

namespace kcenon::batch_import::test {

class ProgressValidatorTest : public ::testing::Test {
protected:
    static auto snapshot(int processed, int total, double percentage) -> import_progress {
        import_progress p;
        p.processed_files = processed;
        p.total_files = total;
        p.percentage = percentage;
        return p;
    }

    static auto consistent(int processed, int total) -> import_progress {
        return snapshot(processed, total, progress_validator::expected_percentage(processed, total));
    }
};

// ============================================================================
// Standalone checks
// ============================================================================

TEST_F(ProgressValidatorTest, AcceptsConsistentSnapshot) {
    EXPECT_TRUE(progress_validator::validate(consistent(0, 3)).has_value());
    EXPECT_TRUE(progress_validator::validate(consistent(1, 3)).has_value());
    EXPECT_TRUE(progress_validator::validate(consistent(3, 3)).has_value());
}

TEST_F(ProgressValidatorTest, RejectsNonPositiveTotal) {
    auto r = progress_validator::validate(snapshot(0, 0, 0.0));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_progress);
    EXPECT_NE(r.error().message.find("total files must be positive"), std::string::npos);
}

TEST_F(ProgressValidatorTest, RejectsNegativeProcessed) {
    EXPECT_FALSE(progress_validator::validate(snapshot(-1, 3, 0.0)).has_value());
}

TEST_F(ProgressValidatorTest, RejectsProcessedAboveTotal) {
    auto r = progress_validator::validate(snapshot(5, 3, 100.0));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "processed files exceeds total: 5 > 3");
}

TEST_F(ProgressValidatorTest, RejectsPercentageOutOfRange) {
    EXPECT_FALSE(progress_validator::validate(snapshot(3, 3, 100.5)).has_value());
    EXPECT_FALSE(progress_validator::validate(snapshot(0, 3, -0.5)).has_value());
    EXPECT_FALSE(progress_validator::validate(
                     snapshot(0, 3, std::numeric_limits<double>::quiet_NaN()))
                     .has_value());
}

TEST_F(ProgressValidatorTest, PercentageToleranceIsOnePoint) {
    // 1/3 = 33.33%
    EXPECT_TRUE(progress_validator::validate(snapshot(1, 3, 34.0)).has_value());
    EXPECT_TRUE(progress_validator::validate(snapshot(1, 3, 32.5)).has_value());
    EXPECT_FALSE(progress_validator::validate(snapshot(1, 3, 34.5)).has_value());
    EXPECT_FALSE(progress_validator::validate(snapshot(1, 3, 50.0)).has_value());
}

TEST_F(ProgressValidatorTest, ExpectedPercentage) {
    EXPECT_DOUBLE_EQ(progress_validator::expected_percentage(0, 4), 0.0);
    EXPECT_DOUBLE_EQ(progress_validator::expected_percentage(1, 4), 25.0);
    EXPECT_DOUBLE_EQ(progress_validator::expected_percentage(4, 4), 100.0);
    EXPECT_DOUBLE_EQ(progress_validator::expected_percentage(0, 0), 0.0);
}

// ============================================================================
// Checks against the previous snapshot
// ============================================================================

TEST_F(ProgressValidatorTest, MonotonicSequenceAccepted) {
    import_progress previous;
    for (int i = 0; i <= 3; ++i) {
        auto next = consistent(i, 3);
        EXPECT_TRUE(progress_validator::validate(next, previous).has_value()) << "step " << i;
        previous = next;
    }
}

TEST_F(ProgressValidatorTest, DecreaseRejected) {
    auto r = progress_validator::validate(consistent(1, 3), consistent(3, 3));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "processed files decreased: 3 -> 1");
}

TEST_F(ProgressValidatorTest, ResetToZeroAllowed) {
    EXPECT_TRUE(progress_validator::validate(consistent(0, 3), consistent(2, 3)).has_value());
}

TEST_F(ProgressValidatorTest, TotalChangeRejected) {
    auto r = progress_validator::validate(consistent(1, 4), consistent(1, 3));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "total files changed during import: 3 -> 4");
}

TEST_F(ProgressValidatorTest, EmptyPreviousIgnored) {
    import_progress none;
    EXPECT_TRUE(progress_validator::validate(consistent(2, 5), none).has_value());
}

}  // namespace kcenon::batch_import::test
