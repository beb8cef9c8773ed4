#include <gtest/gtest.h>
#include "geoteams/errors.hpp"
#include "geoteams/validation.hpp"

using namespace geoteams;

TEST(ValidateTeamCount, Valid) {
    EXPECT_NO_THROW(validate_team_count(10, 3));
    EXPECT_NO_THROW(validate_team_count(10, 10));
    EXPECT_NO_THROW(validate_team_count(10, 1));
}

TEST(ValidateTeamCount, Invalid) {
    EXPECT_THROW(validate_team_count(5, 10), InputError);
    EXPECT_THROW(validate_team_count(10, 0), InputError);
    EXPECT_THROW(validate_team_count(10, -1), InputError);
}

TEST(ValidateSafeCapacity, ExceedsThreshold) {
    try {
        validate_safe_capacity(20, 3, 8);
        FAIL() << "expected CapacityError";
    } catch (const CapacityError& e) {
        EXPECT_EQ(e.reason(), CapacityError::Reason::UnsafeLoad);
        EXPECT_EQ(e.groups(), 3u);
        EXPECT_EQ(e.capacity(), 8u);
    }
}

TEST(ValidateSafeCapacity, JustBelowThreshold) {
    EXPECT_NO_THROW(validate_safe_capacity(19, 3, 8));
}

TEST(ValidateSafeCapacity, WellBelowThreshold) {
    EXPECT_NO_THROW(validate_safe_capacity(18, 3, 8));
    EXPECT_NO_THROW(validate_safe_capacity(10, 3, 8));
    EXPECT_NO_THROW(validate_safe_capacity(1, 1, 8));
}

TEST(ValidateSafeCapacity, ZeroCapacityIsInputError) {
    EXPECT_THROW(validate_safe_capacity(1, 1, 0), InputError);
}
