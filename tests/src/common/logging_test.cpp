#include <gtest/gtest.h>
#include <tender/common/logging.hpp>

TEST(logging, parses_known_levels) {
  EXPECT_EQ(tender::common::try_parse_log_level("debug"),
            spdlog::level::debug);
  EXPECT_EQ(tender::common::try_parse_log_level("warning"),
            spdlog::level::warn);
  EXPECT_EQ(tender::common::try_parse_log_level("off"), spdlog::level::off);
}

TEST(logging, rejects_unknown_levels) {
  EXPECT_FALSE(tender::common::try_parse_log_level("loud").has_value());
  EXPECT_FALSE(tender::common::try_parse_log_level("").has_value());
}
