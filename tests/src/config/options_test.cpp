#include <gtest/gtest.h>
#include <tender/config/options.hpp>
#include <tender/testing/common.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace {

std::optional<tender::config::options_t> parse(
    const std::vector<std::string>& args,
    std::string& error) {
  auto argv = std::vector<const char*>{"tender"};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return tender::config::parse_options(static_cast<int>(argv.size()),
                                       argv.data(), error);
}

}  // namespace

TEST(options, defaults_apply_without_flags) {
  auto error = std::string{};
  auto options = parse({}, error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->db_path, "tender.db");
  EXPECT_EQ(options->domain_name, "tender");
  EXPECT_EQ(options->domain_version, "1");
  EXPECT_EQ(options->chain_id, 1u);
  EXPECT_EQ(options->verifying_contract, tender::schema::make_zero_address());
  EXPECT_EQ(options->log_level, "info");
  EXPECT_TRUE(options->log_file.empty());
}

TEST(options, command_line_overrides_defaults) {
  auto error = std::string{};
  auto options =
      parse({"--db-path", "/tmp/other", "--chain-id", "137", "--domain-name",
             "desk", "--verifying-contract",
             "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf", "--log-level",
             "debug"},
            error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->db_path, "/tmp/other");
  EXPECT_EQ(options->chain_id, 137u);
  EXPECT_EQ(options->domain_name, "desk");
  EXPECT_EQ(options->verifying_contract,
            tender::schema::try_make_address(
                "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf")
                .value());
  EXPECT_EQ(options->log_level, "debug");
}

TEST(options, config_file_fills_unset_flags) {
  const auto path = tender::testing::make_db_path("tender_options") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "db-path = /var/lib/tender\n"
         << "chain-id = 5\n"
         << "domain-version = 2\n"
         << "unrelated = ignored\n";
  }

  auto error = std::string{};
  auto options = parse({"--config", path, "--chain-id", "10"}, error);
  tender::testing::remove_path(path);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->db_path, "/var/lib/tender");
  EXPECT_EQ(options->domain_version, "2");
  EXPECT_EQ(options->chain_id, 10u);
}

TEST(options, missing_config_file_is_an_error) {
  auto error = std::string{};
  auto options = parse({"--config", "/nonexistent/tender.ini"}, error);
  EXPECT_FALSE(options.has_value());
  EXPECT_FALSE(error.empty());
}

TEST(options, rejects_malformed_values) {
  auto error = std::string{};
  EXPECT_FALSE(parse({"--verifying-contract", "0x1234"}, error).has_value());
  EXPECT_NE(error.find("verifying-contract"), std::string::npos);

  error.clear();
  EXPECT_FALSE(parse({"--log-level", "loud"}, error).has_value());
  EXPECT_NE(error.find("loud"), std::string::npos);

  error.clear();
  EXPECT_FALSE(parse({"--chain-id", "abc"}, error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(parse({"--no-such-flag"}, error).has_value());
  EXPECT_FALSE(error.empty());
}
