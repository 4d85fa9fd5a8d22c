#pragma once
#include <boost/program_options.hpp>
#include <tender/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace tender::config {

struct options_t final {
  std::string db_path{"tender.db"};
  std::string domain_name{"tender"};
  std::string domain_version{"1"};
  uint64_t chain_id{1};
  tender::schema::address_t verifying_contract{};
  std::string log_level{"info"};
  std::string log_file;
};

/// Flags every tender binary understands, including `--config`.
boost::program_options::options_description make_options_description();

/// Parse `argv` against the shared flags plus `extra`, then fold in the INI
/// file named by `--config`. Command-line values win over the file. On
/// failure returns std::nullopt and describes the problem in `error`.
std::optional<options_t> parse_options(
    int argc,
    const char* const argv[],
    const boost::program_options::options_description& extra,
    boost::program_options::variables_map& vm,
    std::string& error);

std::optional<options_t> parse_options(int argc,
                                       const char* const argv[],
                                       std::string& error);

}  // namespace tender::config
