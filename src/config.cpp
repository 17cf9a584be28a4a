#include "config.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/property_tree/info_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/throw_exception.hpp>

#include <fstream>

namespace sbsync {

namespace pt = boost::property_tree;

std::string
Config::getListFileName(const std::string& listName) const
{
  return (boost::filesystem::path(dataDir) / (listName + ".dat")).string();
}

Config
loadConfig(std::istream& input, const std::string& filename)
{
  pt::ptree tree;
  try {
    pt::read_info(input, tree);
  }
  catch (const pt::info_parser_error& e) {
    BOOST_THROW_EXCEPTION(ConfigError("Cannot parse " + filename + ": " + e.what()));
  }

  Config config;
  try {
    const pt::ptree& general = tree.get_child("general");
    config.dataDir = general.get<std::string>("data-dir");
    config.bloomFalsePositive = general.get<double>("bloom-false-positive", config.bloomFalsePositive);
    config.interestLifetime = ndn::time::milliseconds(
      general.get<int64_t>("interest-lifetime", config.interestLifetime.count()));
  }
  catch (const pt::ptree_error& e) {
    BOOST_THROW_EXCEPTION(ConfigError("Invalid general section in " + filename + ": " + e.what()));
  }

  if (config.dataDir.empty()) {
    BOOST_THROW_EXCEPTION(ConfigError("data-dir must not be empty in " + filename));
  }
  if (!(config.bloomFalsePositive > 0.0 && config.bloomFalsePositive < 1.0)) {
    BOOST_THROW_EXCEPTION(ConfigError("bloom-false-positive must be in (0, 1) in " + filename));
  }
  if (config.interestLifetime <= ndn::time::milliseconds::zero()) {
    BOOST_THROW_EXCEPTION(ConfigError("interest-lifetime must be positive in " + filename));
  }

  for (const auto& item : tree) {
    if (item.first == "list") {
      std::string name = item.second.get_value<std::string>();
      if (name.empty()) {
        BOOST_THROW_EXCEPTION(ConfigError("Empty list name in " + filename));
      }
      config.lists.push_back(name);
    }
    else if (item.first != "general") {
      BOOST_THROW_EXCEPTION(ConfigError("Unrecognized section '" + item.first + "' in " + filename));
    }
  }

  if (config.lists.empty()) {
    BOOST_THROW_EXCEPTION(ConfigError("No list configured in " + filename));
  }

  return config;
}

Config
loadConfigFile(const std::string& filename)
{
  std::ifstream input(filename);
  if (!input.is_open()) {
    BOOST_THROW_EXCEPTION(ConfigError("Cannot open " + filename));
  }
  return loadConfig(input, filename);
}

} // namespace sbsync
