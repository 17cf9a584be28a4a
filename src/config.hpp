#ifndef SBSYNC_CONFIG_HPP
#define SBSYNC_CONFIG_HPP

#include <ndn-cxx/util/time.hpp>

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

namespace sbsync {

class ConfigError : public std::runtime_error
{
public:
  explicit
  ConfigError(const std::string& what)
    : std::runtime_error(what)
  {
  }
};

struct Config
{
  std::string dataDir;
  std::vector<std::string> lists;
  double bloomFalsePositive = 0.001;
  ndn::time::milliseconds interestLifetime = ndn::time::milliseconds(4000);

  /// @brief where the chunk log of @p listName is stored
  std::string
  getListFileName(const std::string& listName) const;
};

/**
 * @brief Parses an INFO-format configuration
 *
 *     general
 *     {
 *       data-dir /var/lib/sbsync
 *       bloom-false-positive 0.001
 *       interest-lifetime 4000
 *     }
 *     list goog-malware-shavar
 *     list googpub-phish-shavar
 *
 * @param filename used in error messages only
 * @throw ConfigError
 */
Config
loadConfig(std::istream& input, const std::string& filename);

/**
 * @throw ConfigError the file cannot be read or is invalid
 */
Config
loadConfigFile(const std::string& filename);

} // namespace sbsync

#endif // SBSYNC_CONFIG_HPP
