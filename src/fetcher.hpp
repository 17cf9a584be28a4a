#ifndef SBSYNC_FETCHER_HPP
#define SBSYNC_FETCHER_HPP

#include <ndn-cxx/encoding/buffer.hpp>

#include <stdexcept>
#include <string>

namespace sbsync {

/**
 * @brief Retrieves the raw bytes of one delta source
 */
class Fetcher
{
public:
  class Error : public std::runtime_error
  {
  public:
    explicit
    Error(const std::string& what)
      : std::runtime_error(what)
    {
    }
  };

  virtual
  ~Fetcher() = default;

  /**
   * @throw Error the source could not be retrieved
   */
  virtual ndn::ConstBufferPtr
  fetch(const std::string& location) = 0;
};

} // namespace sbsync

#endif // SBSYNC_FETCHER_HPP
