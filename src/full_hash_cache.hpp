#ifndef SBSYNC_FULL_HASH_CACHE_HPP
#define SBSYNC_FULL_HASH_CACHE_HPP

#include "hash_set.hpp"

#include <ndn-cxx/util/time.hpp>

#include <map>
#include <mutex>
#include <string>

namespace sbsync {

/**
 * @brief Remembers full hash verification answers until they expire
 *
 * Entries whose hash has been retracted by a SUB full hash chunk are
 * dropped by invalidate(); the distributor's answer supersedes them.
 * Expired entries are purged by every insert(), find() and invalidate().
 */
class FullHashCache
{
public:
  struct Entry
  {
    /// true if the verification service reported the hash as a match
    bool isMatch;
    ndn::time::steady_clock::TimePoint expiry;
  };

  void
  insert(const std::string& fullHash, bool isMatch, const ndn::time::milliseconds& lifetime);

  /**
   * @brief looks up an unexpired entry
   * @return true and fills @p entry if one is present; an expired entry is
   *         removed and reported absent
   */
  bool
  find(const std::string& fullHash, Entry& entry);

  void
  erase(const std::string& fullHash);

  /**
   * @brief removes every entry whose hash is in @p resolved
   * @return number of entries removed
   */
  size_t
  invalidate(const HashSet& resolved);

  size_t
  size() const;

private:
  /// @pre m_mutex is held
  void
  purgeExpired(const ndn::time::steady_clock::TimePoint& now);

private:
  mutable std::mutex m_mutex;
  std::map<std::string, Entry> m_entries;
  // one item per insert(); an item is stale once its entry was replaced or erased
  std::multimap<ndn::time::steady_clock::TimePoint, std::string> m_expiryQueue;
};

} // namespace sbsync

#endif // SBSYNC_FULL_HASH_CACHE_HPP
