#include "full_hash_cache.hpp"

#include <ndn-cxx/util/logger.hpp>

namespace sbsync {

NDN_LOG_INIT(sbsync.FullHashCache);

void
FullHashCache::insert(const std::string& fullHash, bool isMatch,
                      const ndn::time::milliseconds& lifetime)
{
  ndn::time::steady_clock::TimePoint now = ndn::time::steady_clock::now();
  Entry entry;
  entry.isMatch = isMatch;
  entry.expiry = now + lifetime;

  std::lock_guard<std::mutex> lock(m_mutex);
  purgeExpired(now);
  m_entries[fullHash] = entry;
  m_expiryQueue.insert(std::make_pair(entry.expiry, fullHash));
}

bool
FullHashCache::find(const std::string& fullHash, Entry& entry)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  purgeExpired(ndn::time::steady_clock::now());

  auto it = m_entries.find(fullHash);
  if (it == m_entries.end()) {
    return false;
  }

  entry = it->second;
  return true;
}

void
FullHashCache::erase(const std::string& fullHash)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_entries.erase(fullHash);
}

size_t
FullHashCache::invalidate(const HashSet& resolved)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  purgeExpired(ndn::time::steady_clock::now());

  size_t nErased = 0;
  for (auto it = m_entries.begin(); it != m_entries.end(); ) {
    if (resolved.contains(it->first)) {
      it = m_entries.erase(it);
      ++nErased;
    }
    else {
      ++it;
    }
  }

  if (nErased > 0) {
    NDN_LOG_DEBUG("Invalidated " << nErased << " resolved cache entries");
  }
  return nErased;
}

void
FullHashCache::purgeExpired(const ndn::time::steady_clock::TimePoint& now)
{
  auto last = m_expiryQueue.upper_bound(now);
  size_t nPurged = 0;
  for (auto it = m_expiryQueue.begin(); it != last; ++it) {
    auto entry = m_entries.find(it->second);
    if (entry != m_entries.end() && entry->second.expiry <= now) {
      m_entries.erase(entry);
      ++nPurged;
    }
  }
  m_expiryQueue.erase(m_expiryQueue.begin(), last);

  if (nPurged > 0) {
    NDN_LOG_TRACE("Purged " << nPurged << " expired entries");
  }
}

size_t
FullHashCache::size() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.size();
}

} // namespace sbsync
