#ifndef SBSYNC_LOOKUP_SNAPSHOT_HPP
#define SBSYNC_LOOKUP_SNAPSHOT_HPP

#include "hash_set.hpp"

#include "bloom_filter.hpp"

#include <memory>
#include <string>

namespace sbsync {

/**
 * @brief Immutable set of lookup tables published by one merge
 *
 * Prefix queries go through a bloom filter built from the final prefix
 * set, so most misses never touch the exact set.
 */
class LookupSnapshot
{
public:
  /// @brief empty tables
  explicit
  LookupSnapshot(double falsePositiveProbability);

  LookupSnapshot(std::unique_ptr<HashSet> prefixes,
                 std::unique_ptr<HashSet> fullHashes,
                 std::unique_ptr<HashSet> resolvedHashes,
                 double falsePositiveProbability);

  bool
  containsPrefix(const std::string& prefix) const;

  bool
  containsFullHash(const std::string& fullHash) const
  {
    return m_fullHashes->contains(fullHash);
  }

  bool
  isResolved(const std::string& fullHash) const
  {
    return m_resolvedHashes->contains(fullHash);
  }

  const HashSet&
  getPrefixes() const
  {
    return *m_prefixes;
  }

  const HashSet&
  getFullHashes() const
  {
    return *m_fullHashes;
  }

  const HashSet&
  getResolvedHashes() const
  {
    return *m_resolvedHashes;
  }

private:
  void
  buildFilter(double falsePositiveProbability);

private:
  std::unique_ptr<HashSet> m_prefixes;
  std::unique_ptr<HashSet> m_fullHashes;
  std::unique_ptr<HashSet> m_resolvedHashes;
  bloom_filter m_prefixFilter;
};

} // namespace sbsync

#endif // SBSYNC_LOOKUP_SNAPSHOT_HPP
