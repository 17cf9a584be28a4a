#include "lookup_snapshot.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <boost/throw_exception.hpp>

#include <algorithm>
#include <stdexcept>

namespace sbsync {

NDN_LOG_INIT(sbsync.LookupSnapshot);

// don't size the filter for fewer prefixes than this
static const unsigned long long BLOOM_FILTER_MIN_SIZE = 1000;

LookupSnapshot::LookupSnapshot(double falsePositiveProbability)
  : m_prefixes(makeUnorderedHashSet(PREFIX_4B_SZ))
  , m_fullHashes(makeUnorderedHashSet(PREFIX_32B_SZ))
  , m_resolvedHashes(makeUnorderedHashSet(PREFIX_32B_SZ))
{
  buildFilter(falsePositiveProbability);
}

LookupSnapshot::LookupSnapshot(std::unique_ptr<HashSet> prefixes,
                               std::unique_ptr<HashSet> fullHashes,
                               std::unique_ptr<HashSet> resolvedHashes,
                               double falsePositiveProbability)
  : m_prefixes(std::move(prefixes))
  , m_fullHashes(std::move(fullHashes))
  , m_resolvedHashes(std::move(resolvedHashes))
{
  buildFilter(falsePositiveProbability);
}

void
LookupSnapshot::buildFilter(double falsePositiveProbability)
{
  if (!(falsePositiveProbability > 0.0 && falsePositiveProbability < 1.0)) {
    BOOST_THROW_EXCEPTION(std::invalid_argument("Bloom filter false positive probability must be in (0, 1)"));
  }

  bloom_parameters opt;
  opt.projected_element_count = std::max<unsigned long long>(m_prefixes->size(),
                                                             BLOOM_FILTER_MIN_SIZE);
  opt.false_positive_probability = falsePositiveProbability;
  if (!opt) {
    BOOST_THROW_EXCEPTION(std::invalid_argument("Invalid bloom filter parameters"));
  }
  opt.compute_optimal_parameters();

  m_prefixFilter = bloom_filter(opt);
  m_prefixes->forEach([this] (const std::string& prefix) {
    m_prefixFilter.insert(prefix);
  });

  NDN_LOG_DEBUG("Built prefix filter over " << m_prefixes->size() << " prefixes, "
                << m_prefixFilter.size() << " bits");
}

bool
LookupSnapshot::containsPrefix(const std::string& prefix) const
{
  if (!m_prefixFilter.contains(prefix)) {
    return false;
  }
  return m_prefixes->contains(prefix);
}

} // namespace sbsync
