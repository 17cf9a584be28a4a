#ifndef SBSYNC_LIST_STATE_HPP
#define SBSYNC_LIST_STATE_HPP

#include "chunk.hpp"
#include "common.hpp"
#include "delta_merger.hpp"
#include "fetcher.hpp"
#include "full_hash_cache.hpp"
#include "lookup_snapshot.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/system/error_code.hpp>

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sbsync {

/**
 * @brief Counters reported by one update (advisory only)
 */
struct UpdateStats
{
  /// false if there was nothing to merge
  bool isMerged = false;
  MergeStats existing;
  MergeStats delta;
  size_t nKeptAddChunks = 0;
  size_t nKeptSubChunks = 0;
};

/**
 * @brief State of one blocklist (e.g. goog-malware-shavar)
 *
 * Lookups read the last published LookupSnapshot and never block on an
 * update. Updates are serialized; each one rebuilds the chunk log and the
 * lookup tables from scratch and publishes them only after the new log has
 * replaced the old one on disk.
 */
class ListState
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

  /**
   * @param name       list name used in update requests
   * @param fileName   persisted chunk log; "<fileName>.tmp" is used while merging
   * @param falsePositiveProbability  of the prefix bloom filter
   */
  ListState(const std::string& name, const std::string& fileName,
            double falsePositiveProbability = 0.001);

  SBSYNC_VIRTUAL_WITH_TESTS
  ~ListState() = default;

  ListState(const ListState&) = delete;

  ListState&
  operator=(const ListState&) = delete;

  /**
   * @brief rebuilds the lookup tables from the persisted log
   */
  UpdateStats
  load();

  /**
   * @brief merges @p newChunks into the persisted log and lookup tables
   *
   * Pending deletions are applied and consumed. On any exception the
   * persisted log and the published lookup tables are left as they were.
   *
   * @throw ChunkLogReader::Error the persisted log is malformed
   * @throw ChunkLogWriter::Error the new log cannot be written
   * @throw Error the new log cannot be moved into place
   */
  UpdateStats
  synchronize(const std::vector<ChunkRecord>& newChunks);

  /**
   * @brief fetches and merges every pending delta source
   *
   * Sources stay pending unless the whole batch was merged.
   *
   * @throw Fetcher::Error a source could not be fetched
   * @throw ndn::tlv::Error a source holds malformed chunks, or no chunk at all
   */
  UpdateStats
  loadFromSources(Fetcher& fetcher);

  void
  addDeltaSource(const std::string& location);

  std::vector<std::string>
  getPendingDeltaSources() const;

  void
  requestDeletion(ChunkType type, ChunkNum number);

  /**
   * @brief registers deletion of every chunk in @p ranges, e.g. "1-3,7"
   * @throw ChunkRangeError
   */
  void
  requestDeletions(ChunkType type, const std::string& ranges);

  ChunkNumMap
  getPendingDeletions() const;

  bool
  containsPrefix(const std::string& prefix) const
  {
    return getSnapshot()->containsPrefix(prefix);
  }

  bool
  containsFullHash(const std::string& fullHash) const
  {
    return getSnapshot()->containsFullHash(fullHash);
  }

  /// @brief true if @p fullHash must not be verified remotely again
  bool
  isResolved(const std::string& fullHash) const
  {
    return getSnapshot()->isResolved(fullHash);
  }

  std::shared_ptr<const LookupSnapshot>
  getSnapshot() const
  {
    return std::atomic_load(&m_snapshot);
  }

  std::map<ChunkType, std::string>
  getChunkRanges() const;

  /// @brief the list line of the next update request
  std::string
  getRequestLine() const;

  boost::posix_time::ptime
  getLastUpdated() const;

  FullHashCache&
  getFullHashCache()
  {
    return m_cache;
  }

  const std::string&
  getName() const
  {
    return m_name;
  }

  const std::string&
  getFileName() const
  {
    return m_fileName;
  }

SBSYNC_PROTECTED_WITH_TESTS_ELSE_PRIVATE:
  /// @brief moves the merged log @p from over the persisted log @p to
  SBSYNC_VIRTUAL_WITH_TESTS void
  renameLog(const std::string& from, const std::string& to, boost::system::error_code& ec);

private:
  /// @pre m_updateMutex is held
  UpdateStats
  doSynchronize(const std::vector<ChunkRecord>& newChunks);

private:
  const std::string m_name;
  const std::string m_fileName;
  const double m_falsePositiveProbability;

  // held for a whole update
  std::mutex m_updateMutex;

  // guards the four members that follow
  mutable std::mutex m_mutex;
  std::deque<std::string> m_deltaSources;
  ChunkNumMap m_pendingDeletions;
  std::map<ChunkType, std::string> m_chunkRanges;
  boost::posix_time::ptime m_lastUpdated;

  // only accessed through std::atomic_load and std::atomic_store
  std::shared_ptr<const LookupSnapshot> m_snapshot;
  FullHashCache m_cache;
};

} // namespace sbsync

#endif // SBSYNC_LIST_STATE_HPP
