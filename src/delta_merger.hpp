#ifndef SBSYNC_DELTA_MERGER_HPP
#define SBSYNC_DELTA_MERGER_HPP

#include "chunk.hpp"
#include "chunk_log.hpp"
#include "hash_set.hpp"

#include <iosfwd>
#include <memory>
#include <vector>

namespace sbsync {

/**
 * @brief Counters for one pass over a chunk sequence (advisory only)
 */
struct MergeStats
{
  size_t nKeptChunks = 0;
  size_t nDeletedChunks = 0;
  size_t nAnomalousChunks = 0;
  size_t nAddPrefixes = 0;
  size_t nSubPrefixes = 0;
  size_t nAddFullHashes = 0;
  size_t nSubFullHashes = 0;
};

std::ostream&
operator<<(std::ostream& os, const MergeStats& stats);

/**
 * @brief Output of a merge; nothing in here is live yet
 */
struct MergeResult
{
  std::unique_ptr<HashSet> prefixes;
  std::unique_ptr<HashSet> fullHashes;
  std::unique_ptr<HashSet> resolvedHashes;

  /// chunk numbers copied into the new log, by chunk type
  ChunkNumMap kept;

  MergeStats existingStats;
  MergeStats deltaStats;
};

/**
 * @brief Rebuilds the lookup tables and the chunk log from scratch
 *
 * Every chunk of the existing log, then every chunk of the delta, goes
 * through the same steps: drop it if a deletion is pending for it, skip it
 * if its type/width is not recognized or it exceeds MAX_CHUNK_SIZE,
 * otherwise copy it to the new log and
 * apply its entries to the fresh tables. A later chunk touching the same
 * hash wins.
 */
class DeltaMerger
{
public:
  explicit
  DeltaMerger(const ChunkNumMap& pendingDeletions,
              const HashSetFactory& makeHashSet = &makeUnorderedHashSet);

  /**
   * @param existing the persisted log, or nullptr if there is none
   * @param delta    newly fetched chunks, in fetch order
   * @param output   receives every kept chunk
   * @throw ChunkLogReader::Error the existing log is malformed
   * @throw ChunkLogWriter::Error the new log cannot be written
   */
  MergeResult
  merge(ChunkLogReader* existing, const std::vector<ChunkRecord>& delta, ChunkLogWriter& output);

private:
  bool
  isDeleted(const ChunkRecord& chunk) const;

  void
  process(const ChunkRecord& chunk, ChunkLogWriter& output, MergeResult& result, MergeStats& stats);

  void
  updateLookupMap(const ChunkRecord& chunk, ChunkBucket bucket, MergeResult& result);

private:
  const ChunkNumMap& m_pendingDeletions;
  HashSetFactory m_makeHashSet;
};

} // namespace sbsync

#endif // SBSYNC_DELTA_MERGER_HPP
