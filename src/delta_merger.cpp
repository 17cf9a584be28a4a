#include "delta_merger.hpp"

#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/string-helper.hpp>

#include <ostream>

namespace sbsync {

NDN_LOG_INIT(sbsync.DeltaMerger);

std::ostream&
operator<<(std::ostream& os, const MergeStats& stats)
{
  return os << stats.nKeptChunks << " kept, "
            << stats.nDeletedChunks << " deleted, "
            << stats.nAnomalousChunks << " anomalous chunks ("
            << stats.nAddPrefixes << " ADD prefixes, "
            << stats.nSubPrefixes << " SUB prefixes, "
            << stats.nAddFullHashes << " ADD full hashes, "
            << stats.nSubFullHashes << " SUB full hashes)";
}

DeltaMerger::DeltaMerger(const ChunkNumMap& pendingDeletions, const HashSetFactory& makeHashSet)
  : m_pendingDeletions(pendingDeletions)
  , m_makeHashSet(makeHashSet)
{
}

MergeResult
DeltaMerger::merge(ChunkLogReader* existing, const std::vector<ChunkRecord>& delta,
                   ChunkLogWriter& output)
{
  MergeResult result;
  // full hash state is rederived on every update, never patched
  result.prefixes = m_makeHashSet(PREFIX_4B_SZ);
  result.fullHashes = m_makeHashSet(PREFIX_32B_SZ);
  result.resolvedHashes = m_makeHashSet(PREFIX_32B_SZ);
  result.kept[ChunkType::ADD];
  result.kept[ChunkType::SUB];

  if (existing != nullptr) {
    NDN_LOG_DEBUG("Loading existing chunks");
    ChunkRecord chunk;
    while (existing->read(chunk)) {
      process(chunk, output, result, result.existingStats);
    }
    NDN_LOG_INFO("Existing log: " << result.existingStats);
  }

  NDN_LOG_DEBUG("Adding " << delta.size() << " updated chunks");
  for (const auto& chunk : delta) {
    process(chunk, output, result, result.deltaStats);
  }
  NDN_LOG_INFO("Delta: " << result.deltaStats);

  return result;
}

bool
DeltaMerger::isDeleted(const ChunkRecord& chunk) const
{
  auto it = m_pendingDeletions.find(chunk.getType());
  if (it == m_pendingDeletions.end()) {
    return false;
  }
  return it->second.count(chunk.getNumber()) > 0;
}

void
DeltaMerger::process(const ChunkRecord& chunk, ChunkLogWriter& output,
                     MergeResult& result, MergeStats& stats)
{
  if (isDeleted(chunk)) {
    NDN_LOG_DEBUG("Dropping deleted " << chunk.getType() << " chunk " << chunk.getNumber());
    ++stats.nDeletedChunks;
    return;
  }

  // a chunk the log reader would refuse must not reach the log
  if (chunk.wireEncode().value_size() > MAX_CHUNK_SIZE) {
    NDN_LOG_WARN("Skipping " << chunk.getType() << " chunk " << chunk.getNumber() << " of "
                 << chunk.wireEncode().value_size() << " bytes");
    ++stats.nAnomalousChunks;
    return;
  }

  ChunkBucket bucket = chunk.classify();
  size_t nEntries = chunk.getEntryCount();

  switch (bucket) {
    case ChunkBucket::ADD_PREFIX:
      stats.nAddPrefixes += nEntries;
      break;
    case ChunkBucket::ADD_FULL_HASH:
      stats.nAddFullHashes += nEntries;
      break;
    case ChunkBucket::SUB_PREFIX:
      stats.nSubPrefixes += nEntries;
      break;
    case ChunkBucket::SUB_FULL_HASH:
      stats.nSubFullHashes += nEntries;
      break;
    case ChunkBucket::UNRECOGNIZED:
      NDN_LOG_WARN("Skipping chunk " << chunk.getNumber() << " with unrecognized type "
                   << chunk.getType() << " and entry width " << chunk.getEntryWidth());
      ++stats.nAnomalousChunks;
      return;
  }

  result.kept[chunk.getType()].insert(chunk.getNumber());
  output.write(chunk);
  updateLookupMap(chunk, bucket, result);
  ++stats.nKeptChunks;
}

void
DeltaMerger::updateLookupMap(const ChunkRecord& chunk, ChunkBucket bucket, MergeResult& result)
{
  size_t nEntries = chunk.getEntryCount();

  for (size_t i = 0; i < nEntries; ++i) {
    std::string hash = chunk.getEntry(i);

    switch (bucket) {
      case ChunkBucket::ADD_PREFIX:
        result.prefixes->insert(hash);
        break;
      case ChunkBucket::SUB_PREFIX:
        result.prefixes->erase(hash);
        break;
      case ChunkBucket::ADD_FULL_HASH:
        NDN_LOG_TRACE("Adding full length hash "
                      << ndn::toHex(reinterpret_cast<const uint8_t*>(hash.data()), hash.size()));
        result.fullHashes->insert(hash);
        break;
      case ChunkBucket::SUB_FULL_HASH:
        // a SUB full hash corrects an earlier false positive; remember it
        // so that it is never requested again
        result.fullHashes->erase(hash);
        result.resolvedHashes->insert(hash);
        break;
      case ChunkBucket::UNRECOGNIZED:
        return;
    }
  }
}

} // namespace sbsync
