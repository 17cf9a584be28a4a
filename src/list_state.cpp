#include "list_state.hpp"
#include "chunk_log.hpp"
#include "chunk_range.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/throw_exception.hpp>

namespace pt = boost::posix_time;
namespace fs = boost::filesystem;

namespace sbsync {

NDN_LOG_INIT(sbsync.ListState);

ListState::ListState(const std::string& name, const std::string& fileName,
                     double falsePositiveProbability)
  : m_name(name)
  , m_fileName(fileName)
  , m_falsePositiveProbability(falsePositiveProbability)
  , m_snapshot(std::make_shared<LookupSnapshot>(falsePositiveProbability))
{
  m_pendingDeletions[ChunkType::ADD];
  m_pendingDeletions[ChunkType::SUB];
  m_chunkRanges[ChunkType::ADD] = "";
  m_chunkRanges[ChunkType::SUB] = "";
}

UpdateStats
ListState::load()
{
  return synchronize(std::vector<ChunkRecord>());
}

UpdateStats
ListState::synchronize(const std::vector<ChunkRecord>& newChunks)
{
  std::lock_guard<std::mutex> updateLock(m_updateMutex);
  return doSynchronize(newChunks);
}

UpdateStats
ListState::doSynchronize(const std::vector<ChunkRecord>& newChunks)
{
  NDN_LOG_INFO("Reloading " << m_name);

  boost::system::error_code ec;
  bool hasLog = fs::exists(m_fileName, ec);
  if (ec) {
    BOOST_THROW_EXCEPTION(Error("Cannot access " + m_fileName + ": " + ec.message()));
  }

  if (newChunks.empty() && !hasLog) {
    NDN_LOG_INFO("Nothing to merge for " << m_name);
    return UpdateStats();
  }

  ChunkNumMap deletions;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    deletions = m_pendingDeletions;
  }

  std::unique_ptr<ChunkLogReader> existing;
  if (hasLog) {
    existing.reset(new ChunkLogReader(m_fileName));
  }
  else {
    NDN_LOG_DEBUG(m_fileName << " does not exist, starting from an empty log");
  }

  const std::string tmpFileName = m_fileName + ".tmp";
  ChunkLogWriter writer(tmpFileName);

  DeltaMerger merger(deletions);
  MergeResult result = merger.merge(existing.get(), newChunks, writer);
  existing.reset();

  std::shared_ptr<const LookupSnapshot> snapshot =
    std::make_shared<LookupSnapshot>(std::move(result.prefixes),
                                     std::move(result.fullHashes),
                                     std::move(result.resolvedHashes),
                                     m_falsePositiveProbability);

  writer.commit();

  // rename() replaces the old log atomically; it is never removed first
  renameLog(tmpFileName, m_fileName, ec);
  if (ec) {
    boost::system::error_code removeEc;
    fs::remove(tmpFileName, removeEc);
    BOOST_THROW_EXCEPTION(Error("Cannot replace " + m_fileName + ": " + ec.message()));
  }

  try {
    ChunkLogWriter::syncParentDirectory(m_fileName);
  }
  catch (const ChunkLogWriter::Error& e) {
    // the new log is in place either way; only its durability is in doubt
    NDN_LOG_WARN(e.what());
  }

  NDN_LOG_DEBUG("Replacing lookup tables of " << m_name);
  std::atomic_store(&m_snapshot, snapshot);

  std::map<ChunkType, std::string> ranges;
  ranges[ChunkType::ADD] = buildChunkRanges(result.kept[ChunkType::ADD]);
  ranges[ChunkType::SUB] = buildChunkRanges(result.kept[ChunkType::SUB]);

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_chunkRanges = ranges;
    // instructions registered while merging stay pending for the next update
    for (const auto& entry : deletions) {
      ChunkNumSet& pending = m_pendingDeletions[entry.first];
      for (ChunkNum number : entry.second) {
        pending.erase(number);
      }
    }
    m_lastUpdated = pt::microsec_clock::universal_time();
  }

  m_cache.invalidate(snapshot->getResolvedHashes());

  UpdateStats stats;
  stats.isMerged = true;
  stats.existing = result.existingStats;
  stats.delta = result.deltaStats;
  stats.nKeptAddChunks = result.kept[ChunkType::ADD].size();
  stats.nKeptSubChunks = result.kept[ChunkType::SUB].size();

  NDN_LOG_INFO("Updated " << m_name << ": " << stats.nKeptAddChunks << " ADD chunks ("
               << ranges[ChunkType::ADD] << "), " << stats.nKeptSubChunks << " SUB chunks ("
               << ranges[ChunkType::SUB] << "), " << snapshot->getPrefixes().size()
               << " prefixes, " << snapshot->getFullHashes().size() << " full hashes");
  return stats;
}

void
ListState::renameLog(const std::string& from, const std::string& to, boost::system::error_code& ec)
{
  fs::rename(from, to, ec);
}

UpdateStats
ListState::loadFromSources(Fetcher& fetcher)
{
  std::lock_guard<std::mutex> updateLock(m_updateMutex);

  std::vector<std::string> sources = getPendingDeltaSources();
  if (sources.empty()) {
    NDN_LOG_INFO("No pending updates available for " << m_name);
    return UpdateStats();
  }

  std::vector<ChunkRecord> newChunks;
  for (const auto& source : sources) {
    ndn::ConstBufferPtr data = fetcher.fetch(source);
    std::vector<ChunkRecord> chunks = decodeChunks(*data);
    NDN_LOG_DEBUG("Decoded " << chunks.size() << " chunks from " << source);
    newChunks.insert(newChunks.end(), chunks.begin(), chunks.end());
  }

  if (newChunks.empty()) {
    BOOST_THROW_EXCEPTION(ChunkRecord::Error("No chunk in " + std::to_string(sources.size()) +
                                             " delta sources of " + m_name));
  }

  UpdateStats stats = doSynchronize(newChunks);

  std::lock_guard<std::mutex> lock(m_mutex);
  // sources are only appended meanwhile, so the fetched ones are in front
  m_deltaSources.erase(m_deltaSources.begin(), m_deltaSources.begin() + sources.size());
  return stats;
}

void
ListState::addDeltaSource(const std::string& location)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_deltaSources.push_back(location);
}

std::vector<std::string>
ListState::getPendingDeltaSources() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return std::vector<std::string>(m_deltaSources.begin(), m_deltaSources.end());
}

void
ListState::requestDeletion(ChunkType type, ChunkNum number)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  m_pendingDeletions[type].insert(number);
}

void
ListState::requestDeletions(ChunkType type, const std::string& ranges)
{
  ChunkNumSet numbers = parseChunkRanges(ranges);

  std::lock_guard<std::mutex> lock(m_mutex);
  m_pendingDeletions[type].insert(numbers.begin(), numbers.end());
}

ChunkNumMap
ListState::getPendingDeletions() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_pendingDeletions;
}

std::map<ChunkType, std::string>
ListState::getChunkRanges() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_chunkRanges;
}

std::string
ListState::getRequestLine() const
{
  return formatListRequest(m_name, getChunkRanges());
}

pt::ptime
ListState::getLastUpdated() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_lastUpdated;
}

} // namespace sbsync
