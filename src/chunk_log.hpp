#ifndef SBSYNC_CHUNK_LOG_HPP
#define SBSYNC_CHUNK_LOG_HPP

#include "chunk.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace sbsync {

/**
 * @brief Reads the persisted chunk log one record at a time
 *
 * The log is a plain concatenation of ChunkData blocks. The reader is a
 * single forward pass; it cannot be rewound.
 */
class ChunkLogReader
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
   * @throw Error the file exists but cannot be opened
   */
  explicit
  ChunkLogReader(const std::string& fileName);

  /**
   * @brief reads the next record into @p chunk
   * @return false at end of log
   * @throw Error the log is truncated or holds something that is not a chunk
   */
  bool
  read(ChunkRecord& chunk);

  size_t
  getNumRead() const
  {
    return m_nRead;
  }

private:
  /// @brief reads one TLV-TYPE or TLV-LENGTH, appending its bytes to @p raw
  uint64_t
  readVarNumber(ndn::Buffer& raw);

private:
  std::string m_fileName;
  std::ifstream m_is;
  size_t m_nRead;
};

/**
 * @brief Writes a new chunk log into a private file
 *
 * Nothing is visible at the target path until commit() returns. If the
 * writer is destroyed without a successful commit(), the file is removed.
 */
class ChunkLogWriter
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
   * @throw Error the file cannot be created
   */
  explicit
  ChunkLogWriter(const std::string& fileName);

  ~ChunkLogWriter();

  ChunkLogWriter(const ChunkLogWriter&) = delete;

  ChunkLogWriter&
  operator=(const ChunkLogWriter&) = delete;

  /**
   * @throw Error the chunk is larger than MAX_CHUNK_SIZE or cannot be written
   */
  void
  write(const ChunkRecord& chunk);

  /**
   * @brief flushes the log to stable storage and closes it
   */
  void
  commit();

  /**
   * @brief flushes the directory entry of @p fileName, e.g. after a rename
   * @throw Error the parent directory cannot be opened or synced
   */
  static void
  syncParentDirectory(const std::string& fileName);

  const std::string&
  getFileName() const
  {
    return m_fileName;
  }

  size_t
  getNumWritten() const
  {
    return m_nWritten;
  }

private:
  void
  writeAll(const uint8_t* buf, size_t size);

private:
  std::string m_fileName;
  int m_fd;
  bool m_isCommitted;
  size_t m_nWritten;
};

} // namespace sbsync

#endif // SBSYNC_CHUNK_LOG_HPP
