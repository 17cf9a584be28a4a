#include "chunk_log.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <boost/filesystem/path.hpp>
#include <boost/throw_exception.hpp>

#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <unistd.h>

namespace sbsync {

NDN_LOG_INIT(sbsync.ChunkLog);

ChunkLogReader::ChunkLogReader(const std::string& fileName)
  : m_fileName(fileName)
  , m_is(fileName, std::ios::in | std::ios::binary)
  , m_nRead(0)
{
  if (!m_is.is_open()) {
    BOOST_THROW_EXCEPTION(Error("Cannot open " + fileName + " for reading"));
  }
}

bool
ChunkLogReader::read(ChunkRecord& chunk)
{
  if (m_is.peek() == std::ifstream::traits_type::eof()) {
    if (m_is.bad()) {
      BOOST_THROW_EXCEPTION(Error("I/O error reading " + m_fileName));
    }
    NDN_LOG_TRACE("End of " << m_fileName << " after " << m_nRead << " chunks");
    return false;
  }

  try {
    auto buffer = std::make_shared<ndn::Buffer>();
    readVarNumber(*buffer);
    uint64_t length = readVarNumber(*buffer);
    if (length > MAX_CHUNK_SIZE) {
      BOOST_THROW_EXCEPTION(ndn::tlv::Error("TLV-LENGTH " + std::to_string(length) + " exceeds limit"));
    }

    size_t headerSize = buffer->size();
    buffer->resize(headerSize + length);
    if (!m_is.read(reinterpret_cast<char*>(buffer->data() + headerSize), length)) {
      BOOST_THROW_EXCEPTION(ndn::tlv::Error("Truncated TLV-VALUE"));
    }

    chunk.wireDecode(ndn::Block(buffer));
  }
  catch (const ndn::tlv::Error& e) {
    BOOST_THROW_EXCEPTION(Error("Malformed chunk #" + std::to_string(m_nRead + 1) +
                                " in " + m_fileName + ": " + e.what()));
  }

  ++m_nRead;
  return true;
}

uint64_t
ChunkLogReader::readVarNumber(ndn::Buffer& raw)
{
  int first = m_is.get();
  if (first == std::ifstream::traits_type::eof()) {
    BOOST_THROW_EXCEPTION(ndn::tlv::Error("Truncated TLV header"));
  }
  raw.push_back(static_cast<uint8_t>(first));

  size_t nBytes = 0;
  if (first < 253) {
    return static_cast<uint64_t>(first);
  }
  else if (first == 253) {
    nBytes = 2;
  }
  else if (first == 254) {
    nBytes = 4;
  }
  else {
    nBytes = 8;
  }

  uint64_t value = 0;
  for (size_t i = 0; i < nBytes; ++i) {
    int byte = m_is.get();
    if (byte == std::ifstream::traits_type::eof()) {
      BOOST_THROW_EXCEPTION(ndn::tlv::Error("Truncated TLV header"));
    }
    raw.push_back(static_cast<uint8_t>(byte));
    value = (value << 8) | static_cast<uint8_t>(byte);
  }
  return value;
}

ChunkLogWriter::ChunkLogWriter(const std::string& fileName)
  : m_fileName(fileName)
  , m_fd(::open(fileName.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644))
  , m_isCommitted(false)
  , m_nWritten(0)
{
  if (m_fd < 0) {
    BOOST_THROW_EXCEPTION(Error("Cannot create " + fileName + ": " + std::strerror(errno)));
  }
}

ChunkLogWriter::~ChunkLogWriter()
{
  if (m_fd >= 0) {
    ::close(m_fd);
  }

  if (!m_isCommitted) {
    NDN_LOG_DEBUG("Discarding " << m_fileName);
    if (::unlink(m_fileName.c_str()) != 0 && errno != ENOENT) {
      NDN_LOG_ERROR("Cannot remove " << m_fileName << ": " << std::strerror(errno));
    }
  }
}

void
ChunkLogWriter::write(const ChunkRecord& chunk)
{
  if (m_isCommitted) {
    BOOST_THROW_EXCEPTION(Error(m_fileName + " is already committed"));
  }

  const ndn::Block& wire = chunk.wireEncode();
  if (wire.value_size() > MAX_CHUNK_SIZE) {
    BOOST_THROW_EXCEPTION(Error("Chunk " + std::to_string(chunk.getNumber()) + " of " +
                                std::to_string(wire.value_size()) + " bytes exceeds the log limit"));
  }
  writeAll(wire.wire(), wire.size());
  ++m_nWritten;
}

void
ChunkLogWriter::writeAll(const uint8_t* buf, size_t size)
{
  while (size > 0) {
    ssize_t n = ::write(m_fd, buf, size);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      BOOST_THROW_EXCEPTION(Error("Cannot write " + m_fileName + ": " + std::strerror(errno)));
    }
    buf += n;
    size -= static_cast<size_t>(n);
  }
}

void
ChunkLogWriter::commit()
{
  if (m_isCommitted) {
    return;
  }

  if (::fsync(m_fd) != 0) {
    BOOST_THROW_EXCEPTION(Error("Cannot sync " + m_fileName + ": " + std::strerror(errno)));
  }

  int fd = m_fd;
  m_fd = -1;
  if (::close(fd) != 0) {
    BOOST_THROW_EXCEPTION(Error("Cannot close " + m_fileName + ": " + std::strerror(errno)));
  }

  m_isCommitted = true;
  NDN_LOG_DEBUG("Committed " << m_nWritten << " chunks to " << m_fileName);
}

void
ChunkLogWriter::syncParentDirectory(const std::string& fileName)
{
  std::string dirName = boost::filesystem::path(fileName).parent_path().string();
  if (dirName.empty()) {
    dirName = ".";
  }

  int fd = ::open(dirName.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    BOOST_THROW_EXCEPTION(Error("Cannot open directory " + dirName + ": " + std::strerror(errno)));
  }

  int result = ::fsync(fd);
  int syncErrno = errno;
  ::close(fd);
  if (result != 0) {
    BOOST_THROW_EXCEPTION(Error("Cannot sync directory " + dirName + ": " + std::strerror(syncErrno)));
  }
}

} // namespace sbsync
