#ifndef SBSYNC_CHUNK_HPP
#define SBSYNC_CHUNK_HPP

#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <ndn-cxx/encoding/block.hpp>
#include <ndn-cxx/encoding/buffer.hpp>
#include <ndn-cxx/encoding/encoding-buffer.hpp>

namespace sbsync {

namespace tlv {

enum {
  ChunkData   = 128,
  ChunkNumber = 129,
  ChunkType   = 130,
  EntryWidth  = 131,
  Hashes      = 132
};

} // namespace tlv

/// @brief largest ChunkData TLV-VALUE kept in a chunk log
static const size_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;

enum class ChunkType : uint32_t {
  ADD = 0,
  SUB = 1
};

std::ostream&
operator<<(std::ostream& os, ChunkType type);

typedef uint32_t ChunkNum;
typedef std::set<ChunkNum> ChunkNumSet;
typedef std::map<ChunkType, ChunkNumSet> ChunkNumMap;

/**
 * @brief What a chunk does to the lookup tables
 */
enum class ChunkBucket {
  ADD_PREFIX,
  ADD_FULL_HASH,
  SUB_PREFIX,
  SUB_FULL_HASH,
  UNRECOGNIZED
};

std::ostream&
operator<<(std::ostream& os, ChunkBucket bucket);

/**
 * @brief One distributor-issued batch of hash additions or retractions
 *
 * Encoded as
 *
 *     ChunkData   = CHUNK-DATA-TYPE TLV-LENGTH
 *                     ChunkNumber ChunkType EntryWidth Hashes
 *
 * Type and width are kept as received so that a record with an unknown
 * combination can be decoded, reported and skipped.
 */
class ChunkRecord
{
public:
  class Error : public ndn::tlv::Error
  {
  public:
    explicit
    Error(const std::string& what)
      : ndn::tlv::Error(what)
    {
    }
  };

  ChunkRecord();

  ChunkRecord(ChunkNum number, ChunkType type, uint32_t entryWidth, const std::string& hashes);

  explicit
  ChunkRecord(const ndn::Block& wire);

  template<ndn::encoding::Tag TAG>
  size_t
  wireEncode(ndn::EncodingImpl<TAG>& encoder) const;

  const ndn::Block&
  wireEncode() const;

  void
  wireDecode(const ndn::Block& wire);

  ChunkNum
  getNumber() const
  {
    return m_number;
  }

  ChunkType
  getType() const
  {
    return m_type;
  }

  uint32_t
  getEntryWidth() const
  {
    return m_entryWidth;
  }

  const std::string&
  getHashes() const
  {
    return m_hashes;
  }

  /// @brief number of whole entries in the hash blob (0 for an unknown width)
  size_t
  getEntryCount() const;

  /// @brief returns the @p i-th entry of the hash blob
  std::string
  getEntry(size_t i) const;

  ChunkBucket
  classify() const;

private:
  ChunkNum m_number;
  ChunkType m_type;
  uint32_t m_entryWidth;
  std::string m_hashes;

  mutable ndn::Block m_wire;
};

bool
operator==(const ChunkRecord& lhs, const ChunkRecord& rhs);

inline bool
operator!=(const ChunkRecord& lhs, const ChunkRecord& rhs)
{
  return !(lhs == rhs);
}

/**
 * @brief Decodes one chunk from the front of @p buffer
 *
 * @param buffer    start of the undecoded data
 * @param remaining number of undecoded bytes at @p buffer
 * @return the decoded chunk and the number of bytes left after it
 * @throw ChunkRecord::Error the data is truncated or not a chunk
 */
std::pair<ChunkRecord, size_t>
readChunk(const uint8_t* buffer, size_t remaining);

/**
 * @brief Decodes every chunk in @p data
 * @throw ChunkRecord::Error on the first malformed chunk
 */
std::vector<ChunkRecord>
decodeChunks(const ndn::Buffer& data);

} // namespace sbsync

#endif // SBSYNC_CHUNK_HPP
