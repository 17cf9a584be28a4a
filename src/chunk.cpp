#include "chunk.hpp"
#include "hash_set.hpp"

#include <ndn-cxx/encoding/block-helpers.hpp>

#include <boost/throw_exception.hpp>

#include <limits>
#include <tuple>
#include <ostream>

namespace sbsync {

std::ostream&
operator<<(std::ostream& os, ChunkType type)
{
  switch (type) {
    case ChunkType::ADD:
      return os << "ADD";
    case ChunkType::SUB:
      return os << "SUB";
  }
  return os << "UNKNOWN(" << static_cast<uint32_t>(type) << ")";
}

std::ostream&
operator<<(std::ostream& os, ChunkBucket bucket)
{
  switch (bucket) {
    case ChunkBucket::ADD_PREFIX:
      return os << "ADD-prefix";
    case ChunkBucket::ADD_FULL_HASH:
      return os << "ADD-full";
    case ChunkBucket::SUB_PREFIX:
      return os << "SUB-prefix";
    case ChunkBucket::SUB_FULL_HASH:
      return os << "SUB-full";
    case ChunkBucket::UNRECOGNIZED:
      break;
  }
  return os << "unrecognized";
}

ChunkRecord::ChunkRecord()
  : m_number(0)
  , m_type(ChunkType::ADD)
  , m_entryWidth(PREFIX_4B_SZ)
{
}

ChunkRecord::ChunkRecord(ChunkNum number, ChunkType type, uint32_t entryWidth,
                         const std::string& hashes)
  : m_number(number)
  , m_type(type)
  , m_entryWidth(entryWidth)
  , m_hashes(hashes)
{
}

ChunkRecord::ChunkRecord(const ndn::Block& wire)
{
  wireDecode(wire);
}

template<ndn::encoding::Tag TAG>
size_t
ChunkRecord::wireEncode(ndn::EncodingImpl<TAG>& encoder) const
{
  size_t totalLength = 0;

  totalLength += ndn::encoding::prependByteArrayBlock(encoder, tlv::Hashes,
                                                      reinterpret_cast<const uint8_t*>(m_hashes.data()),
                                                      m_hashes.size());
  totalLength += ndn::encoding::prependNonNegativeIntegerBlock(encoder, tlv::EntryWidth, m_entryWidth);
  totalLength += ndn::encoding::prependNonNegativeIntegerBlock(encoder, tlv::ChunkType,
                                                               static_cast<uint32_t>(m_type));
  totalLength += ndn::encoding::prependNonNegativeIntegerBlock(encoder, tlv::ChunkNumber, m_number);

  totalLength += encoder.prependVarNumber(totalLength);
  totalLength += encoder.prependVarNumber(tlv::ChunkData);

  return totalLength;
}

template size_t
ChunkRecord::wireEncode<ndn::encoding::EncoderTag>(ndn::EncodingImpl<ndn::encoding::EncoderTag>&) const;

template size_t
ChunkRecord::wireEncode<ndn::encoding::EstimatorTag>(ndn::EncodingImpl<ndn::encoding::EstimatorTag>&) const;

const ndn::Block&
ChunkRecord::wireEncode() const
{
  if (m_wire.hasWire()) {
    return m_wire;
  }

  ndn::EncodingEstimator estimator;
  size_t estimatedSize = wireEncode(estimator);

  ndn::EncodingBuffer buffer(estimatedSize, 0);
  wireEncode(buffer);

  m_wire = buffer.block();
  return m_wire;
}

static uint32_t
readUint32(const ndn::Block& block, const char* field)
{
  uint64_t value = ndn::encoding::readNonNegativeInteger(block);
  if (value > std::numeric_limits<uint32_t>::max()) {
    BOOST_THROW_EXCEPTION(ChunkRecord::Error(std::string(field) + " is out of range"));
  }
  return static_cast<uint32_t>(value);
}

void
ChunkRecord::wireDecode(const ndn::Block& wire)
{
  if (wire.type() != tlv::ChunkData) {
    BOOST_THROW_EXCEPTION(Error("Expected ChunkData, got TLV type " + std::to_string(wire.type())));
  }

  ndn::Block block = wire;
  block.parse();

  ndn::Block::element_const_iterator it = block.elements_begin();

  if (it == block.elements_end() || it->type() != tlv::ChunkNumber) {
    BOOST_THROW_EXCEPTION(Error("ChunkNumber is missing"));
  }
  ChunkNum number = readUint32(*it, "ChunkNumber");
  ++it;

  if (it == block.elements_end() || it->type() != tlv::ChunkType) {
    BOOST_THROW_EXCEPTION(Error("ChunkType is missing"));
  }
  ChunkType type = static_cast<ChunkType>(readUint32(*it, "ChunkType"));
  ++it;

  if (it == block.elements_end() || it->type() != tlv::EntryWidth) {
    BOOST_THROW_EXCEPTION(Error("EntryWidth is missing"));
  }
  uint32_t entryWidth = readUint32(*it, "EntryWidth");
  ++it;

  if (it == block.elements_end() || it->type() != tlv::Hashes) {
    BOOST_THROW_EXCEPTION(Error("Hashes is missing"));
  }
  std::string hashes(it->value_begin(), it->value_end());
  ++it;

  if (it != block.elements_end()) {
    BOOST_THROW_EXCEPTION(Error("Unexpected TLV type " + std::to_string(it->type()) +
                                " after Hashes"));
  }

  if ((entryWidth == PREFIX_4B_SZ || entryWidth == PREFIX_32B_SZ) &&
      hashes.size() % entryWidth != 0) {
    BOOST_THROW_EXCEPTION(Error("Chunk " + std::to_string(number) + " carries " +
                                std::to_string(hashes.size()) + " hash bytes, not a multiple of " +
                                std::to_string(entryWidth)));
  }

  m_number = number;
  m_type = type;
  m_entryWidth = entryWidth;
  m_hashes.swap(hashes);
  m_wire = block;
}

size_t
ChunkRecord::getEntryCount() const
{
  if (m_entryWidth != PREFIX_4B_SZ && m_entryWidth != PREFIX_32B_SZ) {
    return 0;
  }
  return m_hashes.size() / m_entryWidth;
}

std::string
ChunkRecord::getEntry(size_t i) const
{
  return m_hashes.substr(i * m_entryWidth, m_entryWidth);
}

ChunkBucket
ChunkRecord::classify() const
{
  switch (m_type) {
    case ChunkType::ADD:
      switch (m_entryWidth) {
        case PREFIX_4B_SZ:
          return ChunkBucket::ADD_PREFIX;
        case PREFIX_32B_SZ:
          return ChunkBucket::ADD_FULL_HASH;
      }
      break;
    case ChunkType::SUB:
      switch (m_entryWidth) {
        case PREFIX_4B_SZ:
          return ChunkBucket::SUB_PREFIX;
        case PREFIX_32B_SZ:
          return ChunkBucket::SUB_FULL_HASH;
      }
      break;
  }
  return ChunkBucket::UNRECOGNIZED;
}

bool
operator==(const ChunkRecord& lhs, const ChunkRecord& rhs)
{
  return lhs.getNumber() == rhs.getNumber() &&
         lhs.getType() == rhs.getType() &&
         lhs.getEntryWidth() == rhs.getEntryWidth() &&
         lhs.getHashes() == rhs.getHashes();
}

std::pair<ChunkRecord, size_t>
readChunk(const uint8_t* buffer, size_t remaining)
{
  bool isOk = false;
  ndn::Block block;
  std::tie(isOk, block) = ndn::Block::fromBuffer(buffer, remaining);
  if (!isOk) {
    BOOST_THROW_EXCEPTION(ChunkRecord::Error("Truncated chunk with " + std::to_string(remaining) +
                                             " bytes remaining"));
  }

  ChunkRecord chunk(block);
  return std::make_pair(chunk, remaining - block.size());
}

std::vector<ChunkRecord>
decodeChunks(const ndn::Buffer& data)
{
  std::vector<ChunkRecord> chunks;
  size_t length = data.size();
  size_t remaining = length;

  while (remaining != 0) {
    std::pair<ChunkRecord, size_t> result = readChunk(data.data() + (length - remaining), remaining);
    chunks.push_back(result.first);
    remaining = result.second;
  }

  return chunks;
}

} // namespace sbsync
