#ifndef SBSYNC_CHUNK_RANGE_HPP
#define SBSYNC_CHUNK_RANGE_HPP

#include "chunk.hpp"

#include <map>
#include <stdexcept>
#include <string>

namespace sbsync {

class ChunkRangeError : public std::invalid_argument
{
public:
  explicit
  ChunkRangeError(const std::string& what)
    : std::invalid_argument(what)
  {
  }
};

/// @brief most chunk numbers a single range string may expand to
static const size_t MAX_CHUNK_RANGE_COUNT = 1 << 20;

/**
 * @brief Renders chunk numbers as comma separated maximal runs
 *
 * {1,2,3,5,7,8,9} becomes "1-3,5,7-9"; the empty set becomes "".
 */
std::string
buildChunkRanges(const ChunkNumSet& chunks);

/**
 * @brief Parses a range string produced by buildChunkRanges
 * @throw ChunkRangeError malformed element, reversed range, or more than
 *        MAX_CHUNK_RANGE_COUNT numbers in total
 */
ChunkNumSet
parseChunkRanges(const std::string& ranges);

/**
 * @brief Formats the list line of an update request, e.g.
 *        "goog-malware-shavar;a:1-3:s:5"
 */
std::string
formatListRequest(const std::string& listName, const std::map<ChunkType, std::string>& ranges);

} // namespace sbsync

#endif // SBSYNC_CHUNK_RANGE_HPP
