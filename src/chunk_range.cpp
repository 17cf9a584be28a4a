#include "chunk_range.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>

#include <sstream>
#include <vector>

namespace sbsync {

static void
appendRange(std::ostringstream& os, ChunkNum start, ChunkNum end)
{
  if (os.tellp() > 0) {
    os << ",";
  }
  os << start;
  if (end != start) {
    os << "-" << end;
  }
}

std::string
buildChunkRanges(const ChunkNumSet& chunks)
{
  std::ostringstream os;
  if (chunks.empty()) {
    return os.str();
  }

  // std::set iterates in ascending order
  ChunkNumSet::const_iterator it = chunks.begin();
  ChunkNum start = *it;
  ChunkNum end = *it;

  for (++it; it != chunks.end(); ++it) {
    if (*it == end + 1) {
      end = *it;
      continue;
    }
    appendRange(os, start, end);
    start = end = *it;
  }
  appendRange(os, start, end);

  return os.str();
}

static ChunkNum
parseChunkNum(const std::string& s, const std::string& element)
{
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    BOOST_THROW_EXCEPTION(ChunkRangeError("Malformed chunk range '" + element + "'"));
  }
  try {
    return boost::lexical_cast<ChunkNum>(s);
  }
  catch (const boost::bad_lexical_cast&) {
    BOOST_THROW_EXCEPTION(ChunkRangeError("Chunk number out of range in '" + element + "'"));
  }
}

ChunkNumSet
parseChunkRanges(const std::string& ranges)
{
  ChunkNumSet chunks;
  if (ranges.empty()) {
    return chunks;
  }

  std::vector<std::string> elements;
  boost::algorithm::split(elements, ranges, boost::algorithm::is_any_of(","));

  for (const auto& element : elements) {
    size_t dash = element.find('-');
    if (dash == std::string::npos) {
      chunks.insert(parseChunkNum(element, element));
      continue;
    }

    ChunkNum start = parseChunkNum(element.substr(0, dash), element);
    ChunkNum end = parseChunkNum(element.substr(dash + 1), element);
    if (end < start) {
      BOOST_THROW_EXCEPTION(ChunkRangeError("Reversed chunk range '" + element + "'"));
    }
    // numbers shared with earlier elements are counted again
    uint64_t span = static_cast<uint64_t>(end) - start + 1;
    if (chunks.size() + span > MAX_CHUNK_RANGE_COUNT) {
      BOOST_THROW_EXCEPTION(ChunkRangeError("Chunk range '" + element + "' expands to more than " +
                                            std::to_string(MAX_CHUNK_RANGE_COUNT) + " chunks"));
    }
    for (ChunkNum n = start; ; ++n) {
      chunks.insert(n);
      if (n == end) {
        break;
      }
    }
  }

  return chunks;
}

std::string
formatListRequest(const std::string& listName, const std::map<ChunkType, std::string>& ranges)
{
  std::string add;
  std::string sub;

  auto it = ranges.find(ChunkType::ADD);
  if (it != ranges.end()) {
    add = it->second;
  }
  it = ranges.find(ChunkType::SUB);
  if (it != ranges.end()) {
    sub = it->second;
  }

  std::string line = listName + ";";
  if (!add.empty()) {
    line += "a:" + add;
  }
  if (!sub.empty()) {
    if (!add.empty()) {
      line += ":";
    }
    line += "s:" + sub;
  }
  return line;
}

} // namespace sbsync
