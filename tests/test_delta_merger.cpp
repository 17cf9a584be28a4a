#include "delta_merger.hpp"

#include "test_common.hpp"

#include <gtest/gtest.h>

namespace sbsync {
namespace tests {

class DeltaMergerTest : public TemporaryDirectoryFixture
{
protected:
  /// merges @p delta into a log holding @p existing and returns the result
  MergeResult
  merge(const std::vector<ChunkRecord>& existing, const std::vector<ChunkRecord>& delta)
  {
    std::string existingName = getPath("existing.dat");
    writeFile(existingName, toWire(existing));
    ChunkLogReader reader(existingName);

    ChunkLogWriter writer(getPath("output.dat"));
    DeltaMerger merger(deletions);
    MergeResult result = merger.merge(&reader, delta, writer);
    writer.commit();
    return result;
  }

  std::vector<ChunkRecord>
  readOutput()
  {
    std::vector<ChunkRecord> chunks;
    ChunkLogReader reader(getPath("output.dat"));
    ChunkRecord chunk;
    while (reader.read(chunk)) {
      chunks.push_back(chunk);
    }
    return chunks;
  }

protected:
  ChunkNumMap deletions;
};

TEST_F(DeltaMergerTest, NoExistingLog)
{
  std::vector<ChunkRecord> delta{
    ChunkRecord(1, ChunkType::ADD, PREFIX_4B_SZ, "abcdefgh"),
  };

  ChunkLogWriter writer(getPath("output.dat"));
  DeltaMerger merger(deletions);
  MergeResult result = merger.merge(nullptr, delta, writer);
  writer.commit();

  EXPECT_TRUE(result.prefixes->contains("abcd"));
  EXPECT_TRUE(result.prefixes->contains("efgh"));
  EXPECT_EQ((ChunkNumSet{1}), result.kept[ChunkType::ADD]);
  EXPECT_TRUE(result.kept[ChunkType::SUB].empty());
  EXPECT_EQ(0u, result.existingStats.nKeptChunks);
  EXPECT_EQ(1u, result.deltaStats.nKeptChunks);
  EXPECT_EQ(2u, result.deltaStats.nAddPrefixes);
  EXPECT_EQ(delta, readOutput());
}

TEST_F(DeltaMergerTest, ExistingThenDelta)
{
  std::vector<ChunkRecord> existing{
    ChunkRecord(1, ChunkType::ADD, PREFIX_4B_SZ, "abcd"),
  };
  std::vector<ChunkRecord> delta{
    ChunkRecord(2, ChunkType::ADD, PREFIX_4B_SZ, "efgh"),
  };

  MergeResult result = merge(existing, delta);

  EXPECT_TRUE(result.prefixes->contains("abcd"));
  EXPECT_TRUE(result.prefixes->contains("efgh"));
  EXPECT_EQ((ChunkNumSet{1, 2}), result.kept[ChunkType::ADD]);
  EXPECT_EQ(1u, result.existingStats.nKeptChunks);
  EXPECT_EQ(1u, result.deltaStats.nKeptChunks);

  std::vector<ChunkRecord> expected{existing[0], delta[0]};
  EXPECT_EQ(expected, readOutput());
}

TEST_F(DeltaMergerTest, LaterChunkWins)
{
  std::vector<ChunkRecord> existing{
    ChunkRecord(1, ChunkType::ADD, PREFIX_4B_SZ, "aaaa"),
    ChunkRecord(1, ChunkType::SUB, PREFIX_4B_SZ, "aaaa"),
    ChunkRecord(2, ChunkType::SUB, PREFIX_4B_SZ, "bbbb"),
  };
  std::vector<ChunkRecord> delta{
    ChunkRecord(2, ChunkType::ADD, PREFIX_4B_SZ, "bbbb"),
  };

  MergeResult result = merge(existing, delta);

  // removed by the SUB that follows the ADD
  EXPECT_FALSE(result.prefixes->contains("aaaa"));
  // a SUB before the ADD does not remove it
  EXPECT_TRUE(result.prefixes->contains("bbbb"));
  EXPECT_EQ((ChunkNumSet{1, 2}), result.kept[ChunkType::ADD]);
  EXPECT_EQ((ChunkNumSet{1, 2}), result.kept[ChunkType::SUB]);
  EXPECT_EQ(4u, readOutput().size());
}

TEST_F(DeltaMergerTest, Deletions)
{
  std::vector<ChunkRecord> existing{
    ChunkRecord(1, ChunkType::ADD, PREFIX_4B_SZ, "abcd"),
    ChunkRecord(2, ChunkType::ADD, PREFIX_4B_SZ, "efgh"),
    ChunkRecord(2, ChunkType::SUB, PREFIX_4B_SZ, "abcd"),
  };
  std::vector<ChunkRecord> delta{
    ChunkRecord(3, ChunkType::ADD, PREFIX_4B_SZ, "ijkl"),
    ChunkRecord(4, ChunkType::ADD, PREFIX_4B_SZ, "mnop"),
  };
  deletions[ChunkType::ADD] = {2, 4};
  deletions[ChunkType::SUB] = {2};

  MergeResult result = merge(existing, delta);

  EXPECT_TRUE(result.prefixes->contains("abcd"));
  EXPECT_FALSE(result.prefixes->contains("efgh"));
  EXPECT_TRUE(result.prefixes->contains("ijkl"));
  EXPECT_FALSE(result.prefixes->contains("mnop"));
  EXPECT_EQ((ChunkNumSet{1, 3}), result.kept[ChunkType::ADD]);
  EXPECT_TRUE(result.kept[ChunkType::SUB].empty());
  EXPECT_EQ(2u, result.existingStats.nDeletedChunks);
  EXPECT_EQ(1u, result.deltaStats.nDeletedChunks);

  for (const auto& chunk : readOutput()) {
    EXPECT_EQ(0u, deletions[chunk.getType()].count(chunk.getNumber()));
  }
}

TEST_F(DeltaMergerTest, DeletionMatchesTypeAndNumber)
{
  std::vector<ChunkRecord> delta{
    ChunkRecord(7, ChunkType::ADD, PREFIX_4B_SZ, "abcd"),
    ChunkRecord(7, ChunkType::SUB, PREFIX_4B_SZ, "efgh"),
  };
  deletions[ChunkType::SUB] = {7};

  MergeResult result = merge({}, delta);

  EXPECT_EQ((ChunkNumSet{7}), result.kept[ChunkType::ADD]);
  EXPECT_TRUE(result.kept[ChunkType::SUB].empty());
}

TEST_F(DeltaMergerTest, SubFullHash)
{
  std::vector<ChunkRecord> existing{
    ChunkRecord(1, ChunkType::ADD, PREFIX_32B_SZ, fullHash('x') + fullHash('y')),
  };
  std::vector<ChunkRecord> delta{
    ChunkRecord(1, ChunkType::SUB, PREFIX_32B_SZ, fullHash('x') + fullHash('z')),
  };

  MergeResult result = merge(existing, delta);

  EXPECT_FALSE(result.fullHashes->contains(fullHash('x')));
  EXPECT_TRUE(result.fullHashes->contains(fullHash('y')));
  EXPECT_TRUE(result.resolvedHashes->contains(fullHash('x')));
  EXPECT_TRUE(result.resolvedHashes->contains(fullHash('z')));
  EXPECT_FALSE(result.resolvedHashes->contains(fullHash('y')));
  EXPECT_EQ(2u, result.existingStats.nAddFullHashes);
  EXPECT_EQ(2u, result.deltaStats.nSubFullHashes);
}

TEST_F(DeltaMergerTest, FullHashReAddedAfterSub)
{
  std::vector<ChunkRecord> delta{
    ChunkRecord(1, ChunkType::SUB, PREFIX_32B_SZ, fullHash('x')),
    ChunkRecord(2, ChunkType::ADD, PREFIX_32B_SZ, fullHash('x')),
  };

  MergeResult result = merge({}, delta);

  EXPECT_TRUE(result.fullHashes->contains(fullHash('x')));
  EXPECT_TRUE(result.resolvedHashes->contains(fullHash('x')));
}

TEST_F(DeltaMergerTest, UnrecognizedChunksAreSkipped)
{
  std::vector<ChunkRecord> existing{
    ChunkRecord(1, ChunkType::ADD, 8, "abcdefgh"),
    ChunkRecord(2, ChunkType::ADD, PREFIX_4B_SZ, "abcd"),
  };
  std::vector<ChunkRecord> delta{
    ChunkRecord(3, static_cast<ChunkType>(7), PREFIX_4B_SZ, "efgh"),
    ChunkRecord(4, ChunkType::SUB, 16, std::string(16, 'q')),
  };

  MergeResult result = merge(existing, delta);

  EXPECT_TRUE(result.prefixes->contains("abcd"));
  EXPECT_FALSE(result.prefixes->contains("efgh"));
  EXPECT_EQ((ChunkNumSet{2}), result.kept[ChunkType::ADD]);
  EXPECT_TRUE(result.kept[ChunkType::SUB].empty());
  EXPECT_EQ(1u, result.existingStats.nAnomalousChunks);
  EXPECT_EQ(2u, result.deltaStats.nAnomalousChunks);

  std::vector<ChunkRecord> expected{existing[1]};
  EXPECT_EQ(expected, readOutput());
}

TEST_F(DeltaMergerTest, TruncatedExistingLog)
{
  std::string wire = toWire(ChunkRecord(1, ChunkType::ADD, PREFIX_4B_SZ, "abcd"));
  wire += toWire(ChunkRecord(2, ChunkType::ADD, PREFIX_4B_SZ, "efgh")).substr(0, 5);
  std::string existingName = getPath("existing.dat");
  writeFile(existingName, wire);

  ChunkLogReader reader(existingName);
  ChunkLogWriter writer(getPath("output.dat"));
  DeltaMerger merger(deletions);
  EXPECT_THROW(merger.merge(&reader, {}, writer), ChunkLogReader::Error);
}

} // namespace tests
} // namespace sbsync
