#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rag_core/chunking/text_chunker.hpp"
#include "rag_core/errors.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::Chunk;
using rag_core::TextChunker;

namespace {

const std::string LONG_DOCUMENT =
    "Welcome back to the channel. Today we are talking about vector search.\n\n"
    "First, what is an embedding? It is a list of numbers that captures meaning. Similar "
    "texts land close together.\n\n"
    "Second, how do we search? We compare the query vector with every stored vector and keep "
    "the best few. That is exhaustive search, and it is exact.\n"
    "Approximate structures trade a little accuracy for speed.\n\n"
    "Finally, remember to chunk long transcripts before embedding them, otherwise the model "
    "truncates the input and information is lost.";

}  // namespace

TEST(TextChunkerTest, RejectsNonPositiveSize) {
  EXPECT_THROW(TextChunker(0, 0), rag_core::InvalidConfig);
  EXPECT_THROW(TextChunker(-5, 0), rag_core::InvalidConfig);
}

TEST(TextChunkerTest, RejectsOverlapNotSmallerThanSize) {
  EXPECT_THROW(TextChunker(10, 10), rag_core::InvalidConfig);
  EXPECT_THROW(TextChunker(10, 15), rag_core::InvalidConfig);
  EXPECT_THROW(TextChunker(10, -1), rag_core::InvalidConfig);
  EXPECT_NO_THROW(TextChunker(10, 9));
}

TEST(TextChunkerTest, EmptyTextYieldsNoChunks) {
  EXPECT_TRUE(TextChunker(100, 10).split("").empty());
}

TEST(TextChunkerTest, ShortTextIsSingleChunk) {
  auto chunks = TextChunker(100, 10).split("Just one short line.");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text, "Just one short line.");
  EXPECT_EQ(chunks[0].ordinal, 0);
  EXPECT_EQ(chunks[0].source_offset, 0u);
}

TEST(TextChunkerTest, SplitsOnSentenceBoundaryInsideWindow) {
  auto chunks = TextChunker(20, 5).split("The sky is blue. Water is wet.");
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "The sky is blue. ");
  EXPECT_EQ(chunks[1].text, "lue. Water is wet.");
  EXPECT_EQ(chunks[1].source_offset, 12u);
}

TEST(TextChunkerTest, PrefersParagraphBreakOverSentenceEnd) {
  const std::string text = "One. Two.\n\nThree four five six seven.";
  auto chunks = TextChunker(20, 2).split(text);
  ASSERT_GE(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "One. Two.\n\n");
}

TEST(TextChunkerTest, FallsBackToSpaceThenHardCut) {
  auto spaced = TextChunker(10, 0).split("aaaa bbbb cccc");
  ASSERT_EQ(spaced.size(), 2u);
  EXPECT_EQ(spaced[0].text, "aaaa bbbb ");
  EXPECT_EQ(spaced[1].text, "cccc");

  auto solid = TextChunker(4, 1).split("abcdefghij");
  ASSERT_EQ(solid.size(), 3u);
  EXPECT_EQ(solid[0].text, "abcd");
  EXPECT_EQ(solid[1].text, "defg");
  EXPECT_EQ(solid[2].text, "ghij");
}

TEST(TextChunkerTest, ChunksRespectSizeAndOverlap) {
  const int size = 80;
  const int overlap = 15;
  auto chunks = TextChunker(size, overlap).split(LONG_DOCUMENT);
  ASSERT_GT(chunks.size(), 3u);

  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_LE(chunks[i].text.size(), static_cast<size_t>(size));
    EXPECT_EQ(chunks[i].ordinal, static_cast<int>(i));
    EXPECT_EQ(LONG_DOCUMENT.substr(chunks[i].source_offset, chunks[i].text.size()),
              chunks[i].text);
    if (i > 0) {
      // The next chunk starts exactly `overlap` characters before the previous one ends
      const auto& previous = chunks[i - 1];
      EXPECT_EQ(chunks[i].source_offset,
                previous.source_offset + previous.text.size() - overlap);
      EXPECT_GT(chunks[i].source_offset, previous.source_offset);
    }
  }
  EXPECT_EQ(chunks.back().source_offset + chunks.back().text.size(), LONG_DOCUMENT.size());
}

TEST(TextChunkerTest, ReassemblingWithoutOverlapReconstructsDocument) {
  const std::vector<std::pair<int, int>> configurations = {
      {20, 5}, {50, 0}, {64, 63}, {100, 30}, {1000, 200}, {7, 3}};
  for (const auto& [size, overlap] : configurations) {
    auto chunks = TextChunker(size, overlap).split(LONG_DOCUMENT);
    EXPECT_EQ(TestUtilities::reassemble(chunks, overlap), LONG_DOCUMENT)
        << "size=" << size << " overlap=" << overlap;
  }
}

TEST(TextChunkerTest, SplittingIsDeterministic) {
  TextChunker chunker(60, 12);
  EXPECT_EQ(chunker.split(LONG_DOCUMENT), chunker.split(LONG_DOCUMENT));
  EXPECT_EQ(chunker.split(LONG_DOCUMENT), rag_core::split_text(LONG_DOCUMENT, 60, 12));
}

TEST(TextChunkerTest, CountsCodePointsAndNeverSplitsThem) {
  // Each "é" is two bytes; ten of them are ten characters
  std::string text;
  for (int i = 0; i < 10; ++i) {
    text += "\xC3\xA9";
  }
  auto chunks = TextChunker(4, 1).split(text);
  ASSERT_EQ(chunks.size(), 3u);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.text.size() % 2, 0u);
    EXPECT_LE(chunk.text.size(), 8u);
  }
  EXPECT_EQ(chunks[1].source_offset, 6u);
}

TEST(TextChunkerTest, WordUnitsCountWordsAndOverlapByWords) {
  TextChunker chunker(3, 1, rag_core::LengthUnit::Word);
  EXPECT_EQ(chunker.unit(), rag_core::LengthUnit::Word);
  EXPECT_EQ(TextChunker(3, 1).unit(), rag_core::LengthUnit::CodePoint);

  auto chunks = chunker.split("one two three four five six seven eight");
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks[0].text, "one two three ");
  EXPECT_EQ(chunks[1].text, "three four five ");
  EXPECT_EQ(chunks[2].text, "five six seven ");
  EXPECT_EQ(chunks[3].text, "seven eight");
  EXPECT_EQ(chunks[1].source_offset, 8u);
  EXPECT_EQ(chunks[3].ordinal, 3);
}

TEST(TextChunkerTest, WordUnitsStillPreferSentenceEnds) {
  auto chunks = rag_core::split_text("Sky is blue. Water is wet today.", 4, 0,
                                     rag_core::LengthUnit::Word);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].text, "Sky is blue. ");
  EXPECT_EQ(chunks[1].text, "Water is wet today.");
}

}  // namespace rag_tests
