#include <gtest/gtest.h>

#include <atomic>
#include <cmath>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

using docqa_tests::TestUtilities;

class VectorIndexTest : public ::testing::Test {
 protected:
  void SetUp() override {
    index_path_ = TestUtilities::create_temp_path(".dqvi");
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_file(index_path_);
  }

  std::filesystem::path index_path_;
};

TEST_F(VectorIndexTest, InsertedVectorIsItsOwnNearestNeighbour) {
  VectorIndex index;
  for (int i = 0; i < 20; ++i) {
    index.insert("doc#" + std::to_string(i),
                 TestUtilities::create_test_vector("v" + std::to_string(i), 16));
  }

  auto results = index.query(TestUtilities::create_test_vector("v7", 16), 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk_id, "doc#7");
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
}

TEST_F(VectorIndexTest, RanksByCosineSimilarity) {
  VectorIndex index;
  index.insert("A#0", {1.0f, 0.0f});
  index.insert("B#0", {0.0f, 1.0f});
  index.insert("C#0", {0.7071f, 0.7071f});

  auto results = index.query({1.0f, 0.0f}, 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk_id, "A#0");
  EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
  EXPECT_EQ(results[1].chunk_id, "C#0");
  EXPECT_NEAR(results[1].score, 0.7071f, 1e-3);
}

TEST_F(VectorIndexTest, NormalizesAtInsertAndQuery) {
  VectorIndex index;
  index.insert("long#0", {10.0f, 0.0f, 0.0f});

  auto results = index.query({0.5f, 0.0f, 0.0f}, 1);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_NEAR(results[0].score, 1.0f, 1e-6);
}

TEST_F(VectorIndexTest, TiesGoToEarlierInsertion) {
  VectorIndex index;
  index.insert("late#0", {0.0f, 1.0f});
  index.insert("first#0", {1.0f, 0.0f});
  index.insert("second#0", {2.0f, 0.0f});
  index.insert("third#0", {3.0f, 0.0f});

  auto results = index.query({1.0f, 0.0f}, 3);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].chunk_id, "first#0");
  EXPECT_EQ(results[1].chunk_id, "second#0");
  EXPECT_EQ(results[2].chunk_id, "third#0");
}

TEST_F(VectorIndexTest, ReturnsEverythingWhenKExceedsSize) {
  VectorIndex index;
  index.insert("a#0", {1.0f, 0.0f});
  index.insert("a#1", {0.0f, 1.0f});

  EXPECT_EQ(index.query({1.0f, 1.0f}, 10).size(), 2u);
}

TEST_F(VectorIndexTest, EmptyIndexReturnsNoResults) {
  VectorIndex index;
  EXPECT_TRUE(index.query({1.0f, 2.0f}, 5).empty());
}

TEST_F(VectorIndexTest, NonPositiveKIsRejected) {
  VectorIndex index;
  index.insert("a#0", {1.0f});
  EXPECT_THROW(index.query({1.0f}, 0), InvalidArgumentError);
  EXPECT_THROW(index.query({1.0f}, -3), InvalidArgumentError);
}

TEST_F(VectorIndexTest, FirstInsertFixesDimension) {
  VectorIndex index;
  index.insert("a#0", {1.0f, 2.0f, 3.0f});

  EXPECT_EQ(index.dimension(), 3u);
  EXPECT_THROW(index.insert("a#1", {1.0f, 2.0f}), DimensionMismatchError);
  EXPECT_THROW(index.query({1.0f, 2.0f}, 1), DimensionMismatchError);
  EXPECT_EQ(index.size(), 1u);
  EXPECT_FALSE(index.contains("a#1"));
}

TEST_F(VectorIndexTest, ConstructedDimensionIsEnforced) {
  IndexOptions options;
  options.dimension = 4;
  VectorIndex index(options);

  EXPECT_EQ(index.dimension(), 4u);
  EXPECT_THROW(index.insert("a#0", {1.0f, 2.0f}), DimensionMismatchError);
  EXPECT_EQ(index.size(), 0u);
}

TEST_F(VectorIndexTest, DuplicateIdIsRejected) {
  VectorIndex index;
  index.insert("a#0", {1.0f, 0.0f});

  EXPECT_THROW(index.insert("a#0", {0.0f, 1.0f}), DuplicateIdError);
  EXPECT_EQ(index.size(), 1u);
  EXPECT_NEAR(index.query({1.0f, 0.0f}, 1)[0].score, 1.0f, 1e-6);
}

TEST_F(VectorIndexTest, ZeroVectorIsRejected) {
  VectorIndex index;
  EXPECT_THROW(index.insert("a#0", {0.0f, 0.0f}), InvalidArgumentError);
  EXPECT_EQ(index.size(), 0u);
}

TEST_F(VectorIndexTest, InsertBatchIsAllOrNothing) {
  VectorIndex index;
  index.insert("a#0", {1.0f, 0.0f});

  VectorIndex::Batch batch = {{"b#0", {1.0f, 1.0f}}, {"b#1", {1.0f}}, {"b#2", {0.0f, 1.0f}}};
  EXPECT_THROW(index.insert_batch(batch), DimensionMismatchError);

  VectorIndex::Batch duplicates = {{"c#0", {1.0f, 1.0f}}, {"c#0", {0.0f, 1.0f}}};
  EXPECT_THROW(index.insert_batch(duplicates), DuplicateIdError);

  EXPECT_EQ(index.size(), 1u);
  EXPECT_FALSE(index.contains("b#0"));
  EXPECT_FALSE(index.contains("c#0"));
}

TEST_F(VectorIndexTest, DeleteByDocumentIsIdempotent) {
  VectorIndex index;
  index.insert("keep#0", {1.0f, 0.0f});
  index.insert("drop#0", {0.0f, 1.0f});
  index.insert("drop#1", {0.5f, 0.5f});

  EXPECT_EQ(index.delete_by_document("drop"), 2u);
  EXPECT_EQ(index.delete_by_document("drop"), 0u);
  EXPECT_EQ(index.delete_by_document("never-seen"), 0u);

  EXPECT_EQ(index.size(), 1u);
  auto results = index.query({0.0f, 1.0f}, 5);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk_id, "keep#0");
}

TEST_F(VectorIndexTest, DeleteMatchesWholeDocumentIdOnly) {
  VectorIndex index;
  index.insert("report#0", {1.0f, 0.0f});
  index.insert("report-2#0", {1.0f, 0.0f});

  EXPECT_EQ(index.delete_by_document("report"), 1u);
  EXPECT_TRUE(index.contains("report-2#0"));
}

TEST_F(VectorIndexTest, PersistAndLoadRoundTrip) {
  VectorIndex original;
  for (int i = 0; i < 50; ++i) {
    original.insert("doc" + std::to_string(i % 5) + "#" + std::to_string(i),
                    TestUtilities::create_test_vector(std::to_string(i), 12));
  }
  original.delete_by_document("doc3");
  original.persist(index_path_);

  VectorIndex loaded;
  loaded.load(index_path_);

  EXPECT_EQ(loaded.size(), original.size());
  EXPECT_EQ(loaded.dimension(), 12u);
  for (int q = 0; q < 10; ++q) {
    auto query = TestUtilities::create_test_vector("query" + std::to_string(q), 12);
    auto expected = original.query(query, 7);
    auto actual = loaded.query(query, 7);
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
      EXPECT_EQ(actual[i].chunk_id, expected[i].chunk_id);
      EXPECT_FLOAT_EQ(actual[i].score, expected[i].score);
    }
  }
}

TEST_F(VectorIndexTest, LoadedIndexKeepsInsertionOrderForTies) {
  VectorIndex original;
  original.insert("x#0", {1.0f, 0.0f});
  original.insert("x#1", {2.0f, 0.0f});
  original.persist(index_path_);

  VectorIndex loaded;
  loaded.load(index_path_);
  loaded.insert("x#2", {3.0f, 0.0f});

  auto results = loaded.query({1.0f, 0.0f}, 3);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].chunk_id, "x#0");
  EXPECT_EQ(results[1].chunk_id, "x#1");
  EXPECT_EQ(results[2].chunk_id, "x#2");
}

TEST_F(VectorIndexTest, PersistLeavesNoTemporaryFile) {
  VectorIndex index;
  index.insert("a#0", {1.0f, 2.0f});
  index.persist(index_path_);

  std::filesystem::path tmp = index_path_;
  tmp += ".tmp";
  EXPECT_TRUE(std::filesystem::exists(index_path_));
  EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST_F(VectorIndexTest, LoadMissingFileThrowsAndKeepsState) {
  VectorIndex index;
  index.insert("a#0", {1.0f, 0.0f});

  EXPECT_THROW(index.load(index_path_), IndexLoadError);
  EXPECT_EQ(index.size(), 1u);
}

TEST_F(VectorIndexTest, LoadCorruptFileThrowsAndKeepsState) {
  VectorIndex source;
  source.insert("a#0", {1.0f, 0.0f});
  source.insert("a#1", {0.0f, 1.0f});
  source.persist(index_path_);

  // Flip one byte inside the first vector
  {
    std::fstream file(index_path_, std::ios::in | std::ios::out | std::ios::binary);
    file.seekp(45);
    file.put('\x7F');
  }

  VectorIndex target;
  target.insert("z#0", {1.0f, 1.0f, 1.0f});
  EXPECT_THROW(target.load(index_path_), IndexLoadError);
  EXPECT_EQ(target.size(), 1u);
  EXPECT_EQ(target.dimension(), 3u);
}

TEST_F(VectorIndexTest, LoadTruncatedOrForeignFileThrows) {
  {
    std::ofstream file(index_path_, std::ios::binary);
    file << "not an index file at all, just some text that is long enough to pass size checks";
  }
  VectorIndex index;
  EXPECT_THROW(index.load(index_path_), IndexLoadError);

  {
    std::ofstream file(index_path_, std::ios::binary | std::ios::trunc);
    file << "DQVI";
  }
  EXPECT_THROW(index.load(index_path_), IndexLoadError);
}

TEST_F(VectorIndexTest, LoadRejectsDimensionDifferentFromConfigured) {
  VectorIndex source;
  source.insert("a#0", {1.0f, 0.0f});
  source.persist(index_path_);

  IndexOptions options;
  options.dimension = 3;
  VectorIndex target(options);
  EXPECT_THROW(target.load(index_path_), IndexLoadError);
}

TEST_F(VectorIndexTest, SwitchesToApproximateAtThreshold) {
  IndexOptions options;
  options.approximate_threshold = 10;
  VectorIndex index(options);

  for (int i = 0; i < 9; ++i) {
    index.insert("d#" + std::to_string(i), TestUtilities::create_test_vector(std::to_string(i)));
  }
  EXPECT_FALSE(index.is_approximate());

  index.insert("d#9", TestUtilities::create_test_vector("9"));
  EXPECT_TRUE(index.is_approximate());

  index.delete_by_document("d");
  EXPECT_FALSE(index.is_approximate());
  EXPECT_EQ(index.size(), 0u);
}

TEST_F(VectorIndexTest, ApproximateModeFindsExactMatch) {
  IndexOptions options;
  options.approximate_threshold = 1;
  options.hnsw_m = 8;
  VectorIndex index(options);
  for (int i = 0; i < 300; ++i) {
    index.insert("doc#" + std::to_string(i),
                 TestUtilities::create_test_vector("p" + std::to_string(i), 24));
  }
  ASSERT_TRUE(index.is_approximate());

  for (int i = 0; i < 300; i += 37) {
    auto results = index.query(TestUtilities::create_test_vector("p" + std::to_string(i), 24), 3);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].chunk_id, "doc#" + std::to_string(i));
    EXPECT_NEAR(results[0].score, 1.0f, 1e-5);
  }
}

TEST_F(VectorIndexTest, ApproximateRecallAgainstExactSearch) {
  const size_t dimension = 32;
  IndexOptions exact_options;
  IndexOptions graph_options;
  graph_options.approximate_threshold = 1;
  VectorIndex exact(exact_options);
  VectorIndex graph(graph_options);

  VectorIndex::Batch batch;
  for (int i = 0; i < 1500; ++i) {
    batch.emplace_back("doc" + std::to_string(i / 10) + "#" + std::to_string(i % 10),
                       TestUtilities::create_test_vector("item" + std::to_string(i), dimension));
  }
  exact.insert_batch(batch);
  graph.insert_batch(batch);
  ASSERT_FALSE(exact.is_approximate());
  ASSERT_TRUE(graph.is_approximate());

  size_t found = 0;
  size_t wanted = 0;
  for (int q = 0; q < 40; ++q) {
    auto query = TestUtilities::create_test_vector("question" + std::to_string(q), dimension);
    auto truth = exact.query(query, 10);
    auto approx = graph.query(query, 10);
    for (const auto& expected : truth) {
      ++wanted;
      for (const auto& candidate : approx) {
        if (candidate.chunk_id == expected.chunk_id) {
          ++found;
          break;
        }
      }
    }
    for (size_t i = 1; i < approx.size(); ++i) {
      EXPECT_GE(approx[i - 1].score, approx[i].score);
    }
  }
  EXPECT_GE(static_cast<double>(found) / static_cast<double>(wanted), 0.9);
}

TEST_F(VectorIndexTest, ApproximateIndexSurvivesPersistAndLoad) {
  IndexOptions options;
  options.approximate_threshold = 20;
  VectorIndex original(options);
  for (int i = 0; i < 100; ++i) {
    original.insert("d#" + std::to_string(i),
                    TestUtilities::create_test_vector("s" + std::to_string(i), 16));
  }
  original.persist(index_path_);

  VectorIndex loaded(options);
  loaded.load(index_path_);

  EXPECT_TRUE(loaded.is_approximate());
  auto query = TestUtilities::create_test_vector("s42", 16);
  auto expected = original.query(query, 5);
  auto actual = loaded.query(query, 5);
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(actual[i].chunk_id, expected[i].chunk_id);
  }
}

TEST_F(VectorIndexTest, ConcurrentReadersAndWriter) {
  VectorIndex index;
  for (int i = 0; i < 100; ++i) {
    index.insert("base#" + std::to_string(i),
                 TestUtilities::create_test_vector("b" + std::to_string(i), 8));
  }

  std::atomic<bool> failed{false};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&index, &failed, t]() {
      for (int i = 0; i < 200; ++i) {
        auto results =
            index.query(TestUtilities::create_test_vector("q" + std::to_string(t * 1000 + i), 8),
                        5);
        if (results.size() != 5) {
          failed = true;
        }
      }
    });
  }
  std::thread writer([&index]() {
    for (int i = 0; i < 200; ++i) {
      index.insert("new#" + std::to_string(i),
                   TestUtilities::create_test_vector("n" + std::to_string(i), 8));
      if (i % 50 == 49) {
        index.delete_by_document("new");
      }
    }
  });

  writer.join();
  for (auto& reader : readers) {
    reader.join();
  }
  EXPECT_FALSE(failed.load());
  EXPECT_EQ(index.size(), 100u);
}

}  // namespace docqa_core
