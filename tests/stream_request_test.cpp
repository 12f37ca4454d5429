#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "streamrequest.hpp"

using namespace StreamPoll;

TEST(BuildRequestTest, PairsNamesWithPositionsInOrder) {
  std::vector<StreamName> names{"s1", "s2", "s3"};
  std::vector<StreamPosition> positions{{0, 0}, {5, 1}, {9, 0}};

  auto request = buildRequest(names, positions);
  ASSERT_EQ(request.size(), 3u);
  EXPECT_EQ(request.streams[0], (StreamRead{"s1", {0, 0}}));
  EXPECT_EQ(request.streams[1], (StreamRead{"s2", {5, 1}}));
  EXPECT_EQ(request.streams[2], (StreamRead{"s3", {9, 0}}));
  EXPECT_FALSE(request.count.has_value());
  EXPECT_FALSE(request.blockMillis.has_value());
  EXPECT_EQ(request.names(), names);
}

TEST(BuildRequestTest, SharedStartDefaultsToBeginning) {
  std::vector<StreamName> names{"a", "b"};
  auto request = buildRequest(names);
  for (const auto &s : request.streams) EXPECT_EQ(s.from, StreamPosition::beginning());

  auto later = buildRequest(names, StreamPosition{42, 7});
  for (const auto &s : later.streams) EXPECT_EQ(s.from, (StreamPosition{42, 7}));
}

TEST(BuildRequestTest, LengthMismatchIsArityError) {
  std::vector<StreamName> names{"s1", "s2"};
  std::vector<StreamPosition> positions{StreamPosition::beginning()};
  try {
    (void)buildRequest(names, positions);
    FAIL() << "expected RequestError";
  } catch (const RequestError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::ArityMismatch);
  }
}

TEST(BuildRequestTest, RepeatedNameIsRejected) {
  std::vector<StreamName> names{"s1", "s2", "s1"};
  try {
    (void)buildRequest(names);
    FAIL() << "expected RequestError";
  } catch (const RequestError &err) {
    EXPECT_EQ(err.kind(), ErrorKind::DuplicateStream);
  }
}

TEST(BuildRequestTest, EmptyInputGivesEmptyRequest) {
  std::vector<StreamName> names;
  EXPECT_TRUE(buildRequest(names).empty());
}

TEST(XreadArgumentsTest, KeysThenIds) {
  std::vector<StreamName> names{"s1", "s2"};
  std::vector<StreamPosition> positions{{0, 0}, {1526919030474, 55}};
  auto args = xreadArguments(buildRequest(names, positions));
  EXPECT_EQ(args, (std::vector<std::string>{"XREAD", "STREAMS", "s1", "s2", "0-0", "1526919030474-55"}));
}

TEST(XreadArgumentsTest, CountAndBlockPrecedeStreams) {
  std::vector<StreamName> names{"s1"};
  auto request = buildRequest(names);
  request.count = 10;
  request.blockMillis = 500;
  EXPECT_EQ(xreadArguments(request),
            (std::vector<std::string>{"XREAD", "COUNT", "10", "BLOCK", "500", "STREAMS", "s1", "0-0"}));
}

TEST(XreadArgumentsTest, BinaryNamesPassUnchanged) {
  std::vector<StreamName> names{std::string("a\0b", 3)};
  auto args = xreadArguments(buildRequest(names));
  ASSERT_EQ(args.size(), 4u);
  EXPECT_EQ(args[2].size(), 3u);
  EXPECT_EQ(args[2], std::string("a\0b", 3));
}

TEST(PartitionRequestTest, ZeroKeepsRequestWhole) {
  std::vector<StreamName> names{"a", "b", "c"};
  auto batches = partitionRequest(buildRequest(names), 0);
  ASSERT_EQ(batches.size(), 1u);
  EXPECT_EQ(batches[0].names(), names);
}

TEST(PartitionRequestTest, SplitsConsecutivelyAndCopiesOptions) {
  std::vector<StreamName> names{"a", "b", "c", "d", "e"};
  auto request = buildRequest(names);
  request.count = 3;
  request.blockMillis = 100;

  auto batches = partitionRequest(request, 2);
  ASSERT_EQ(batches.size(), 3u);
  EXPECT_EQ(batches[0].names(), (std::vector<StreamName>{"a", "b"}));
  EXPECT_EQ(batches[1].names(), (std::vector<StreamName>{"c", "d"}));
  EXPECT_EQ(batches[2].names(), (std::vector<StreamName>{"e"}));
  for (const auto &batch : batches) {
    EXPECT_EQ(batch.count, 3u);
    EXPECT_EQ(batch.blockMillis, 100u);
  }
}

TEST(PartitionRequestTest, OneStreamPerTask) {
  std::vector<StreamName> names{"a", "b", "c"};
  auto batches = partitionRequest(buildRequest(names), 1);
  ASSERT_EQ(batches.size(), 3u);
  for (auto i{0u}; i < names.size(); i++) EXPECT_EQ(batches[i].names(), (std::vector<StreamName>{names[i]}));
}

TEST(PartitionRequestTest, EmptyRequestHasNoBatches) {
  EXPECT_TRUE(partitionRequest(ReadRequest{}, 0).empty());
  EXPECT_TRUE(partitionRequest(ReadRequest{}, 4).empty());
}
