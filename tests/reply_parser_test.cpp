#include <gtest/gtest.h>
#include <hiredis/hiredis.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "streamconnection.hpp"

using namespace StreamPoll;

namespace {
  std::string bulk(std::string_view s) { return std::format("${}\r\n{}\r\n", s.size(), s); }
  std::string array(size_t n) { return std::format("*{}\r\n", n); }
  std::string map(size_t n) { return std::format("%{}\r\n", n); }

  std::string entry(std::string_view id, std::vector<std::string> fields) {
    auto out = array(2) + bulk(id) + array(fields.size());
    for (const auto &f : fields) out += bulk(f);
    return out;
  }

  /**
   * Decode raw RESP bytes with hiredis' own reader, as a live connection would
   */
  ReplyPointer decode(std::string_view resp) {
    std::unique_ptr<redisReader, decltype(&redisReaderFree)> reader(redisReaderCreate(), &redisReaderFree);
    EXPECT_EQ(redisReaderFeed(reader.get(), resp.data(), resp.size()), REDIS_OK);
    void *out{nullptr};
    EXPECT_EQ(redisReaderGetReply(reader.get(), &out), REDIS_OK);
    EXPECT_NE(out, nullptr);
    return ReplyPointer(static_cast<redisReply *>(out));
  }

  std::string twoStreamsResp2() {
    return array(2) +                                                    //
           array(2) + bulk("s1") + array(2) + entry("1-0", {"k", "v1"}) + entry("2-0", {"k", "v2"}) +  //
           array(2) + bulk("s3") + array(1) + entry("7-3", {"a", "x", "b", "y"});
  }
};  // namespace

TEST(ReplyParserTest, Resp2ArrayOfPairs) {
  auto reply = decode(twoStreamsResp2());
  auto parsed = parseReadReply(reply.get());
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
  ASSERT_EQ(parsed->streams.size(), 2u);

  const auto &s1 = parsed->streams[0];
  EXPECT_EQ(s1.name, "s1");
  ASSERT_EQ(s1.entries.size(), 2u);
  EXPECT_EQ(s1.entries[0].position, (StreamPosition{1, 0}));
  EXPECT_EQ(s1.entries[1].position, (StreamPosition{2, 0}));
  EXPECT_EQ(s1.entries[1].fields, (std::vector<Field>{{"k", FieldValue{std::string("v2")}}}));

  const auto &s3 = parsed->streams[1];
  EXPECT_EQ(s3.name, "s3");
  ASSERT_EQ(s3.entries.size(), 1u);
  EXPECT_EQ(s3.entries[0].position, (StreamPosition{7, 3}));
  EXPECT_EQ(s3.entries[0].fields, (std::vector<Field>{{"a", FieldValue{std::string("x")}},
                                                      {"b", FieldValue{std::string("y")}}}));
}

TEST(ReplyParserTest, Resp3MapGivesSameResult) {
  auto resp3 = map(2) +                                                            //
               bulk("s1") + array(2) + entry("1-0", {"k", "v1"}) + entry("2-0", {"k", "v2"}) +  //
               bulk("s3") + array(1) + entry("7-3", {"a", "x", "b", "y"});
  auto fromMap = parseReadReply(decode(resp3).get());
  auto fromArray = parseReadReply(decode(twoStreamsResp2()).get());
  ASSERT_TRUE(fromMap.has_value()) << fromMap.error().message;
  ASSERT_TRUE(fromArray.has_value());
  EXPECT_EQ(fromMap.value(), fromArray.value());
}

TEST(ReplyParserTest, NilMeansNoData) {
  auto resp2 = parseReadReply(decode("*-1\r\n").get());
  ASSERT_TRUE(resp2.has_value());
  EXPECT_TRUE(resp2->streams.empty());

  auto resp3 = parseReadReply(decode("_\r\n").get());
  ASSERT_TRUE(resp3.has_value());
  EXPECT_TRUE(resp3->streams.empty());
}

TEST(ReplyParserTest, BinaryValuesPassThrough) {
  std::string raw("\xff\x00\x01", 3);
  auto parsed = parseReadReply(decode(array(1) + array(2) + bulk("bin") + array(1) + entry("5-0", {"f", raw})).get());
  ASSERT_TRUE(parsed.has_value());
  const auto &value = parsed->streams[0].entries[0].fields[0].second;
  ASSERT_TRUE(std::holds_alternative<std::string>(value));
  EXPECT_EQ(std::get<std::string>(value), raw);
}

TEST(ReplyParserTest, IntegerAndNilFieldValues) {
  auto resp = array(1) + array(2) + bulk("s") + array(1) +  //
              array(2) + bulk("9-0") + array(4) + bulk("n") + ":42\r\n" + bulk("gone") + "$-1\r\n";
  auto parsed = parseReadReply(decode(resp).get());
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
  const auto &fields = parsed->streams[0].entries[0].fields;
  ASSERT_EQ(fields.size(), 2u);
  EXPECT_EQ(fields[0].second, FieldValue{42LL});
  EXPECT_TRUE(std::holds_alternative<std::monostate>(fields[1].second));
}

TEST(ReplyParserTest, DeletedEntryHasNoFields) {
  auto resp = array(1) + array(2) + bulk("s") + array(1) + array(2) + bulk("3-0") + "*-1\r\n";
  auto parsed = parseReadReply(decode(resp).get());
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
  EXPECT_EQ(parsed->streams[0].entries[0].position, (StreamPosition{3, 0}));
  EXPECT_TRUE(parsed->streams[0].entries[0].fields.empty());
}

TEST(ReplyParserTest, MalformedShapes) {
  std::vector<std::string> bad{
      ":1\r\n",                                                                        // not a list
      array(1) + bulk("s1"),                                                           // not a pair
      array(1) + array(2) + bulk("s") + array(1) + entry("x-1", {"k", "v"}),           // bad id
      array(1) + array(2) + bulk("s") + array(1) + entry("1-0", {"k", "v", "odd"}),    // odd fields
      array(1) + array(2) + bulk("s") + array(2) + entry("2-0", {}) + entry("1-0", {}),  // decreasing
      array(1) + array(2) + bulk("s") + array(2) + entry("2-0", {}) + entry("2-0", {}),  // repeated
      array(1) + array(2) + bulk("s") + bulk("entries"),                               // entries not a list
  };
  for (const auto &resp : bad) {
    auto parsed = parseReadReply(decode(resp).get());
    ASSERT_FALSE(parsed.has_value()) << resp;
    EXPECT_EQ(parsed.error().kind, ErrorKind::MalformedReply) << resp;
  }
}

TEST(ReplyParserTest, ErrorRepliesAreClassified) {
  auto noauth = parseReadReply(decode("-NOAUTH Authentication required.\r\n").get());
  ASSERT_FALSE(noauth.has_value());
  EXPECT_EQ(noauth.error().kind, ErrorKind::AuthError);

  auto wrongType = parseReadReply(decode("-WRONGTYPE Operation against a key holding the wrong kind of value\r\n").get());
  ASSERT_FALSE(wrongType.has_value());
  EXPECT_EQ(wrongType.error().kind, ErrorKind::CommandError);
  EXPECT_NE(wrongType.error().message.find("WRONGTYPE"), std::string::npos);
}

TEST(ReplyParserTest, NullReplyIsMalformed) {
  auto parsed = parseReadReply(nullptr);
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().kind, ErrorKind::MalformedReply);
}

TEST(ContextFailureTest, MapsHiredisErrorCodes) {
  redisContext ctx{};
  std::strcpy(ctx.errstr, "boom");

  EXPECT_EQ(contextFailure(nullptr).kind, ErrorKind::TransportError);

  ctx.err = REDIS_ERR_TIMEOUT;
  EXPECT_EQ(contextFailure(&ctx).kind, ErrorKind::Timeout);

  ctx.err = REDIS_ERR_IO;
  errno = EAGAIN;
  EXPECT_EQ(contextFailure(&ctx).kind, ErrorKind::Timeout);
  errno = ECONNRESET;
  EXPECT_EQ(contextFailure(&ctx).kind, ErrorKind::TransportError);

  ctx.err = REDIS_ERR_EOF;
  EXPECT_EQ(contextFailure(&ctx).kind, ErrorKind::TransportError);

  ctx.err = REDIS_ERR_PROTOCOL;
  EXPECT_EQ(contextFailure(&ctx).kind, ErrorKind::MalformedReply);

  ctx.err = REDIS_ERR_OTHER;
  EXPECT_EQ(contextFailure(&ctx, true).kind, ErrorKind::AddressError);
  EXPECT_EQ(contextFailure(&ctx, false).kind, ErrorKind::TransportError);
  EXPECT_EQ(contextFailure(&ctx).message, "boom");
}

TEST(ContextFailureTest, ServerErrorClassification) {
  EXPECT_EQ(classifyErrorReply("WRONGPASS invalid username-password pair"), ErrorKind::AuthError);
  EXPECT_EQ(classifyErrorReply("NOPERM this user has no permissions"), ErrorKind::AuthError);
  EXPECT_EQ(classifyErrorReply("ERR unknown command"), ErrorKind::CommandError);
}

TEST(RemainingTimeTest, DeadlineHandling) {
  auto none = remainingTime(std::nullopt);
  ASSERT_TRUE(none.has_value());
  EXPECT_EQ(none->tv_sec, 0);
  EXPECT_EQ(none->tv_usec, 0);

  EXPECT_FALSE(remainingTime(std::chrono::steady_clock::now() - std::chrono::milliseconds{1}).has_value());

  auto ahead = remainingTime(std::chrono::steady_clock::now() + std::chrono::seconds{5});
  ASSERT_TRUE(ahead.has_value());
  EXPECT_GE(ahead->tv_sec, 4);
}
