#include "test_helpers.h"
#include "uploadsource.h"

#include <aws/core/utils/memory/stl/AWSStringStream.h>

#include <gtest/gtest.h>

#include <cstdio>

using namespace b2client;
using namespace b2client::testing_helpers;

TEST(UploadSourceTest, Sha1Hex) {
  ASSERT_EQ(Sha1Hex(PartBuffer()), "da39a3ee5e6b4b0d3255bfef95601890afd80709");

  const Aws::String abc = "abc";
  ASSERT_EQ(Sha1Hex(ToBuffer(abc, 0, abc.size())),
            "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(UploadSourceTest, PathSourceReadsInOrder) {
  const Aws::String content = MakeContent(1000);
  const std::string path = WriteTempFile("source", content);

  UploadSource source = UploadSource::FromPath(path.c_str());
  ASSERT_TRUE(source.IsPath());
  ASSERT_FALSE(source.IsOpen());
  ASSERT_TRUE(source.Open().IsSuccess());
  ASSERT_TRUE(source.IsOpen());

  auto first = source.Read(600);
  ASSERT_TRUE(first.IsSuccess());
  ASSERT_EQ(first.GetResult(), ToBuffer(content, 0, 600));

  auto second = source.Read(400);
  ASSERT_TRUE(second.IsSuccess());
  ASSERT_EQ(second.GetResult(), ToBuffer(content, 600, 400));
  ASSERT_EQ(source.GetBytesRead(), 1000);

  source.Close();
  ASSERT_FALSE(source.IsOpen());
  source.Close();
  ASSERT_FALSE(source.IsOpen());

  std::remove(path.c_str());
}

TEST(UploadSourceTest, ShortReadFailure) {
  Aws::StringStream stream("0123456789");
  UploadSource source = UploadSource::FromStream(stream);
  ASSERT_FALSE(source.IsPath());
  ASSERT_TRUE(source.Open().IsSuccess());

  const auto outcome = source.Read(20);
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::PROTOCOL);
}

TEST(UploadSourceTest, StreamIsRewoundOnOpen) {
  Aws::StringStream stream("headerpayload");
  stream.seekg(6);
  UploadSource source = UploadSource::FromStream(stream);
  ASSERT_TRUE(source.Open().IsSuccess());

  const auto outcome = source.Read(13);
  ASSERT_TRUE(outcome.IsSuccess());
  const PartBuffer &buffer = outcome.GetResult();
  ASSERT_EQ(Aws::String(buffer.begin(), buffer.end()), "headerpayload");
}

TEST(UploadSourceTest, StreamAtEndIsRewound) {
  Aws::StringStream stream("abc");
  Aws::String drained;
  stream >> drained;
  ASSERT_TRUE(stream.eof());

  UploadSource source = UploadSource::FromStream(stream);
  ASSERT_TRUE(source.Open().IsSuccess());
  const auto outcome = source.Read(3);
  ASSERT_TRUE(outcome.IsSuccess());
  ASSERT_EQ(source.GetBytesRead(), 3);
}

TEST(UploadSourceTest, MissingFileFailure) {
  UploadSource source =
      UploadSource::FromPath(MakeTempPath("source-missing").c_str());
  const auto outcome = source.Open();
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
  ASSERT_FALSE(source.IsOpen());
}

TEST(UploadSourceTest, ReadWhenClosedFailure) {
  Aws::StringStream stream("abc");
  UploadSource source = UploadSource::FromStream(stream);
  const auto outcome = source.Read(3);
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::PROTOCOL);
}
