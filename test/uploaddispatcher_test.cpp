#include "mock_gateway.h"
#include "test_helpers.h"
#include "uploaddispatcher.h"

#include <aws/core/utils/memory/stl/AWSStringStream.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>

using namespace b2client;
using namespace b2client::testing_helpers;

using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::StrictMock;

namespace {
const Aws::String kFileId = "4_zdispatched";

AccountAuthorization MakeAuthorization(KeyCapabilities capabilities,
                                       const Aws::String &name_prefix) {
  AccountAuthorization authorization;
  authorization.account_id_ = "account-1";
  authorization.api_url_ = "https://api000.backblaze.test";
  authorization.authorization_token_ = "account-token";
  authorization.allowed_bucket_id_ = "bucket-1";
  authorization.allowed_bucket_name_ = "my-bucket";
  authorization.name_prefix_ = name_prefix;
  authorization.capabilities_ = std::move(capabilities);
  authorization.capabilities_reported_ = true;
  return authorization;
}
} // namespace

class UploadDispatcherTest : public ::testing::Test {
protected:
  UploadDispatcherTest() : session_(gateway_, MakeConfig()) {}

  static ClientConfig MakeConfig() {
    ClientConfig config;
    config.key_id_ = "key-id";
    config.application_key_ = "application-key";
    config.part_size_ = kMinPartSize;
    return config;
  }

  void Authenticate(
      KeyCapabilities capabilities = {KeyCapability::LIST_FILES,
                                      KeyCapability::WRITE_FILES},
      const Aws::String &name_prefix = "") {
    EXPECT_CALL(gateway_, AuthorizeAccount("key-id", "application-key"))
        .WillOnce(Return(MakeAuthorization(capabilities, name_prefix)));
    ASSERT_TRUE(session_.Authenticate().IsSuccess());
  }

  void ExpectSingleShot(size_t size) {
    EXPECT_CALL(gateway_, GetUploadUrl("bucket-1"))
        .WillOnce(Return(MakeUploadUrl("bucket-1")));
    EXPECT_CALL(gateway_, UploadFile(SizeIs(size), _, _, _))
        .WillOnce(Invoke(EchoUploadedFile));
  }

  StrictMock<MockB2Gateway> gateway_;
  UploadSession session_;
};

TEST_F(UploadDispatcherTest, EmptyStreamIsSingleShot) {
  Authenticate();
  ExpectSingleShot(0);

  Aws::StringStream stream("");
  const UploadDispatcher dispatcher(session_);
  auto outcome =
      dispatcher.UploadStream(stream, 0, UploadTarget("", "empty.txt"));
  ASSERT_TRUE(outcome.IsSuccess());
  UploadProducerPtr producer = outcome.GetResultWithOwnership();
  ASSERT_EQ(producer->GetTotalParts(), 1);

  auto event = producer->Next();
  ASSERT_TRUE(event.IsSuccess());
  ASSERT_EQ(event.GetResult().type_, UploadEventType::COMPLETED);
  ASSERT_EQ(event.GetResult().part_number_, 0);
  ASSERT_EQ(event.GetResult().total_parts_, 1);
  ASSERT_EQ(event.GetResult().file_.file_name_, "empty.txt");
  ASSERT_FALSE(producer->HasNext());

  auto end = producer->Next();
  ASSERT_TRUE(end.IsSuccess());
  ASSERT_EQ(end.GetResult().type_, UploadEventType::END_OF_UPLOAD);
}

TEST_F(UploadDispatcherTest, ReadStreamIsUploadedWhole) {
  Authenticate();
  ExpectSingleShot(12);

  Aws::StringStream stream("some content");
  Aws::String first_word;
  stream >> first_word;
  ASSERT_EQ(first_word, "some");

  const UploadDispatcher dispatcher(session_);
  auto outcome =
      dispatcher.UploadStream(stream, 12, UploadTarget("", "content.txt"));
  ASSERT_TRUE(outcome.IsSuccess());
  UploadProducerPtr producer = outcome.GetResultWithOwnership();

  const auto result = RunToCompletion(*producer, nullptr);
  ASSERT_TRUE(result.IsSuccess());
}

TEST_F(UploadDispatcherTest, OneByteOverPartSizeIsMultipart) {
  Authenticate();

  const Aws::String content = MakeContent(kMinPartSize + 1);
  Aws::StringStream stream(content);

  FileInfo finished;
  finished.file_id_ = kFileId;
  finished.file_name_ = "big.bin";
  finished.content_length_ = kMinPartSize + 1;

  EXPECT_CALL(gateway_, StartLargeFile("bucket-1", "big.bin", _, _))
      .WillOnce(Return(MakeStartedFile(kFileId, "big.bin")));
  EXPECT_CALL(gateway_, GetUploadPartUrl(kFileId))
      .Times(2)
      .WillRepeatedly(Return(MakePartUrl(kFileId)));
  EXPECT_CALL(gateway_, UploadPart(SizeIs(kMinPartSize), _, 1, _))
      .WillOnce(Invoke(EchoUploadedPart));
  EXPECT_CALL(gateway_, UploadPart(SizeIs(1), _, 2, _))
      .WillOnce(Invoke(EchoUploadedPart));
  EXPECT_CALL(gateway_, FinishLargeFile(kFileId, SizeIs(2)))
      .WillOnce(Return(finished));

  const UploadDispatcher dispatcher(session_);
  auto outcome = dispatcher.UploadStream(stream, kMinPartSize + 1,
                                         UploadTarget("", "big.bin"));
  ASSERT_TRUE(outcome.IsSuccess());
  UploadProducerPtr producer = outcome.GetResultWithOwnership();
  ASSERT_EQ(producer->GetTotalParts(), 2);

  const auto result = RunToCompletion(*producer, nullptr);
  ASSERT_TRUE(result.IsSuccess());
  ASSERT_EQ(result.GetResult().file_id_, kFileId);
}

TEST_F(UploadDispatcherTest, StreamWithoutSizeFailure) {
  Authenticate();

  Aws::StringStream stream("some content");
  const UploadDispatcher dispatcher(session_);
  auto outcome = dispatcher.UploadStream(stream, kUnknownSize,
                                         UploadTarget("", "stream.txt"));
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
}

TEST_F(UploadDispatcherTest, NotAuthenticatedFailure) {
  Aws::StringStream stream("abc");
  const UploadDispatcher dispatcher(session_);
  auto outcome =
      dispatcher.UploadStream(stream, 3, UploadTarget("bucket-1", "abc.txt"));
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
}

TEST_F(UploadDispatcherTest, KeyWithoutWriteFilesFailure) {
  Authenticate({KeyCapability::LIST_FILES, KeyCapability::READ_FILES});

  Aws::StringStream stream("abc");
  const UploadDispatcher dispatcher(session_);
  auto outcome =
      dispatcher.UploadStream(stream, 3, UploadTarget("", "abc.txt"));
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
}

TEST_F(UploadDispatcherTest, StreamWithoutNameFailure) {
  Authenticate();

  Aws::StringStream stream("abc");
  const UploadDispatcher dispatcher(session_);
  auto outcome = dispatcher.UploadStream(stream, 3, UploadTarget());
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
}

TEST_F(UploadDispatcherTest, PathNameResolution) {
  Authenticate();

  const Aws::String content = MakeContent(100);
  const std::string path = WriteTempFile("dispatch", content);
  const Aws::String base_name = GetBaseName(path.c_str());

  EXPECT_CALL(gateway_, GetUploadUrl("bucket-1"))
      .WillOnce(Return(MakeUploadUrl("bucket-1")));
  EXPECT_CALL(gateway_,
              UploadFile(SizeIs(100), _,
                         Field(&UploadTarget::file_name_, "backups/" + base_name),
                         Sha1Hex(ToBuffer(content, 0, content.size()))))
      .WillOnce(Invoke(EchoUploadedFile));

  const UploadDispatcher dispatcher(session_);
  UploadTarget target;
  target.file_name_ = "backups/";
  auto outcome = dispatcher.UploadPath(path.c_str(), target);
  ASSERT_TRUE(outcome.IsSuccess());

  const auto result = RunToCompletion(*outcome.GetResult(), nullptr);
  ASSERT_TRUE(result.IsSuccess());
  ASSERT_EQ(result.GetResult().file_name_, "backups/" + base_name);
  ASSERT_EQ(result.GetResult().content_length_, 100);

  std::remove(path.c_str());
}

TEST_F(UploadDispatcherTest, RestrictedKeyPrefix) {
  Authenticate({KeyCapability::WRITE_FILES}, "team/");

  EXPECT_CALL(gateway_, GetUploadUrl("bucket-1"))
      .WillOnce(Return(MakeUploadUrl("bucket-1")));
  EXPECT_CALL(gateway_,
              UploadFile(_, _, Field(&UploadTarget::file_name_, "team/a.txt"), _))
      .WillOnce(Invoke(EchoUploadedFile));

  Aws::StringStream stream("abc");
  const UploadDispatcher dispatcher(session_);
  auto outcome = dispatcher.UploadStream(stream, 3, UploadTarget("", "a.txt"));
  ASSERT_TRUE(outcome.IsSuccess());
  ASSERT_TRUE(RunToCompletion(*outcome.GetResult(), nullptr).IsSuccess());
}

TEST_F(UploadDispatcherTest, MissingLocalFileFailure) {
  Authenticate();

  const UploadDispatcher dispatcher(session_);
  auto outcome = dispatcher.UploadPath(MakeTempPath("missing").c_str(),
                                       UploadTarget("", "x.bin"));
  ASSERT_FALSE(outcome.IsSuccess());
  ASSERT_EQ(outcome.GetError().GetErrorType(), B2Errors::CONFIG);
}

TEST_F(UploadDispatcherTest, SingleShotFailureIsReturned) {
  Authenticate();

  EXPECT_CALL(gateway_, GetUploadUrl("bucket-1"))
      .WillOnce(Return(MakeRemoteError(403, "cap_exceeded", "Cap exceeded")));

  Aws::StringStream stream("abc");
  const UploadDispatcher dispatcher(session_);
  auto outcome = dispatcher.UploadStream(stream, 3, UploadTarget("", "a.txt"));
  ASSERT_TRUE(outcome.IsSuccess());

  const auto result = RunToCompletion(*outcome.GetResult(), nullptr);
  ASSERT_FALSE(result.IsSuccess());
  ASSERT_EQ(result.GetError().GetCode(), "cap_exceeded");
}

TEST(BaseNameTest, Paths) {
  ASSERT_EQ(GetBaseName("/tmp/data.bin"), "data.bin");
  ASSERT_EQ(GetBaseName("data.bin"), "data.bin");
  ASSERT_EQ(GetBaseName("dir/"), "");
}
