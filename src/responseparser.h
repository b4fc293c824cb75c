#pragma once

#include "b2error.h"
#include "b2types.h"

#include <aws/core/utils/json/JsonSerializer.h>

namespace b2client
{
using Aws::Utils::Json::JsonValue;
using Aws::Utils::Json::JsonView;

// Turns an HTTP answer into JSON. Error statuses, and bodies carrying an error
// status, become RemoteError with the service's code and message.
B2Outcome<JsonValue> ParseResponseBody(int http_status, const Aws::String& body);

AccountAuthorization ParseAccountAuthorization(const JsonView& json);
Aws::Vector<BucketInfo> ParseBuckets(const JsonView& json);
BucketInfo ParseBucket(const JsonView& json);
UploadUrl ParseUploadUrl(const JsonView& json);
UploadPartUrl ParseUploadPartUrl(const JsonView& json);
FileInfo ParseFileInfo(const JsonView& json);
PartResult ParsePartResult(const JsonView& json);

JsonValue MakeListBucketsBody(const Aws::String& account_id, const Aws::String& bucket_name);
JsonValue MakeStartLargeFileBody(const Aws::String& bucket_id, const Aws::String& file_name,
				 const Aws::String& content_type, const FileInfoMap& file_info);
JsonValue MakeFinishLargeFileBody(const Aws::String& file_id, const Aws::Vector<Aws::String>& part_sha1s);
JsonValue MakeFileIdBody(const Aws::String& file_id);
JsonValue MakeDeleteFileVersionBody(const Aws::String& file_id, const Aws::String& file_name);

// Percent-encoding of a file name for the X-Bz-File-Name header, slashes kept
Aws::String EncodeFileName(const Aws::String& file_name);
} // namespace b2client
