#pragma once

#include "b2error.h"
#include "b2types.h"

namespace b2client
{
// One synchronous call per B2 endpoint. The account token obtained by
// AuthorizeAccount is used by every other call.
class B2Gateway
{
public:
	virtual ~B2Gateway() = default;

	virtual B2Outcome<AccountAuthorization> AuthorizeAccount(const Aws::String& key_id,
								 const Aws::String& application_key) = 0;

	// an empty bucket_name lists every bucket of the account
	virtual B2Outcome<Aws::Vector<BucketInfo>> ListBuckets(const Aws::String& account_id,
								const Aws::String& bucket_name) = 0;

	virtual B2Outcome<UploadUrl> GetUploadUrl(const Aws::String& bucket_id) = 0;

	virtual B2Outcome<FileInfo> UploadFile(const PartBuffer& data, const UploadUrl& upload_url,
					       const UploadTarget& target, const Aws::String& content_sha1) = 0;

	virtual B2Outcome<FileInfo> StartLargeFile(const Aws::String& bucket_id, const Aws::String& file_name,
						   const Aws::String& content_type, const FileInfoMap& file_info) = 0;

	virtual B2Outcome<UploadPartUrl> GetUploadPartUrl(const Aws::String& file_id) = 0;

	// part_number starts at 1
	virtual B2Outcome<PartResult> UploadPart(const PartBuffer& data, const UploadPartUrl& upload_url,
						 int part_number, const Aws::String& content_sha1) = 0;

	// part_sha1s in ascending part number order
	virtual B2Outcome<FileInfo> FinishLargeFile(const Aws::String& file_id,
						    const Aws::Vector<Aws::String>& part_sha1s) = 0;

	virtual B2Outcome<bool> CancelLargeFile(const Aws::String& file_id) = 0;

	virtual B2Outcome<FileInfo> GetFileInfo(const Aws::String& file_id) = 0;

	virtual B2Outcome<bool> DeleteFileVersion(const Aws::String& file_id, const Aws::String& file_name) = 0;
};
} // namespace b2client
