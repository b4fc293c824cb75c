#pragma once

#include "keycapabilities.h"

#include <aws/core/utils/memory/stl/AWSMap.h>
#include <aws/core/utils/memory/stl/AWSString.h>
#include <aws/core/utils/memory/stl/AWSVector.h>

#include <utility>

namespace b2client
{
using tOffset = long long;

constexpr tOffset kOneMB = 1024 * 1024;
constexpr tOffset kMinPartSize = 5 * kOneMB;
constexpr tOffset kMaxPartSize = 5 * 1024 * kOneMB;
constexpr tOffset kDefaultPartSize = 100 * kOneMB;
constexpr tOffset kMaxPartCount = 10000;

// size of a stream whose length the caller did not give
constexpr tOffset kUnknownSize = -1;

constexpr const char* kAutoContentType = "b2/x-auto";

constexpr const char* kAllocationTag = "B2CLIENT";

using FileInfoMap = Aws::Map<Aws::String, Aws::String>;
using PartBuffer = Aws::Vector<unsigned char>;

struct AccountAuthorization
{
	Aws::String account_id_;
	Aws::String api_url_;
	Aws::String authorization_token_;
	Aws::String download_url_;
	tOffset recommended_part_size_{0};
	tOffset absolute_minimum_part_size_{0};
	// restrictions of the key, empty when it is not restricted
	Aws::String allowed_bucket_id_;
	Aws::String allowed_bucket_name_;
	Aws::String name_prefix_;
	KeyCapabilities capabilities_;
	// the service listed capabilities, even if none of them is known here
	bool capabilities_reported_{false};
};

struct BucketInfo
{
	Aws::String account_id_;
	Aws::String bucket_id_;
	Aws::String bucket_name_;
	Aws::String bucket_type_;
	long long revision_{-1};
};

struct UploadUrl
{
	Aws::String bucket_id_;
	Aws::String upload_url_;
	Aws::String authorization_token_;
};

struct UploadPartUrl
{
	Aws::String file_id_;
	Aws::String upload_url_;
	Aws::String authorization_token_;
};

struct FileInfo
{
	Aws::String file_id_;
	Aws::String file_name_;
	Aws::String bucket_id_;
	Aws::String account_id_;
	Aws::String content_type_;
	Aws::String content_sha1_;
	tOffset content_length_{0};
	long long upload_timestamp_{0};
	Aws::String action_;
	FileInfoMap file_info_;
};

struct PartResult
{
	Aws::String file_id_;
	int part_number_{0};
	Aws::String content_sha1_;
	tOffset content_length_{0};
	long long upload_timestamp_{0};
};

struct PartPlan
{
	tOffset total_size_{0};
	tOffset part_count_{0};
	tOffset part_size_{0};

	// Length of the 1-based part, the last one carries the remainder
	tOffset PartLength(tOffset part_number) const
	{
		if (part_number < part_count_)
		{
			return part_size_;
		}
		return total_size_ - (part_count_ - 1) * part_size_;
	}
};

struct UploadTarget
{
	Aws::String bucket_id_;
	Aws::String file_name_;
	Aws::String content_type_{kAutoContentType};
	FileInfoMap file_info_;

	UploadTarget() = default;
	UploadTarget(Aws::String bucket_id, Aws::String file_name)
	    : bucket_id_{std::move(bucket_id)}, file_name_{std::move(file_name)}
	{
	}
};

// Server-side large file in progress, owned by one LargeFileUpload
struct LargeFileSession
{
	Aws::String file_id_;
	Aws::String bucket_id_;
	Aws::String file_name_;
	Aws::Vector<PartResult> parts_completed_;
	Aws::Vector<Aws::String> part_sha1s_;
};
} // namespace b2client
