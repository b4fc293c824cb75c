#include "responseparser.h"

#include "spdlog/spdlog.h"

#include <aws/core/utils/Array.h>
#include <aws/core/utils/StringUtils.h>

namespace b2client
{
namespace
{
long long GetInt64Or(const JsonView& json, const Aws::String& key, long long default_value)
{
	return json.ValueExists(key) ? json.GetInt64(key) : default_value;
}

Aws::Vector<Aws::String> GetStringArray(const JsonView& json, const Aws::String& key)
{
	Aws::Vector<Aws::String> res;
	if (!json.ValueExists(key) || !json.GetObject(key).IsListType())
	{
		return res;
	}
	auto array = json.GetArray(key);
	res.reserve(array.GetLength());
	for (size_t i = 0; i < array.GetLength(); i++)
	{
		if (array[i].IsString())
		{
			res.push_back(array[i].AsString());
		}
	}
	return res;
}

FileInfoMap GetStringMap(const JsonView& json, const Aws::String& key)
{
	FileInfoMap res;
	if (!json.ValueExists(key) || !json.GetObject(key).IsObject())
	{
		return res;
	}
	for (const auto& entry : json.GetObject(key).GetAllObjects())
	{
		if (entry.second.IsString())
		{
			res[entry.first] = entry.second.AsString();
		}
	}
	return res;
}
} // namespace

B2Outcome<JsonValue> ParseResponseBody(int http_status, const Aws::String& body)
{
	JsonValue json(body);
	if (!json.WasParseSuccessful())
	{
		if (http_status >= 400)
		{
			return MakeRemoteError(http_status, "", body.empty() ? "empty error response" : body);
		}
		return MakeRemoteError(http_status, "", "Unparseable response body: " + json.GetErrorMessage());
	}

	// successful answers have no status field
	const JsonView view = json.View();
	int status = http_status;
	if (view.ValueExists("status") && view.GetObject("status").IsIntegerType())
	{
		const int body_status = view.GetInteger("status");
		if (body_status >= 400)
		{
			status = body_status;
		}
	}

	if (status >= 400)
	{
		spdlog::debug("Error response {} {}", status, view.GetString("code"));
		return MakeRemoteError(status, view.GetString("code"), view.GetString("message"));
	}

	return json;
}

AccountAuthorization ParseAccountAuthorization(const JsonView& json)
{
	AccountAuthorization res;
	res.account_id_ = json.GetString("accountId");
	res.api_url_ = json.GetString("apiUrl");
	res.authorization_token_ = json.GetString("authorizationToken");
	res.download_url_ = json.GetString("downloadUrl");
	res.recommended_part_size_ = GetInt64Or(json, "recommendedPartSize", 0);
	res.absolute_minimum_part_size_ = GetInt64Or(json, "absoluteMinimumPartSize", 0);

	if (json.ValueExists("allowed"))
	{
		const JsonView allowed = json.GetObject("allowed");
		res.allowed_bucket_id_ = allowed.GetString("bucketId");
		res.allowed_bucket_name_ = allowed.GetString("bucketName");
		res.name_prefix_ = allowed.GetString("namePrefix");
		res.capabilities_reported_ =
		    allowed.ValueExists("capabilities") && allowed.GetObject("capabilities").IsListType();
		res.capabilities_ = ParseKeyCapabilities(GetStringArray(allowed, "capabilities"));
	}
	return res;
}

BucketInfo ParseBucket(const JsonView& json)
{
	BucketInfo res;
	res.account_id_ = json.GetString("accountId");
	res.bucket_id_ = json.GetString("bucketId");
	res.bucket_name_ = json.GetString("bucketName");
	res.bucket_type_ = json.GetString("bucketType");
	res.revision_ = GetInt64Or(json, "revision", -1);
	return res;
}

Aws::Vector<BucketInfo> ParseBuckets(const JsonView& json)
{
	Aws::Vector<BucketInfo> res;
	if (!json.ValueExists("buckets") || !json.GetObject("buckets").IsListType())
	{
		return res;
	}
	auto array = json.GetArray("buckets");
	res.reserve(array.GetLength());
	for (size_t i = 0; i < array.GetLength(); i++)
	{
		res.push_back(ParseBucket(array[i]));
	}
	return res;
}

UploadUrl ParseUploadUrl(const JsonView& json)
{
	UploadUrl res;
	res.bucket_id_ = json.GetString("bucketId");
	res.upload_url_ = json.GetString("uploadUrl");
	res.authorization_token_ = json.GetString("authorizationToken");
	return res;
}

UploadPartUrl ParseUploadPartUrl(const JsonView& json)
{
	UploadPartUrl res;
	res.file_id_ = json.GetString("fileId");
	res.upload_url_ = json.GetString("uploadUrl");
	res.authorization_token_ = json.GetString("authorizationToken");
	return res;
}

FileInfo ParseFileInfo(const JsonView& json)
{
	FileInfo res;
	res.file_id_ = json.GetString("fileId");
	res.file_name_ = json.GetString("fileName");
	res.bucket_id_ = json.GetString("bucketId");
	res.account_id_ = json.GetString("accountId");
	res.content_type_ = json.GetString("contentType");
	res.content_sha1_ = json.GetString("contentSha1");
	res.content_length_ = GetInt64Or(json, "contentLength", 0);
	res.upload_timestamp_ = GetInt64Or(json, "uploadTimestamp", 0);
	res.action_ = json.GetString("action");
	res.file_info_ = GetStringMap(json, "fileInfo");
	return res;
}

PartResult ParsePartResult(const JsonView& json)
{
	PartResult res;
	res.file_id_ = json.GetString("fileId");
	res.part_number_ = static_cast<int>(GetInt64Or(json, "partNumber", 0));
	res.content_sha1_ = json.GetString("contentSha1");
	res.content_length_ = GetInt64Or(json, "contentLength", 0);
	res.upload_timestamp_ = GetInt64Or(json, "uploadTimestamp", 0);
	return res;
}

JsonValue MakeListBucketsBody(const Aws::String& account_id, const Aws::String& bucket_name)
{
	JsonValue body;
	body.WithString("accountId", account_id);
	if (!bucket_name.empty())
	{
		body.WithString("bucketName", bucket_name);
	}
	return body;
}

JsonValue MakeStartLargeFileBody(const Aws::String& bucket_id, const Aws::String& file_name,
				 const Aws::String& content_type, const FileInfoMap& file_info)
{
	JsonValue body;
	body.WithString("bucketId", bucket_id)
	    .WithString("fileName", file_name)
	    .WithString("contentType", content_type.empty() ? kAutoContentType : content_type);

	if (!file_info.empty())
	{
		JsonValue info;
		for (const auto& entry : file_info)
		{
			info.WithString(entry.first, entry.second);
		}
		body.WithObject("fileInfo", std::move(info));
	}
	return body;
}

JsonValue MakeFinishLargeFileBody(const Aws::String& file_id, const Aws::Vector<Aws::String>& part_sha1s)
{
	Aws::Utils::Array<Aws::String> sha1_array(part_sha1s.size());
	for (size_t i = 0; i < part_sha1s.size(); i++)
	{
		sha1_array[i] = part_sha1s[i];
	}

	JsonValue body;
	body.WithString("fileId", file_id).WithArray("partSha1Array", sha1_array);
	return body;
}

JsonValue MakeFileIdBody(const Aws::String& file_id)
{
	JsonValue body;
	body.WithString("fileId", file_id);
	return body;
}

JsonValue MakeDeleteFileVersionBody(const Aws::String& file_id, const Aws::String& file_name)
{
	JsonValue body;
	body.WithString("fileName", file_name).WithString("fileId", file_id);
	return body;
}

Aws::String EncodeFileName(const Aws::String& file_name)
{
	Aws::String res;
	size_t from = 0;
	size_t slash = file_name.find('/');
	while (slash != Aws::String::npos)
	{
		res += Aws::Utils::StringUtils::URLEncode(file_name.substr(from, slash - from).c_str());
		res += '/';
		from = slash + 1;
		slash = file_name.find('/', from);
	}
	res += Aws::Utils::StringUtils::URLEncode(file_name.substr(from).c_str());
	return res;
}
} // namespace b2client
