#pragma once

#include "b2gateway.h"
#include "clientconfig.h"
#include "responseparser.h"

#include <aws/core/http/HttpClient.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpTypes.h>

#include <memory>

namespace b2client
{
// B2Gateway over the SDK HTTP client. API calls and content uploads use two
// clients since uploads need a longer timeout.
class B2HttpGateway : public B2Gateway
{
public:
	explicit B2HttpGateway(ClientConfig config);

	B2Outcome<AccountAuthorization> AuthorizeAccount(const Aws::String& key_id,
							 const Aws::String& application_key) override;

	B2Outcome<Aws::Vector<BucketInfo>> ListBuckets(const Aws::String& account_id,
							const Aws::String& bucket_name) override;

	B2Outcome<UploadUrl> GetUploadUrl(const Aws::String& bucket_id) override;

	B2Outcome<FileInfo> UploadFile(const PartBuffer& data, const UploadUrl& upload_url,
				       const UploadTarget& target, const Aws::String& content_sha1) override;

	B2Outcome<FileInfo> StartLargeFile(const Aws::String& bucket_id, const Aws::String& file_name,
					   const Aws::String& content_type, const FileInfoMap& file_info) override;

	B2Outcome<UploadPartUrl> GetUploadPartUrl(const Aws::String& file_id) override;

	B2Outcome<PartResult> UploadPart(const PartBuffer& data, const UploadPartUrl& upload_url, int part_number,
					 const Aws::String& content_sha1) override;

	B2Outcome<FileInfo> FinishLargeFile(const Aws::String& file_id,
					    const Aws::Vector<Aws::String>& part_sha1s) override;

	B2Outcome<bool> CancelLargeFile(const Aws::String& file_id) override;

	B2Outcome<FileInfo> GetFileInfo(const Aws::String& file_id) override;

	B2Outcome<bool> DeleteFileVersion(const Aws::String& file_id, const Aws::String& file_name) override;

	bool IsAuthorized() const
	{
		return !authorization_.authorization_token_.empty();
	}

private:
	B2Outcome<bool> EnsureAuthorized() const;

	// POST of a JSON body to an API method, with the account token
	B2Outcome<JsonValue> PostJson(const Aws::String& api_method, const JsonValue& body) const;

	// POST of raw content to an upload URL, with the upload token
	B2Outcome<JsonValue> PostContent(const Aws::String& url, const Aws::String& authorization_token,
					 const PartBuffer& data, const Aws::String& content_sha1,
					 const Aws::Http::HeaderValueCollection& headers) const;

	B2Outcome<JsonValue> Execute(const Aws::Http::HttpClient& client,
				     const std::shared_ptr<Aws::Http::HttpRequest>& request) const;

	ClientConfig config_;
	std::shared_ptr<Aws::Http::HttpClient> api_client_;
	std::shared_ptr<Aws::Http::HttpClient> upload_client_;
	AccountAuthorization authorization_;
};
} // namespace b2client
