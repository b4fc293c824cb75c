#include "b2httpgateway.h"

#include "spdlog/spdlog.h"

#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpClientFactory.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/HashingUtils.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/core/utils/stream/ResponseStream.h>

namespace b2client
{
using Aws::Http::HttpMethod;
using Aws::Http::HttpResponseCode;

namespace
{
Aws::Client::ClientConfiguration MakeHttpConfiguration(const ClientConfig& config, long request_timeout_ms)
{
	Aws::Client::ClientConfiguration http_config;
	http_config.allowSystemProxy = true;
	http_config.verifySSL = config.verify_ssl_;
	http_config.userAgent = config.user_agent_;
	http_config.connectTimeoutMs = config.connect_timeout_ms_;
	if (request_timeout_ms > 0)
	{
		http_config.requestTimeoutMs = request_timeout_ms;
	}
	return http_config;
}

Aws::String MakeBasicAuthorization(const Aws::String& key_id, const Aws::String& application_key)
{
	const Aws::String credentials = key_id + ":" + application_key;
	const Aws::Utils::ByteBuffer bytes(reinterpret_cast<const unsigned char*>(credentials.c_str()),
					   credentials.size());
	return "Basic " + Aws::Utils::HashingUtils::Base64Encode(bytes);
}
} // namespace

B2HttpGateway::B2HttpGateway(ClientConfig config)
    : config_{std::move(config)},
      api_client_{Aws::Http::CreateHttpClient(MakeHttpConfiguration(config_, config_.api_timeout_ms_))},
      upload_client_{Aws::Http::CreateHttpClient(MakeHttpConfiguration(config_, config_.upload_timeout_ms_))}
{
}

B2Outcome<bool> B2HttpGateway::EnsureAuthorized() const
{
	if (!IsAuthorized())
	{
		return MakeConfigError("Account is not authorized");
	}
	return true;
}

B2Outcome<JsonValue> B2HttpGateway::Execute(const Aws::Http::HttpClient& client,
					    const std::shared_ptr<Aws::Http::HttpRequest>& request) const
{
	const Aws::String uri = request->GetUri().GetURIString();
	spdlog::debug("Request {}", uri);

	const auto response = client.MakeRequest(request);
	if (!response)
	{
		return MakeTransportError("No response from " + uri);
	}
	if (response->GetResponseCode() == HttpResponseCode::REQUEST_NOT_MADE || response->HasClientError())
	{
		return MakeTransportError(uri + ": " + response->GetClientErrorMessage());
	}

	Aws::StringStream body;
	body << response->GetResponseBody().rdbuf();

	const int status = static_cast<int>(response->GetResponseCode());
	spdlog::debug("Response status {}", status);
	return ParseResponseBody(status, body.str());
}

B2Outcome<JsonValue> B2HttpGateway::PostJson(const Aws::String& api_method, const JsonValue& body) const
{
	const auto auth_outcome = EnsureAuthorized();
	B2C_PASS_OUTCOME_ON_ERROR(auth_outcome);

	const Aws::String url = authorization_.api_url_ + kApiVersionPath + "/" + api_method;
	auto request =
	    Aws::Http::CreateHttpRequest(url, HttpMethod::HTTP_POST, Aws::Utils::Stream::DefaultResponseStreamFactoryMethod);

	const Aws::String payload = body.View().WriteCompact();
	request->SetHeaderValue("Authorization", authorization_.authorization_token_);
	request->SetContentType("application/json");
	request->SetContentLength(Aws::Utils::StringUtils::to_string(payload.size()));
	request->AddContentBody(Aws::MakeShared<Aws::StringStream>(kAllocationTag, payload));

	return Execute(*api_client_, request);
}

B2Outcome<JsonValue> B2HttpGateway::PostContent(const Aws::String& url, const Aws::String& authorization_token,
						const PartBuffer& data, const Aws::String& content_sha1,
						const Aws::Http::HeaderValueCollection& headers) const
{
	auto request =
	    Aws::Http::CreateHttpRequest(url, HttpMethod::HTTP_POST, Aws::Utils::Stream::DefaultResponseStreamFactoryMethod);

	request->SetHeaderValue("Authorization", authorization_token);
	request->SetHeaderValue("X-Bz-Content-Sha1", content_sha1);
	for (const auto& header : headers)
	{
		request->SetHeaderValue(header.first, header.second);
	}

	// the buffer is read in place, it outlives the request
	Aws::Utils::Stream::PreallocatedStreamBuf pre_buf(const_cast<unsigned char*>(data.data()), data.size());
	request->AddContentBody(Aws::MakeShared<Aws::IOStream>(kAllocationTag, &pre_buf));
	request->SetContentLength(Aws::Utils::StringUtils::to_string(data.size()));

	return Execute(*upload_client_, request);
}

B2Outcome<AccountAuthorization> B2HttpGateway::AuthorizeAccount(const Aws::String& key_id,
								const Aws::String& application_key)
{
	const Aws::String url = config_.api_base_url_ + kApiVersionPath + "/b2_authorize_account";
	auto request =
	    Aws::Http::CreateHttpRequest(url, HttpMethod::HTTP_GET, Aws::Utils::Stream::DefaultResponseStreamFactoryMethod);
	request->SetHeaderValue("Authorization", MakeBasicAuthorization(key_id, application_key));

	const auto outcome = Execute(*api_client_, request);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);

	AccountAuthorization authorization = ParseAccountAuthorization(outcome.GetResult().View());
	if (authorization.authorization_token_.empty() || authorization.api_url_.empty())
	{
		return MakeRemoteError(200, "", "Authorization answer without token or api url");
	}

	spdlog::debug("Authorized account {} on {}", authorization.account_id_, authorization.api_url_);
	authorization_ = authorization;
	return authorization;
}

B2Outcome<Aws::Vector<BucketInfo>> B2HttpGateway::ListBuckets(const Aws::String& account_id,
							       const Aws::String& bucket_name)
{
	const auto outcome = PostJson("b2_list_buckets", MakeListBucketsBody(account_id, bucket_name));
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParseBuckets(outcome.GetResult().View());
}

B2Outcome<UploadUrl> B2HttpGateway::GetUploadUrl(const Aws::String& bucket_id)
{
	JsonValue body;
	body.WithString("bucketId", bucket_id);

	const auto outcome = PostJson("b2_get_upload_url", body);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParseUploadUrl(outcome.GetResult().View());
}

B2Outcome<FileInfo> B2HttpGateway::UploadFile(const PartBuffer& data, const UploadUrl& upload_url,
					      const UploadTarget& target, const Aws::String& content_sha1)
{
	Aws::Http::HeaderValueCollection headers;
	headers["X-Bz-File-Name"] = EncodeFileName(target.file_name_);
	headers["Content-Type"] = target.content_type_.empty() ? kAutoContentType : target.content_type_;
	for (const auto& info : target.file_info_)
	{
		headers["X-Bz-Info-" + info.first] = Aws::Utils::StringUtils::URLEncode(info.second.c_str());
	}

	const auto outcome =
	    PostContent(upload_url.upload_url_, upload_url.authorization_token_, data, content_sha1, headers);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParseFileInfo(outcome.GetResult().View());
}

B2Outcome<FileInfo> B2HttpGateway::StartLargeFile(const Aws::String& bucket_id, const Aws::String& file_name,
						  const Aws::String& content_type, const FileInfoMap& file_info)
{
	const auto outcome =
	    PostJson("b2_start_large_file", MakeStartLargeFileBody(bucket_id, file_name, content_type, file_info));
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParseFileInfo(outcome.GetResult().View());
}

B2Outcome<UploadPartUrl> B2HttpGateway::GetUploadPartUrl(const Aws::String& file_id)
{
	const auto outcome = PostJson("b2_get_upload_part_url", MakeFileIdBody(file_id));
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParseUploadPartUrl(outcome.GetResult().View());
}

B2Outcome<PartResult> B2HttpGateway::UploadPart(const PartBuffer& data, const UploadPartUrl& upload_url,
						int part_number, const Aws::String& content_sha1)
{
	Aws::Http::HeaderValueCollection headers;
	headers["X-Bz-Part-Number"] = Aws::Utils::StringUtils::to_string(part_number);

	const auto outcome =
	    PostContent(upload_url.upload_url_, upload_url.authorization_token_, data, content_sha1, headers);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParsePartResult(outcome.GetResult().View());
}

B2Outcome<FileInfo> B2HttpGateway::FinishLargeFile(const Aws::String& file_id,
						   const Aws::Vector<Aws::String>& part_sha1s)
{
	const auto outcome = PostJson("b2_finish_large_file", MakeFinishLargeFileBody(file_id, part_sha1s));
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParseFileInfo(outcome.GetResult().View());
}

B2Outcome<bool> B2HttpGateway::CancelLargeFile(const Aws::String& file_id)
{
	const auto outcome = PostJson("b2_cancel_large_file", MakeFileIdBody(file_id));
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return true;
}

B2Outcome<FileInfo> B2HttpGateway::GetFileInfo(const Aws::String& file_id)
{
	const auto outcome = PostJson("b2_get_file_info", MakeFileIdBody(file_id));
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return ParseFileInfo(outcome.GetResult().View());
}

B2Outcome<bool> B2HttpGateway::DeleteFileVersion(const Aws::String& file_id, const Aws::String& file_name)
{
	const auto outcome = PostJson("b2_delete_file_version", MakeDeleteFileVersionBody(file_id, file_name));
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	return true;
}
} // namespace b2client
