#include "uploadsession.h"
#include "partplanner.h"

#include "spdlog/spdlog.h"

namespace b2client
{
UploadSession::UploadSession(B2Gateway& gateway, ClientConfig config)
    : gateway_{gateway}, config_{std::move(config)}, part_size_{config_.part_size_}
{
}

B2Outcome<bool> UploadSession::Authenticate()
{
	if (config_.key_id_.empty() || config_.application_key_.empty())
	{
		return MakeConfigError("No application key configured");
	}

	authenticated_ = false;
	const auto outcome = gateway_.AuthorizeAccount(config_.key_id_, config_.application_key_);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);

	authorization_ = outcome.GetResult();
	authenticated_ = true;
	spdlog::debug("Authenticated account {}", authorization_.account_id_);

	if (IsLimitedAccount())
	{
		if (!config_.bucket_name_.empty() && !authorization_.allowed_bucket_name_.empty() &&
		    config_.bucket_name_ != authorization_.allowed_bucket_name_)
		{
			return MakeConfigError("Application key is restricted to bucket " +
					       authorization_.allowed_bucket_name_);
		}
		bucket_id_ = authorization_.allowed_bucket_id_;
		bucket_name_ = authorization_.allowed_bucket_name_;
		spdlog::debug("Key restricted to bucket {}, prefix \"{}\"", bucket_name_, authorization_.name_prefix_);
		return true;
	}

	if (!config_.bucket_name_.empty())
	{
		return SetBucket(config_.bucket_name_);
	}
	return true;
}

B2Outcome<bool> UploadSession::SetBucket(const Aws::String& bucket_name)
{
	if (!authenticated_)
	{
		return MakeConfigError("Not authenticated");
	}
	if (bucket_name.empty())
	{
		return MakeConfigError("Empty bucket name");
	}
	if (IsLimitedAccount())
	{
		if (bucket_name != authorization_.allowed_bucket_name_)
		{
			return MakeConfigError("Application key is restricted to bucket " +
					       authorization_.allowed_bucket_name_);
		}
		return true;
	}

	const auto outcome = gateway_.ListBuckets(authorization_.account_id_, bucket_name);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);

	for (const auto& bucket : outcome.GetResult())
	{
		if (bucket.bucket_name_ == bucket_name)
		{
			bucket_id_ = bucket.bucket_id_;
			bucket_name_ = bucket.bucket_name_;
			spdlog::debug("Bucket {} has id {}", bucket_name_, bucket_id_);
			return true;
		}
	}
	return MakeConfigError("Bucket not found: " + bucket_name);
}

B2Outcome<bool> UploadSession::SetPartSize(tOffset part_size)
{
	const auto outcome = ValidatePartSize(part_size);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	part_size_ = part_size;
	return true;
}

Aws::String UploadSession::PrefixFileName(const Aws::String& file_name) const
{
	const Aws::String& prefix = authorization_.name_prefix_;
	if (prefix.empty() || file_name.compare(0, prefix.size(), prefix) == 0)
	{
		return file_name;
	}
	return prefix + file_name;
}

bool UploadSession::HasCapabilities(const KeyCapabilities& capabilities) const
{
	if (!authorization_.capabilities_reported_)
	{
		return true;
	}
	return IncludesAll(authorization_.capabilities_, capabilities);
}

B2Outcome<FileInfo> UploadSession::GetFileInfo(const Aws::String& file_id) const
{
	if (!authenticated_)
	{
		return MakeConfigError("Not authenticated");
	}
	if (file_id.empty())
	{
		return MakeConfigError("Empty file id");
	}
	if (!HasCapabilities({KeyCapability::READ_FILES}))
	{
		return MakeConfigError("Application key is not allowed to read files");
	}
	return gateway_.GetFileInfo(file_id);
}

B2Outcome<bool> UploadSession::DeleteFile(const Aws::String& file_id, const Aws::String& file_name) const
{
	if (!authenticated_)
	{
		return MakeConfigError("Not authenticated");
	}
	if (file_id.empty() || file_name.empty())
	{
		return MakeConfigError("Deleting a file needs its id and its name");
	}
	if (!HasCapabilities({KeyCapability::DELETE_FILES}))
	{
		return MakeConfigError("Application key is not allowed to delete files");
	}

	spdlog::debug("Deleting {} version {}", file_name, file_id);
	return gateway_.DeleteFileVersion(file_id, file_name);
}
} // namespace b2client
