#pragma once

#include "b2gateway.h"
#include "clientconfig.h"

namespace b2client
{
// Account and bucket state shared by the uploads of one client
class UploadSession
{
public:
	UploadSession(B2Gateway& gateway, ClientConfig config);

	// Authorizes with the configured key. A key restricted to a bucket selects
	// it, otherwise the configured bucket name is resolved when there is one.
	B2Outcome<bool> Authenticate();

	B2Outcome<bool> SetBucket(const Aws::String& bucket_name);

	B2Outcome<bool> SetPartSize(tOffset part_size);

	bool IsAuthenticated() const
	{
		return authenticated_;
	}

	// restricted keys only see one bucket and possibly one name prefix
	bool IsLimitedAccount() const
	{
		return !authorization_.allowed_bucket_id_.empty();
	}

	const AccountAuthorization& GetAuthorization() const
	{
		return authorization_;
	}

	const Aws::String& GetBucketId() const
	{
		return bucket_id_;
	}

	const Aws::String& GetBucketName() const
	{
		return bucket_name_;
	}

	tOffset GetPartSize() const
	{
		return part_size_;
	}

	const ClientConfig& GetConfig() const
	{
		return config_;
	}

	// Prepends the key's name prefix when the name does not start with it
	Aws::String PrefixFileName(const Aws::String& file_name) const;

	// Keys reporting no capabilities are not checked. A key whose capabilities
	// are all unknown here has none of the ones asked for.
	bool HasCapabilities(const KeyCapabilities& capabilities) const;

	// needs readFiles
	B2Outcome<FileInfo> GetFileInfo(const Aws::String& file_id) const;

	// Deletes one version of a file, needs deleteFiles
	B2Outcome<bool> DeleteFile(const Aws::String& file_id, const Aws::String& file_name) const;

	B2Gateway& GetGateway() const
	{
		return gateway_;
	}

private:
	B2Gateway& gateway_;
	ClientConfig config_;
	AccountAuthorization authorization_;
	bool authenticated_{false};
	Aws::String bucket_id_;
	Aws::String bucket_name_;
	tOffset part_size_;
};
} // namespace b2client
