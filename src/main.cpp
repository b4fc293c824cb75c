#include <stdio.h>
#include <stdlib.h>

#include "b2httpgateway.h"
#include "clientconfig.h"
#include "uploaddispatcher.h"
#include "uploadsession.h"

#include <aws/core/Aws.h>

using namespace b2client;

/* functions prototype */
void usage();
int do_upload(const char* local_file_name, const char* remote_file_name);
void print_event(const UploadProgressEvent& event);

int main(int argc, char* argv[])
{
	if (argc != 2 && argc != 3)
		usage();

	Aws::SDKOptions options;
	Aws::InitAPI(options);

	// every SDK object is released in do_upload, before the shutdown
	const int result = do_upload(argv[1], argc == 3 ? argv[2] : "");

	Aws::ShutdownAPI(options);

	if (result != EXIT_SUCCESS)
	{
		fprintf(stderr, "Upload has failed\n");
		exit(EXIT_FAILURE);
	}
	exit(EXIT_SUCCESS);
}

void usage()
{
	fprintf(stderr, "Usage : b2upload local_file_name [remote_file_name]\n");
	fprintf(stderr, "example : b2upload /tmp/data.bin backups/\n");
	fprintf(stderr, "The key and bucket come from $HOME/.b2/config or B2_APPLICATION_KEY_ID, B2_APPLICATION_KEY "
			"and B2_BUCKET_NAME\n");
	exit(EXIT_FAILURE);
}

int do_upload(const char* local_file_name, const char* remote_file_name)
{
	const auto config_outcome = LoadClientConfig();
	B2C_IF_ERROR(config_outcome)
	{
		LogBadOutcome(config_outcome, "Invalid configuration");
		return EXIT_FAILURE;
	}
	const ClientConfig& config = config_outcome.GetResult();
	ApplyLogLevel(config.log_level_);

	B2HttpGateway gateway(config);
	UploadSession session(gateway, config);

	const auto auth_outcome = session.Authenticate();
	B2C_IF_ERROR(auth_outcome)
	{
		LogBadOutcome(auth_outcome, "Authentication failed");
		return EXIT_FAILURE;
	}
	if (session.GetBucketId().empty())
	{
		LogError("No bucket: set B2_BUCKET_NAME or the bucket entry of the configuration file");
		return EXIT_FAILURE;
	}

	const UploadDispatcher dispatcher(session);
	UploadTarget target;
	target.file_name_ = remote_file_name;

	auto producer_outcome = dispatcher.UploadPath(local_file_name, std::move(target));
	B2C_IF_ERROR(producer_outcome)
	{
		LogBadOutcome(producer_outcome, Aws::String("Cannot upload ") + local_file_name);
		return EXIT_FAILURE;
	}
	UploadProducerPtr producer = producer_outcome.GetResultWithOwnership();

	printf("Uploading %s to bucket %s in %d part(s)\n", local_file_name, session.GetBucketName().c_str(),
	       producer->GetTotalParts());

	const auto upload_outcome = RunToCompletion(*producer, print_event);
	B2C_IF_ERROR(upload_outcome)
	{
		LogBadOutcome(upload_outcome, Aws::String("Upload of ") + local_file_name + " failed");
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}

void print_event(const UploadProgressEvent& event)
{
	if (event.type_ == UploadEventType::PART_UPLOADED)
	{
		printf("part %d/%d: %lld bytes, sha1 %s\n", event.part_number_, event.total_parts_,
		       event.part_.content_length_, event.part_.content_sha1_.c_str());
	}
	else if (event.type_ == UploadEventType::COMPLETED)
	{
		printf("done: %s (%s), %lld bytes\n", event.file_.file_name_.c_str(), event.file_.file_id_.c_str(),
		       event.file_.content_length_);
	}
}
