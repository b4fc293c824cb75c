#pragma once

#include "b2error.h"
#include "b2types.h"

namespace b2client
{
constexpr const char* kDefaultApiUrl = "https://api.backblazeb2.com";
constexpr const char* kApiVersionPath = "/b2api/v2";
constexpr const char* kClientVersion = "0.1.0";

struct ClientConfig
{
	Aws::String api_base_url_{kDefaultApiUrl};
	Aws::String user_agent_{Aws::String("b2client/") + kClientVersion};
	long api_timeout_ms_{8000};
	long connect_timeout_ms_{5000};
	// 0 leaves part and file uploads to the transport defaults
	long upload_timeout_ms_{0};
	bool verify_ssl_{true};
	tOffset part_size_{kDefaultPartSize};
	Aws::String key_id_;
	Aws::String application_key_;
	Aws::String bucket_name_;
	Aws::String log_level_{"info"};
};

Aws::String GetEnvironmentVariableOrDefault(const Aws::String& variable_name, const Aws::String& default_value);

// Reads the INI configuration file then applies the environment overrides.
// The file is $B2_CONFIG_FILE or $HOME/.b2/config, the section is "default" or
// "profile $B2_PROFILE".
B2Outcome<ClientConfig> LoadClientConfig();

// Same with an explicit file, which must exist
B2Outcome<ClientConfig> LoadClientConfig(const Aws::String& config_file);

// "debug", "trace", anything else is info
void ApplyLogLevel(const Aws::String& log_level);
} // namespace b2client
