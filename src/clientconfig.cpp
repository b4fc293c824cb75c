#include "clientconfig.h"
#include "partplanner.h"

#include "spdlog/spdlog.h"

#include "ini.h"

#include <aws/core/utils/memory/stl/AWSStreamFwd.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>

namespace b2client
{
namespace
{
bool FileExists(const Aws::String& name)
{
	Aws::IFStream ifile(name.c_str());
	return ifile.is_open();
}

B2Outcome<long long> ParseNumber(const Aws::String& name, const Aws::String& value)
{
	errno = 0;
	char* end = nullptr;
	const long long res = std::strtoll(value.c_str(), &end, 10);
	if (value.empty() || errno == ERANGE || *end != '\0')
	{
		return MakeConfigError("Invalid number for " + name + ": \"" + value + "\"");
	}
	return res;
}

B2Outcome<bool> ParseBool(const Aws::String& name, const Aws::String& value)
{
	if (value == "1" || value == "true" || value == "yes" || value == "on")
	{
		return true;
	}
	if (value == "0" || value == "false" || value == "no" || value == "off")
	{
		return false;
	}
	return MakeConfigError("Invalid boolean for " + name + ": \"" + value + "\"");
}

// Leaves target untouched for an empty value
B2Outcome<bool> SetNumber(const Aws::String& name, const Aws::String& value, long long& target)
{
	if (value.empty())
	{
		return true;
	}
	const auto outcome = ParseNumber(name, value);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	target = outcome.GetResult();
	return true;
}

B2Outcome<bool> SetNumber(const Aws::String& name, const Aws::String& value, long& target)
{
	long long wide = target;
	const auto outcome = SetNumber(name, value, wide);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	target = static_cast<long>(wide);
	return true;
}

void SetString(const Aws::String& value, Aws::String& target)
{
	if (!value.empty())
	{
		target = value;
	}
}

B2Outcome<bool> ReadConfigFile(const Aws::String& config_file, ClientConfig& config)
{
	spdlog::debug("Conf file = {}", config_file);

	const Aws::String profile = GetEnvironmentVariableOrDefault("B2_PROFILE", "default");
	const Aws::String profile_section = (profile != "default") ? "profile " + profile : profile;

	spdlog::debug("Profile = {}", profile);

	mINI::INIFile file(config_file);
	mINI::INIStructure ini;
	if (!file.read(ini))
	{
		return MakeConfigError("Cannot read configuration file " + config_file);
	}
	if (!ini.has(profile_section))
	{
		spdlog::debug("No section [{}] in {}", profile_section, config_file);
		return true;
	}

	auto section = ini.get(profile_section);
	SetString(section.get("application_key_id"), config.key_id_);
	SetString(section.get("application_key"), config.application_key_);
	SetString(section.get("bucket"), config.bucket_name_);
	SetString(section.get("api_url"), config.api_base_url_);
	SetString(section.get("user_agent"), config.user_agent_);
	SetString(section.get("log_level"), config.log_level_);

	auto outcome = SetNumber("part_size", section.get("part_size"), config.part_size_);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	outcome = SetNumber("api_timeout_ms", section.get("api_timeout_ms"), config.api_timeout_ms_);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	outcome = SetNumber("connect_timeout_ms", section.get("connect_timeout_ms"), config.connect_timeout_ms_);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);
	outcome = SetNumber("upload_timeout_ms", section.get("upload_timeout_ms"), config.upload_timeout_ms_);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);

	const Aws::String verify_ssl = section.get("verify_ssl");
	if (!verify_ssl.empty())
	{
		const auto bool_outcome = ParseBool("verify_ssl", verify_ssl);
		B2C_PASS_OUTCOME_ON_ERROR(bool_outcome);
		config.verify_ssl_ = bool_outcome.GetResult();
	}

	spdlog::debug("Api url = {}", config.api_base_url_);
	return true;
}

// Environment variables have precedence over the configuration file
B2Outcome<ClientConfig> ApplyEnvironment(ClientConfig config)
{
	config.key_id_ = GetEnvironmentVariableOrDefault("B2_APPLICATION_KEY_ID", config.key_id_);
	config.application_key_ = GetEnvironmentVariableOrDefault("B2_APPLICATION_KEY", config.application_key_);
	config.bucket_name_ = GetEnvironmentVariableOrDefault("B2_BUCKET_NAME", config.bucket_name_);
	config.api_base_url_ = GetEnvironmentVariableOrDefault("B2_API_URL", config.api_base_url_);
	config.log_level_ = GetEnvironmentVariableOrDefault("B2_LOGLEVEL", config.log_level_);

	const auto part_size_outcome =
	    SetNumber("B2_PART_SIZE", GetEnvironmentVariableOrDefault("B2_PART_SIZE", ""), config.part_size_);
	B2C_PASS_OUTCOME_ON_ERROR(part_size_outcome);

	if (config.key_id_.empty() != config.application_key_.empty())
	{
		return MakeConfigError("Application key id and application key are only permitted "
				       "when both values are provided.");
	}

	const auto valid_outcome = ValidatePartSize(config.part_size_);
	B2C_PASS_OUTCOME_ON_ERROR(valid_outcome);

	return config;
}
} // namespace

Aws::String GetEnvironmentVariableOrDefault(const Aws::String& variable_name, const Aws::String& default_value)
{
	const char* value = getenv(variable_name.c_str());
	return value ? value : default_value;
}

B2Outcome<ClientConfig> LoadClientConfig()
{
	ClientConfig config;

	const Aws::String user_home = GetEnvironmentVariableOrDefault("HOME", "");
	const Aws::String default_config = user_home.empty() ? "" : user_home + "/.b2/config";
	const Aws::String config_file = GetEnvironmentVariableOrDefault("B2_CONFIG_FILE", default_config);

	if (!config_file.empty())
	{
		if (FileExists(config_file))
		{
			const auto outcome = ReadConfigFile(config_file, config);
			B2C_PASS_OUTCOME_ON_ERROR(outcome);
		}
		else if (config_file != default_config)
		{
			return MakeConfigError("Configuration file not found: " + config_file);
		}
	}

	return ApplyEnvironment(std::move(config));
}

B2Outcome<ClientConfig> LoadClientConfig(const Aws::String& config_file)
{
	if (!FileExists(config_file))
	{
		return MakeConfigError("Configuration file not found: " + config_file);
	}

	ClientConfig config;
	const auto outcome = ReadConfigFile(config_file, config);
	B2C_PASS_OUTCOME_ON_ERROR(outcome);

	return ApplyEnvironment(std::move(config));
}

void ApplyLogLevel(const Aws::String& log_level)
{
	if (log_level == "debug")
		spdlog::set_level(spdlog::level::debug);
	else if (log_level == "trace")
		spdlog::set_level(spdlog::level::trace);
	else
		spdlog::set_level(spdlog::level::info);

	spdlog::debug("Log level {}", log_level);
}
} // namespace b2client
