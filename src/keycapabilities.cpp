#include "keycapabilities.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <utility>

namespace b2client
{
namespace
{
using CapabilityName = std::pair<KeyCapability, const char*>;

const CapabilityName kCapabilityNames[] = {
    {KeyCapability::DELETE_BUCKETS, "deleteBuckets"}, {KeyCapability::DELETE_FILES, "deleteFiles"},
    {KeyCapability::DELETE_KEYS, "deleteKeys"},       {KeyCapability::LIST_BUCKETS, "listBuckets"},
    {KeyCapability::LIST_FILES, "listFiles"},         {KeyCapability::LIST_KEYS, "listKeys"},
    {KeyCapability::READ_BUCKETS, "readBuckets"},     {KeyCapability::READ_FILES, "readFiles"},
    {KeyCapability::SHARE_FILES, "shareFiles"},       {KeyCapability::WRITE_BUCKETS, "writeBuckets"},
    {KeyCapability::WRITE_FILES, "writeFiles"},       {KeyCapability::WRITE_KEYS, "writeKeys"},
};
} // namespace

const char* GetKeyCapabilityName(KeyCapability capability)
{
	for (const auto& entry : kCapabilityNames)
	{
		if (entry.first == capability)
		{
			return entry.second;
		}
	}
	return "";
}

B2Outcome<KeyCapability> ParseKeyCapability(const Aws::String& name)
{
	for (const auto& entry : kCapabilityNames)
	{
		if (name == entry.second)
		{
			return entry.first;
		}
	}
	return MakeConfigError("Unknown key capability: " + name);
}

KeyCapabilities ParseKeyCapabilities(const Aws::Vector<Aws::String>& names)
{
	KeyCapabilities res;
	for (const auto& name : names)
	{
		auto outcome = ParseKeyCapability(name);
		if (!outcome.IsSuccess())
		{
			spdlog::debug("Skipping capability {}", name);
			continue;
		}
		res.insert(outcome.GetResult());
	}
	return res;
}

Aws::Vector<Aws::String> GetKeyCapabilityNames(const KeyCapabilities& capabilities)
{
	Aws::Vector<Aws::String> res;
	res.reserve(capabilities.size());
	for (const auto capability : capabilities)
	{
		res.emplace_back(GetKeyCapabilityName(capability));
	}
	return res;
}

bool IncludesAll(const KeyCapabilities& granted, const KeyCapabilities& required)
{
	return std::includes(granted.begin(), granted.end(), required.begin(), required.end());
}

namespace capability_groups
{
const KeyCapabilities& Keys()
{
	static const KeyCapabilities group{KeyCapability::WRITE_KEYS, KeyCapability::LIST_KEYS,
					   KeyCapability::DELETE_KEYS};
	return group;
}

const KeyCapabilities& Buckets()
{
	static const KeyCapabilities group{KeyCapability::WRITE_BUCKETS, KeyCapability::READ_BUCKETS,
					   KeyCapability::LIST_BUCKETS, KeyCapability::DELETE_BUCKETS};
	return group;
}

const KeyCapabilities& Files()
{
	static const KeyCapabilities group{KeyCapability::WRITE_FILES, KeyCapability::DELETE_FILES,
					   KeyCapability::LIST_FILES, KeyCapability::READ_FILES,
					   KeyCapability::SHARE_FILES};
	return group;
}

const KeyCapabilities& Read()
{
	static const KeyCapabilities group{KeyCapability::READ_BUCKETS, KeyCapability::READ_FILES,
					   KeyCapability::LIST_BUCKETS, KeyCapability::LIST_FILES,
					   KeyCapability::LIST_KEYS};
	return group;
}

const KeyCapabilities& Write()
{
	static const KeyCapabilities group{KeyCapability::WRITE_BUCKETS, KeyCapability::WRITE_FILES,
					   KeyCapability::WRITE_KEYS};
	return group;
}

const KeyCapabilities& Delete()
{
	static const KeyCapabilities group{KeyCapability::DELETE_BUCKETS, KeyCapability::DELETE_FILES,
					   KeyCapability::DELETE_KEYS};
	return group;
}
} // namespace capability_groups
} // namespace b2client
