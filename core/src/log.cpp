#include "oidc/client/log.hpp"

namespace oidc::client::log
{
	auto to_level(std::string_view _level) -> spdlog::level::level_enum
	{
		// clang-format off
		if (_level == "trace")    { return spdlog::level::trace; }
		if (_level == "debug")    { return spdlog::level::debug; }
		if (_level == "info")     { return spdlog::level::info; }
		if (_level == "warn")     { return spdlog::level::warn; }
		if (_level == "error")    { return spdlog::level::err; }
		if (_level == "critical") { return spdlog::level::critical; }
		// clang-format on

		warn("{}: Invalid log_level [{}]. Using [info].", __func__, _level);
		return spdlog::level::info;
	} // to_level
} //namespace oidc::client::log
