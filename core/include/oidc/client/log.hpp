#ifndef OIDC_CLIENT_LOG_HPP
#define OIDC_CLIENT_LOG_HPP

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>

namespace oidc::client::log
{
	template <typename... Args>
	constexpr auto trace(fmt::format_string<Args...> _format, Args&&... _args) -> void
	{
		spdlog::trace(_format, std::forward<Args>(_args)...);
	} // trace

	template <typename... Args>
	constexpr auto info(fmt::format_string<Args...> _format, Args&&... _args) -> void
	{
		spdlog::info(_format, std::forward<Args>(_args)...);
	} // info

	template <typename... Args>
	constexpr auto debug(fmt::format_string<Args...> _format, Args&&... _args) -> void
	{
		spdlog::debug(_format, std::forward<Args>(_args)...);
	} // debug

	template <typename... Args>
	constexpr auto warn(fmt::format_string<Args...> _format, Args&&... _args) -> void
	{
		spdlog::warn(_format, std::forward<Args>(_args)...);
	} // warn

	template <typename... Args>
	constexpr auto error(fmt::format_string<Args...> _format, Args&&... _args) -> void
	{
		spdlog::error(_format, std::forward<Args>(_args)...);
	} // error

	template <typename... Args>
	constexpr auto critical(fmt::format_string<Args...> _format, Args&&... _args) -> void
	{
		spdlog::critical(_format, std::forward<Args>(_args)...);
	} // critical

	// Unknown strings map to spdlog::level::info.
	auto to_level(std::string_view _level) -> spdlog::level::level_enum;
} //namespace oidc::client::log

#endif // OIDC_CLIENT_LOG_HPP
