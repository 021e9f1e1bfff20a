#ifndef OIDC_CLIENT_CONFIGURATION_HPP
#define OIDC_CLIENT_CONFIGURATION_HPP

#include "oidc/client/oidc_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace oidc::client
{
	/// Settings read from the configuration file.
	struct configuration
	{
		std::string log_level;
		std::string provider_url;
		std::string tls_certificates_directory;
		std::chrono::seconds clock_skew{300};
		std::chrono::seconds request_timeout{30};
		std::optional<std::string> nonstandard_id_token_secret;
		client_options client;
	}; // struct configuration

	/// Reads the [openid_connect] object of the configuration file.
	///
	/// \throws std::invalid_argument      If [style] is not "authorization_code" or "hybrid".
	/// \throws nlohmann::json::exception  If [client_id] is missing or a value has the wrong type.
	auto load_client_options(const nlohmann::json& _config) -> client_options;

	/// Reads the whole configuration file.
	///
	/// \throws std::invalid_argument      If [provider_url] is not a URI, [style] is unknown, the clock
	///                                    skew is negative or the request timeout is not positive.
	/// \throws nlohmann::json::exception  If a required member is missing or has the wrong type.
	auto load_configuration(const nlohmann::json& _config) -> configuration;

	/// Builds a client talking to the provider over HTTP(S).
	auto make_http_client(const configuration& _config) -> std::unique_ptr<oidc_client>;

	auto configuration_template() -> std::string_view;
} // namespace oidc::client

#endif // OIDC_CLIENT_CONFIGURATION_HPP
