#ifndef OIDC_CLIENT_AUTHORIZE_HPP
#define OIDC_CLIENT_AUTHORIZE_HPP

#include "oidc/client/common.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace oidc::client
{
	/// Everything remembered about one authorize request until its response is validated.
	///
	/// Produced by whatever built the authorize request. Valid for exactly one response.
	struct authorize_state
	{
		std::string state;
		std::string code_verifier;
		std::string redirect_uri;
		std::string nonce;
	}; // struct authorize_state

	/// The parameters of an authorization response (OpenID Connect Core 1.0 Sections 3.1.2.5 and 3.3.2.5).
	struct authorize_response
	{
		std::optional<std::string> error;
		std::optional<std::string> error_description;
		std::optional<std::string> code;
		std::optional<std::string> state;
		std::optional<std::string> id_token;
		std::optional<std::string> access_token;
		std::optional<std::string> token_type;
		std::optional<std::string> scope;
		std::optional<std::string> expires_in;

		query_arguments_type values;

		auto is_error() const noexcept -> bool
		{
			return error && !error->empty();
		}
	}; // struct authorize_response

	/// Parses the data delivered to the redirect URI.
	///
	/// \p _raw_data may be the full redirect URL, a bare query string or a bare fragment. When the data
	/// contains a fragment ('#'), the fragment is used. Otherwise the query ('?') is used. Otherwise
	/// the whole string is treated as form encoded parameters.
	auto parse_authorize_response(std::string_view _raw_data) -> authorize_response;

	auto to_json(const authorize_state& _state) -> nlohmann::json;

	/// \throws nlohmann::json::exception if [state], [code_verifier] or [redirect_uri] are missing.
	auto authorize_state_from_json(const nlohmann::json& _json) -> authorize_state;
} // namespace oidc::client

#endif // OIDC_CLIENT_AUTHORIZE_HPP
