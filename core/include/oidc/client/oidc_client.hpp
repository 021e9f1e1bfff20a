#ifndef OIDC_CLIENT_OIDC_CLIENT_HPP
#define OIDC_CLIENT_OIDC_CLIENT_HPP

#include "oidc/client/authorize.hpp"
#include "oidc/client/claims.hpp"
#include "oidc/client/discovery.hpp"
#include "oidc/client/flow.hpp"
#include "oidc/client/identity_token_validator.hpp"
#include "oidc/client/login_result.hpp"
#include "oidc/client/token_client.hpp"
#include "oidc/client/user_info_client.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace oidc::client
{
	/// Claim types removed from the final identity unless configured otherwise.
	auto default_filtered_claims() -> claim_type_set;

	struct client_options
	{
		std::string client_id;
		std::optional<std::string> client_secret;
		authentication_style style{authentication_style::authorization_code};

		// Whether the UserInfo endpoint is queried and its claims merged into the identity.
		bool load_profile{true};

		bool filter_claims{true};
		claim_type_set filtered_claims{default_filtered_claims()};

		// Optional. Receives the claim sets of each login. See claims_sink.
		claims_sink on_claims;
	}; // struct client_options

	/// Validates authorization responses and turns them into login results.
	///
	/// Holds only immutable options and the collaborators. validate_response() may be called
	/// concurrently if the collaborators allow it.
	class oidc_client
	{
	  public:
		/// \throws std::invalid_argument if the client id is empty or a collaborator is missing.
		oidc_client(
			client_options _options,
			std::shared_ptr<discovery_provider> _discovery,
			std::shared_ptr<token_client> _token_client,
			std::shared_ptr<user_info_client> _user_info_client,
			std::shared_ptr<identity_token_validator> _validator);

		/// Validates the data delivered to the redirect URI against the state of the login attempt.
		///
		/// \param[in] _raw_data The redirect URL, its query string or its fragment.
		/// \param[in] _state    The state remembered when the authorize request was built.
		///
		/// \returns A successful login_result, or a failed one carrying the first check that failed.
		auto validate_response(std::string_view _raw_data, const authorize_state& _state) const -> login_result;

		/// Queries the UserInfo endpoint of the provider with \p _access_token.
		auto get_user_info(const std::string& _access_token) const -> user_info_response;

		/// Exchanges \p _refresh_token at the token endpoint of the provider.
		auto refresh_token(const std::string& _refresh_token) const -> token_response;

	  private:
		auto binding_for(const provider_metadata& _metadata) const -> token_endpoint_binding;

		// Loads the profile, merges and filters the claims. Replaces the identity of \p _outcome.
		auto process_claims(const provider_metadata& _metadata, flow_outcome _outcome) const -> flow_outcome;

		const client_options options_;
		const flow_strategy flow_;

		std::shared_ptr<discovery_provider> discovery_;
		std::shared_ptr<token_client> token_client_;
		std::shared_ptr<user_info_client> user_info_client_;
		std::shared_ptr<identity_token_validator> validator_;
	}; // class oidc_client
} // namespace oidc::client

#endif // OIDC_CLIENT_OIDC_CLIENT_HPP
