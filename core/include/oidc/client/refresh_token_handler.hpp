#ifndef OIDC_CLIENT_REFRESH_TOKEN_HANDLER_HPP
#define OIDC_CLIENT_REFRESH_TOKEN_HANDLER_HPP

#include "oidc/client/token_client.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace oidc::client
{
	/// Renews the tokens of a completed login without running the login flow again.
	///
	/// Holds the token endpoint, the client credentials and the current refresh/access token pair.
	/// A successful refresh replaces the access token, and the refresh token when the provider
	/// rotates it. Instances are safe to share between threads.
	class refresh_token_handler
	{
	  public:
		refresh_token_handler(
			std::shared_ptr<token_client> _token_client,
			token_endpoint_binding _binding,
			std::string _refresh_token,
			std::string _access_token);

		refresh_token_handler(const refresh_token_handler&) = delete;
		auto operator=(const refresh_token_handler&) -> refresh_token_handler& = delete;

		/// Sends the current refresh token to the token endpoint.
		///
		/// \returns The token endpoint response. The stored tokens only change if it is not an error.
		auto refresh() -> token_response;

		auto access_token() const -> std::string;
		auto refresh_token() const -> std::string;
		auto binding() const noexcept -> const token_endpoint_binding&;

	  private:
		std::shared_ptr<token_client> token_client_;
		const token_endpoint_binding binding_;

		mutable std::mutex mutex_;
		std::string refresh_token_;
		std::string access_token_;
	}; // class refresh_token_handler
} // namespace oidc::client

#endif // OIDC_CLIENT_REFRESH_TOKEN_HANDLER_HPP
