#ifndef OIDC_CLIENT_TOKEN_CLIENT_HPP
#define OIDC_CLIENT_TOKEN_CLIENT_HPP

#include "oidc/client/common.hpp"
#include "oidc/client/transport.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace oidc::client
{
	/// Where and as whom token requests are made.
	struct token_endpoint_binding
	{
		std::string token_endpoint;
		std::string client_id;
		std::optional<std::string> client_secret;
	}; // struct token_endpoint_binding

	/// A token endpoint response (OpenID Connect Core 1.0 Section 3.1.3.3, RFC 6749 Section 5).
	struct token_response
	{
		std::string id_token;
		std::string access_token;
		std::string refresh_token;
		std::string token_type;
		std::chrono::seconds expires_in{};

		bool is_error{};
		std::string error;
		std::string error_description;
		int http_status{};
	}; // struct token_response

	// Upper bound applied to [expires_in].
	constexpr std::chrono::seconds max_token_lifetime{std::chrono::hours{24 * 366}};

	/// Builds a token_response from the body of a token endpoint response.
	///
	/// An [error] member, a non-2xx \p _http_status or a body that is not a JSON object produce an error
	/// response. [expires_in] is accepted as an integer or a string of digits. Negative values become zero
	/// and values above max_token_lifetime are clamped to it. Anything else is ignored.
	auto parse_token_response(const std::string& _body, int _http_status) -> token_response;

	auto make_token_error(std::string _error) -> token_response;

	/// Client of the token endpoint.
	///
	/// Implementations never throw for protocol or transport failures. They report them through
	/// token_response::is_error.
	class token_client
	{
	  public:
		virtual ~token_client() = default;

		/// Redeems an authorization code (RFC 6749 Section 4.1.3, RFC 7636 Section 4.5).
		virtual auto request_authorization_code(
			const token_endpoint_binding& _binding,
			const std::string& _code,
			const std::string& _redirect_uri,
			const std::string& _code_verifier) -> token_response = 0;

		/// Exchanges a refresh token for new tokens (RFC 6749 Section 6).
		virtual auto request_refresh_token(const token_endpoint_binding& _binding, const std::string& _refresh_token)
			-> token_response = 0;
	}; // class token_client

	/// Builds the token request for an authorization code grant.
	///
	/// Confidential clients (binding with a client secret) authenticate using HTTP Basic and omit
	/// [client_id] from the body. Public clients send [client_id] in the body. [code_verifier] is sent
	/// when not empty.
	///
	/// \throws std::invalid_argument if the token endpoint is not a URI.
	auto make_authorization_code_request(
		const token_endpoint_binding& _binding,
		const std::string& _code,
		const std::string& _redirect_uri,
		const std::string& _code_verifier) -> request_type;

	/// Builds the token request for a refresh token grant. Client authentication as above.
	auto make_refresh_token_request(const token_endpoint_binding& _binding, const std::string& _refresh_token)
		-> request_type;

	class http_token_client : public token_client
	{
	  public:
		explicit http_token_client(transport_options _options);

		auto request_authorization_code(
			const token_endpoint_binding& _binding,
			const std::string& _code,
			const std::string& _redirect_uri,
			const std::string& _code_verifier) -> token_response override;

		auto request_refresh_token(const token_endpoint_binding& _binding, const std::string& _refresh_token)
			-> token_response override;

	  private:
		template <typename MakeRequest>
		auto hit_token_endpoint(const token_endpoint_binding& _binding, MakeRequest&& _make_request) -> token_response;

		transport_options options_;
	}; // class http_token_client
} // namespace oidc::client

#endif // OIDC_CLIENT_TOKEN_CLIENT_HPP
