#ifndef OIDC_CLIENT_JWKS_IDENTITY_TOKEN_VALIDATOR_HPP
#define OIDC_CLIENT_JWKS_IDENTITY_TOKEN_VALIDATOR_HPP

#include "oidc/client/identity_token_validator.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace oidc::client
{
	struct jwks_validator_options
	{
		// Signs HS256/384/512 identity tokens (OpenID Connect Core 1.0 Section 10.1).
		std::optional<std::string> client_secret;

		// Base64url encoded key used instead of client_secret for providers that do not follow
		// OpenID Connect Core 1.0 Section 3.1.3.7, Bullet Point 8.
		std::optional<std::string> nonstandard_id_token_secret;

		// Tolerance applied to [exp], [nbf] and [iat].
		std::chrono::seconds clock_skew{300};
	}; // struct jwks_validator_options

	/// Validates identity tokens locally using jwt-cpp.
	///
	/// Asymmetric keys come from the JWK Set carried in provider_metadata::jwks. Symmetric algorithms
	/// use the client secret.
	///
	/// See RFC 7515 (JWS), RFC 7517 (JWK), RFC 7518 (JWA) and OpenID Connect Core 1.0 Section 3.1.3.7.
	class jwks_identity_token_validator : public identity_token_validator
	{
	  public:
		explicit jwks_identity_token_validator(jwks_validator_options _options);

		auto validate(
			const std::string& _identity_token,
			const std::string& _client_id,
			const provider_metadata& _metadata) -> identity_token_validation_result override;

	  private:
		jwks_validator_options options_;
	}; // class jwks_identity_token_validator
} // namespace oidc::client

#endif // OIDC_CLIENT_JWKS_IDENTITY_TOKEN_VALIDATOR_HPP
