#ifndef OIDC_CLIENT_IDENTITY_TOKEN_VALIDATOR_HPP
#define OIDC_CLIENT_IDENTITY_TOKEN_VALIDATOR_HPP

#include "oidc/client/claims.hpp"
#include "oidc/client/discovery.hpp"

#include <string>

namespace oidc::client
{
	struct identity_token_validation_result
	{
		bool success{};
		identity user;
		std::string error;
	}; // struct identity_token_validation_result

	/// Checks the structure and signature of an identity token.
	///
	/// Audience and issuer binding are not the responsibility of implementations. See
	/// validate_identity_token().
	class identity_token_validator
	{
	  public:
		virtual ~identity_token_validator() = default;

		virtual auto validate(
			const std::string& _identity_token,
			const std::string& _client_id,
			const provider_metadata& _metadata) -> identity_token_validation_result = 0;
	}; // class identity_token_validator

	/// Validates \p _identity_token with \p _validator, then requires its first [aud] claim to equal
	/// \p _client_id and its first [iss] claim to equal the issuer of \p _metadata.
	///
	/// Both comparisons are exact. A missing claim compares as an empty string.
	///
	/// \returns The result of \p _validator on failure, a failure with error "invalid audience" or
	///          "invalid issuer" on a binding mismatch, otherwise the successful result of \p _validator.
	auto validate_identity_token(
		identity_token_validator& _validator,
		const std::string& _identity_token,
		const std::string& _client_id,
		const provider_metadata& _metadata) -> identity_token_validation_result;
} // namespace oidc::client

#endif // OIDC_CLIENT_IDENTITY_TOKEN_VALIDATOR_HPP
