#include "oidc/client/identity_token_validator.hpp"

#include "oidc/client/log.hpp"

namespace oidc::client
{
	auto validate_identity_token(
		identity_token_validator& _validator,
		const std::string& _identity_token,
		const std::string& _client_id,
		const provider_metadata& _metadata) -> identity_token_validation_result
	{
		log::debug("{}: Calling identity token validator.", __func__);

		auto validation_result{_validator.validate(_identity_token, _client_id, _metadata)};

		if (!validation_result.success) {
			return validation_result;
		}

		const auto& claims{validation_result.user.claims};

		// We should be the intended audience of the identity token.
		const auto audience{find_first(claims, claim_types::audience).value_or("")};
		if (_client_id != audience) {
			log::error("{}: Client id [{}] does not match audience [{}].", __func__, _client_id, audience);
			return {.success = false, .user = {}, .error = "invalid audience"};
		}

		// The 'iss' provided should match the 'issuer' retrieved from the OpenID Provider's
		// well-known endpoint.
		const auto issuer{find_first(claims, claim_types::issuer).value_or("")};
		if (_metadata.issuer != issuer) {
			log::error(
				"{}: Configured issuer [{}] does not match token issuer [{}].", __func__, _metadata.issuer, issuer);
			return {.success = false, .user = {}, .error = "invalid issuer"};
		}

		return validation_result;
	} // validate_identity_token
} // namespace oidc::client
