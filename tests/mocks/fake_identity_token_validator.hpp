#ifndef OIDC_CLIENT_TESTS_FAKE_IDENTITY_TOKEN_VALIDATOR_HPP
#define OIDC_CLIENT_TESTS_FAKE_IDENTITY_TOKEN_VALIDATOR_HPP

#include "oidc/client/identity_token_validator.hpp"

#include <gmock/gmock.h>

#include <map>
#include <string>
#include <utility>

namespace oidc::client::test
{
	/// Accepts the tokens it was told about and rejects every other one.
	///
	/// A token is an opaque key here. The claims it "contains" are registered with add_token().
	class fake_identity_token_validator : public identity_token_validator
	{
	  public:
		auto add_token(std::string _token, claim_set _claims) -> void
		{
			tokens_.insert_or_assign(std::move(_token), std::move(_claims));
		}

		auto validate(
			const std::string& _identity_token,
			const std::string& _client_id,
			const provider_metadata& _metadata) -> identity_token_validation_result override
		{
			++calls_;
			last_client_id_ = _client_id;
			last_issuer_ = _metadata.issuer;

			const auto iter{tokens_.find(_identity_token)};
			if (iter == std::end(tokens_)) {
				return {.success = false, .user = {}, .error = "invalid signature"};
			}

			return {
				.success = true,
				.user = {.authentication_type = "oidc",
			             .name_claim_type = "name",
			             .role_claim_type = "role",
			             .claims = iter->second},
				.error = {}};
		}

		auto calls() const noexcept -> int { return calls_; }
		auto last_client_id() const -> const std::string& { return last_client_id_; }
		auto last_issuer() const -> const std::string& { return last_issuer_; }

	  private:
		std::map<std::string, claim_set> tokens_;
		int calls_{};
		std::string last_client_id_;
		std::string last_issuer_;
	}; // class fake_identity_token_validator

	class mock_identity_token_validator : public identity_token_validator
	{
	  public:
		MOCK_METHOD(
			identity_token_validation_result,
			validate,
			(const std::string&, const std::string&, const provider_metadata&),
			(override));
	}; // class mock_identity_token_validator
} // namespace oidc::client::test

#endif // OIDC_CLIENT_TESTS_FAKE_IDENTITY_TOKEN_VALIDATOR_HPP
