#include "oidc/client/flow.hpp"

#include "oidc/client/hash_binder.hpp"
#include "oidc/client/log.hpp"
#include "oidc/client/nonce_verifier.hpp"

#include <utility>

namespace oidc::client
{
	namespace
	{
		auto fail(std::string _error) -> flow_outcome
		{
			log::error("{}: {}", __func__, _error);
			return {.error = std::move(_error), .user = {}, .tokens = {}};
		} // fail

		auto redeem_code(const flow_context& _context) -> token_response
		{
			log::debug("{}: Redeeming authorization code at [{}].", __func__, _context.binding.token_endpoint);

			return _context.tokens.request_authorization_code(
				_context.binding, _context.response.code.value_or(""), _context.state.redirect_uri, _context.state.code_verifier);
		} // redeem_code

		auto validate_token(const flow_context& _context, const std::string& _identity_token)
			-> identity_token_validation_result
		{
			auto result{validate_identity_token(
				_context.validator, _identity_token, _context.binding.client_id, _context.metadata)};

			if (!result.success && result.error.empty()) {
				result.error = "identity token validation error";
			}

			return result;
		} // validate_token

		auto claim_value(const identity& _user, std::string_view _type) -> std::string
		{
			return find_first(_user.claims, _type).value_or("");
		} // claim_value
	} // anonymous namespace

	auto to_authentication_style(std::string_view _name) -> std::optional<authentication_style>
	{
		// clang-format off
		if (_name == "authorization_code") { return authentication_style::authorization_code; }
		if (_name == "hybrid")             { return authentication_style::hybrid; }
		// clang-format on

		return std::nullopt;
	} // to_authentication_style

	auto to_string(authentication_style _style) -> std::string_view
	{
		switch (_style) {
			case authentication_style::authorization_code:
				return "authorization_code";
			case authentication_style::hybrid:
				return "hybrid";
		}

		return "unknown";
	} // to_string

	auto authorization_code_flow::run(const flow_context& _context) const -> flow_outcome
	{
		log::debug("{}: Validating authorization code flow response.", __func__);

		auto tokens{redeem_code(_context)};
		if (tokens.is_error) {
			return fail(tokens.error.empty() ? std::string{"token endpoint error"} : tokens.error);
		}

		if (tokens.id_token.empty()) {
			return fail("missing identity token");
		}

		auto validation{validate_token(_context, tokens.id_token)};
		if (!validation.success) {
			return fail(std::move(validation.error));
		}

		if (!verify_hash_binding(tokens.access_token, claim_value(validation.user, claim_types::access_token_hash))) {
			return fail("invalid access token hash");
		}

		return {.error = {}, .user = std::move(validation.user), .tokens = std::move(tokens)};
	} // authorization_code_flow::run

	auto hybrid_flow::run(const flow_context& _context) const -> flow_outcome
	{
		log::debug("{}: Validating hybrid flow response.", __func__);

		const auto& front_channel_token{_context.response.id_token};
		if (!front_channel_token || front_channel_token->empty()) {
			return fail("missing identity token");
		}

		auto validation{validate_token(_context, *front_channel_token)};
		if (!validation.success) {
			return fail(std::move(validation.error));
		}

		if (!verify_nonce(_context.state.nonce, claim_value(validation.user, claim_types::nonce))) {
			return fail("invalid nonce");
		}

		// The code must be bound to the identity token before it is redeemed.
		if (!verify_hash_binding(
				_context.response.code.value_or(""),
				claim_value(validation.user, claim_types::authorization_code_hash))) {
			return fail("invalid c_hash");
		}

		auto tokens{redeem_code(_context)};
		if (tokens.is_error) {
			return fail(tokens.error.empty() ? std::string{"token endpoint error"} : tokens.error);
		}

		return {.error = {}, .user = std::move(validation.user), .tokens = std::move(tokens)};
	} // hybrid_flow::run

	auto make_flow_strategy(authentication_style _style) -> flow_strategy
	{
		if (_style == authentication_style::hybrid) {
			return hybrid_flow{};
		}

		return authorization_code_flow{};
	} // make_flow_strategy
} // namespace oidc::client
