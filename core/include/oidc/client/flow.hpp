#ifndef OIDC_CLIENT_FLOW_HPP
#define OIDC_CLIENT_FLOW_HPP

#include "oidc/client/authorize.hpp"
#include "oidc/client/claims.hpp"
#include "oidc/client/discovery.hpp"
#include "oidc/client/identity_token_validator.hpp"
#include "oidc/client/token_client.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace oidc::client
{
	enum class authentication_style
	{
		authorization_code,
		hybrid
	}; // enum class authentication_style

	auto to_authentication_style(std::string_view _name) -> std::optional<authentication_style>;

	auto to_string(authentication_style _style) -> std::string_view;

	// Members refer to objects owned by the caller that outlive the pass.
	struct flow_context
	{
		token_client& tokens;
		identity_token_validator& validator;
		const provider_metadata& metadata;
		const token_endpoint_binding& binding;
		const authorize_state& state;
		const authorize_response& response;
	}; // struct flow_context

	struct flow_outcome
	{
		// Non-empty if the flow failed. Nothing else is meaningful then.
		std::string error;
		identity user;
		token_response tokens;
	}; // struct flow_outcome

	// Response type "code".
	struct authorization_code_flow
	{
		auto run(const flow_context& _context) const -> flow_outcome;
	}; // struct authorization_code_flow

	// Response type "code id_token". The code is bound through [c_hash] before it is redeemed.
	struct hybrid_flow
	{
		auto run(const flow_context& _context) const -> flow_outcome;
	}; // struct hybrid_flow

	using flow_strategy = std::variant<authorization_code_flow, hybrid_flow>;

	auto make_flow_strategy(authentication_style _style) -> flow_strategy;
} // namespace oidc::client

#endif // OIDC_CLIENT_FLOW_HPP
