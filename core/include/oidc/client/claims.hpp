#ifndef OIDC_CLIENT_CLAIMS_HPP
#define OIDC_CLIENT_CLAIMS_HPP

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace oidc::client
{
	// clang-format off
	namespace claim_types
	{
		inline constexpr std::string_view subject                 = "sub";
		inline constexpr std::string_view issuer                  = "iss";
		inline constexpr std::string_view audience                = "aud";
		inline constexpr std::string_view expiration              = "exp";
		inline constexpr std::string_view not_before              = "nbf";
		inline constexpr std::string_view issued_at               = "iat";
		inline constexpr std::string_view authentication_time     = "auth_time";
		inline constexpr std::string_view nonce                   = "nonce";
		inline constexpr std::string_view authorization_code_hash = "c_hash";
		inline constexpr std::string_view access_token_hash       = "at_hash";
		inline constexpr std::string_view authorized_party        = "azp";
		inline constexpr std::string_view name                    = "name";
		inline constexpr std::string_view role                    = "role";
	} // namespace claim_types
	// clang-format on

	struct claim
	{
		std::string type;
		std::string value;

		auto operator==(const claim&) const -> bool = default;
	}; // struct claim

	// Ordered. A claim type may appear more than once (e.g. several "aud" values).
	using claim_set = std::vector<claim>;

	using claim_type_set = std::set<std::string, std::less<>>;

	struct identity
	{
		std::string authentication_type;
		std::string name_claim_type{claim_types::name};
		std::string role_claim_type{claim_types::role};
		claim_set claims;
	}; // struct identity

	/// Receives claim sets as they pass through the validation steps.
	///
	/// Claims may carry personal data, so they are handed to this callback instead of the log.
	/// \p _stage names the step (e.g. "identity_token", "user_info", "filtered").
	using claims_sink = std::function<void(std::string_view _stage, const claim_set& _claims)>;

	auto find_first(const claim_set& _claims, std::string_view _type) -> std::optional<std::string>;

	auto contains_type(const claim_set& _claims, std::string_view _type) -> bool;

	/// Flattens a JSON object into claims.
	///
	/// String members become one claim each. Array members become one claim per element.
	/// Any other value is stored as its JSON text (e.g. numbers, booleans, objects).
	auto to_claims(const nlohmann::json& _object) -> claim_set;

	/// Returns a copy of \p _primary extended with every claim of \p _secondary whose type does not
	/// already occur in \p _primary. Claims of \p _primary are never replaced.
	auto merge_claims(const identity& _primary, const claim_set& _secondary) -> identity;

	auto filter_claims(const identity& _identity, const claim_type_set& _excluded) -> identity;

	/// Produces the identity exposed to the caller of a login.
	///
	/// \param[in] _primary            The identity validated from the identity token.
	/// \param[in] _user_info_claims   Claims returned by the user info endpoint, if they were loaded.
	/// \param[in] _excluded           Claim types removed from the final identity.
	/// \param[in] _filtering_enabled  When false, \p _excluded is ignored.
	///
	/// \returns A new identity. The arguments are left untouched.
	auto finalize_identity(
		const identity& _primary,
		const std::optional<claim_set>& _user_info_claims,
		const claim_type_set& _excluded,
		bool _filtering_enabled) -> identity;
} // namespace oidc::client

#endif // OIDC_CLIENT_CLAIMS_HPP
