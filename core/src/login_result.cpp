#include "oidc/client/login_result.hpp"

#include <stdexcept>
#include <utility>

namespace oidc::client
{
	auto make_login_failure(std::string _error) -> login_result
	{
		if (_error.empty()) {
			throw std::invalid_argument{"A failed login requires an error message."};
		}

		login_result result;
		result.error_ = std::move(_error);
		return result;
	} // make_login_failure

	auto make_login_success(
		identity _user,
		std::string _access_token,
		std::string _identity_token,
		std::string _refresh_token,
		std::chrono::system_clock::time_point _access_token_expiration,
		std::chrono::system_clock::time_point _authentication_time,
		std::shared_ptr<refresh_token_handler> _handler) -> login_result
	{
		if (_access_token.empty()) {
			throw std::invalid_argument{"A successful login requires an access token."};
		}

		login_result result;
		result.success_ = true;
		result.user_ = std::move(_user);
		result.access_token_ = std::move(_access_token);
		result.identity_token_ = std::move(_identity_token);
		result.refresh_token_ = std::move(_refresh_token);
		result.access_token_expiration_ = _access_token_expiration;
		result.authentication_time_ = _authentication_time;
		result.handler_ = std::move(_handler);
		return result;
	} // make_login_success

	auto to_json(const login_result& _result) -> nlohmann::json
	{
		using std::chrono::duration_cast;
		using std::chrono::seconds;

		if (!_result.success()) {
			return {{"success", false}, {"error", _result.error()}};
		}

		auto claims{nlohmann::json::array()};
		for (const auto& c : _result.user()->claims) {
			claims.push_back({{"type", c.type}, {"value", c.value}});
		}

		// clang-format off
		return {
			{"success", true},
			{"user", {
				{"authentication_type", _result.user()->authentication_type},
				{"name_claim_type", _result.user()->name_claim_type},
				{"role_claim_type", _result.user()->role_claim_type},
				{"claims", claims}
			}},
			{"access_token", _result.access_token()},
			{"identity_token", _result.identity_token()},
			{"refresh_token", _result.refresh_token()},
			{"access_token_expiration", duration_cast<seconds>(_result.access_token_expiration().time_since_epoch()).count()},
			{"authentication_time", duration_cast<seconds>(_result.authentication_time().time_since_epoch()).count()},
			{"refreshable", static_cast<bool>(_result.refresh_handler())}
		};
		// clang-format on
	} // to_json
} // namespace oidc::client
