#ifndef OIDC_CLIENT_LOGIN_RESULT_HPP
#define OIDC_CLIENT_LOGIN_RESULT_HPP

#include "oidc/client/claims.hpp"
#include "oidc/client/refresh_token_handler.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace oidc::client
{
	/// Outcome of validating one authorization response.
	///
	/// Either a success carrying an identity and an access token, or a failure carrying a non-empty
	/// error and nothing else. Build instances with make_login_success() or make_login_failure().
	class login_result
	{
	  public:
		auto success() const noexcept -> bool { return success_; }
		auto error() const noexcept -> const std::string& { return error_; }
		auto user() const noexcept -> const std::optional<identity>& { return user_; }
		auto access_token() const noexcept -> const std::string& { return access_token_; }
		auto identity_token() const noexcept -> const std::string& { return identity_token_; }
		auto refresh_token() const noexcept -> const std::string& { return refresh_token_; }

		auto access_token_expiration() const noexcept -> std::chrono::system_clock::time_point
		{
			return access_token_expiration_;
		}

		auto authentication_time() const noexcept -> std::chrono::system_clock::time_point
		{
			return authentication_time_;
		}

		/// Present when the provider issued a refresh token.
		auto refresh_handler() const noexcept -> const std::shared_ptr<refresh_token_handler>& { return handler_; }

		friend auto make_login_failure(std::string _error) -> login_result;

		friend auto make_login_success(
			identity _user,
			std::string _access_token,
			std::string _identity_token,
			std::string _refresh_token,
			std::chrono::system_clock::time_point _access_token_expiration,
			std::chrono::system_clock::time_point _authentication_time,
			std::shared_ptr<refresh_token_handler> _handler) -> login_result;

	  private:
		login_result() = default;

		bool success_{};
		std::string error_;
		std::optional<identity> user_;
		std::string access_token_;
		std::string identity_token_;
		std::string refresh_token_;
		std::chrono::system_clock::time_point access_token_expiration_{};
		std::chrono::system_clock::time_point authentication_time_{};
		std::shared_ptr<refresh_token_handler> handler_;
	}; // class login_result

	/// \throws std::invalid_argument if \p _error is empty.
	auto make_login_failure(std::string _error) -> login_result;

	/// \throws std::invalid_argument if \p _access_token is empty.
	auto make_login_success(
		identity _user,
		std::string _access_token,
		std::string _identity_token,
		std::string _refresh_token,
		std::chrono::system_clock::time_point _access_token_expiration,
		std::chrono::system_clock::time_point _authentication_time,
		std::shared_ptr<refresh_token_handler> _handler) -> login_result;

	/// Serializes \p _result for display. Expiration and authentication time are Unix timestamps.
	auto to_json(const login_result& _result) -> nlohmann::json;
} // namespace oidc::client

#endif // OIDC_CLIENT_LOGIN_RESULT_HPP
