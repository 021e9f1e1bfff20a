#ifndef OIDC_CLIENT_USER_INFO_CLIENT_HPP
#define OIDC_CLIENT_USER_INFO_CLIENT_HPP

#include "oidc/client/claims.hpp"
#include "oidc/client/transport.hpp"

#include <string>

namespace oidc::client
{
	struct user_info_response
	{
		claim_set claims;

		bool is_error{};
		std::string error;
		int http_status{};
	}; // struct user_info_response

	auto parse_user_info_response(const std::string& _body, int _http_status) -> user_info_response;

	// Implementations report failures through user_info_response::is_error.
	class user_info_client
	{
	  public:
		virtual ~user_info_client() = default;

		virtual auto get(const std::string& _userinfo_endpoint, const std::string& _access_token)
			-> user_info_response = 0;
	}; // class user_info_client

	class http_user_info_client : public user_info_client
	{
	  public:
		explicit http_user_info_client(transport_options _options);

		auto get(const std::string& _userinfo_endpoint, const std::string& _access_token)
			-> user_info_response override;

	  private:
		transport_options options_;
	}; // class http_user_info_client
} // namespace oidc::client

#endif // OIDC_CLIENT_USER_INFO_CLIENT_HPP
