#include "oidc/client/refresh_token_handler.hpp"

#include "oidc/client/log.hpp"

#include <utility>

namespace oidc::client
{
	refresh_token_handler::refresh_token_handler(
		std::shared_ptr<token_client> _token_client,
		token_endpoint_binding _binding,
		std::string _refresh_token,
		std::string _access_token)
		: token_client_{std::move(_token_client)}
		, binding_{std::move(_binding)}
		, refresh_token_{std::move(_refresh_token)}
		, access_token_{std::move(_access_token)}
	{
	}

	auto refresh_token_handler::refresh() -> token_response
	{
		std::scoped_lock lock{mutex_};

		log::debug("{}: Refreshing tokens at [{}].", __func__, binding_.token_endpoint);

		auto response{token_client_->request_refresh_token(binding_, refresh_token_)};

		if (response.is_error) {
			log::error("{}: Token refresh failed [{}].", __func__, response.error);
			return response;
		}

		access_token_ = response.access_token;

		// Providers are free to keep the old refresh token valid and not send a new one.
		if (!response.refresh_token.empty()) {
			refresh_token_ = response.refresh_token;
		}

		return response;
	} // refresh

	auto refresh_token_handler::access_token() const -> std::string
	{
		std::scoped_lock lock{mutex_};
		return access_token_;
	} // access_token

	auto refresh_token_handler::refresh_token() const -> std::string
	{
		std::scoped_lock lock{mutex_};
		return refresh_token_;
	} // refresh_token

	auto refresh_token_handler::binding() const noexcept -> const token_endpoint_binding&
	{
		return binding_;
	} // binding
} // namespace oidc::client
