#include "oidc/client/user_info_client.hpp"

#include "oidc/client/common.hpp"
#include "oidc/client/log.hpp"
#include "oidc/client/transport.hpp"
#include "oidc/client/version.hpp"

#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <utility>

// clang-format off
namespace beast = boost::beast; // from <boost/beast.hpp>
// clang-format on

namespace oidc::client
{
	auto parse_user_info_response(const std::string& _body, int _http_status) -> user_info_response
	{
		user_info_response response{.claims = {}, .is_error = false, .error = {}, .http_status = _http_status};

		if (_http_status < 200 || _http_status >= 300) {
			log::warn("{}: UserInfo endpoint responded with status [{}].", __func__, _http_status);
			response.is_error = true;
			response.error = fmt::format("HTTP {}", _http_status);
			return response;
		}

		const auto json_res{nlohmann::json::parse(_body, nullptr, false)};

		if (json_res.is_discarded() || !json_res.is_object()) {
			log::error("{}: UserInfo endpoint returned a body that is not a JSON object.", __func__);
			response.is_error = true;
			response.error = "invalid user info response";
			return response;
		}

		response.claims = to_claims(json_res);

		return response;
	} // parse_user_info_response

	http_user_info_client::http_user_info_client(transport_options _options)
		: options_{std::move(_options)}
	{
	}

	auto http_user_info_client::get(const std::string& _userinfo_endpoint, const std::string& _access_token)
		-> user_info_response
	{
		if (_userinfo_endpoint.empty()) {
			log::error("{}: Provider does not advertise a [userinfo_endpoint].", __func__);
			return {.claims = {}, .is_error = true, .error = "missing userinfo endpoint", .http_status = 0};
		}

		try {
			const auto parsed_uri{boost::urls::parse_uri(_userinfo_endpoint)};

			if (parsed_uri.has_error()) {
				log::error(
					"{}: Error trying to parse userinfo_endpoint [{}]. Please check configuration.",
					__func__,
					_userinfo_endpoint);
				return {.claims = {}, .is_error = true, .error = "bad endpoint", .http_status = 0};
			}

			const auto url{*parsed_uri};
			const auto port{get_port_from_url(url)};

			constexpr auto http_version_number{11};
			beast::http::request<beast::http::string_body> req{
				beast::http::verb::get, get_request_target(url), http_version_number};
			req.set(beast::http::field::host, create_host_field(url, port.value_or("")));
			req.set(beast::http::field::user_agent, version::user_agent);
			req.set(beast::http::field::accept, "application/json");
			req.set(beast::http::field::authorization, fmt::format("Bearer {}", _access_token));
			req.prepare_payload();

			auto res{send_request(url, req, options_)};

			return parse_user_info_response(res.body(), static_cast<int>(res.result_int()));
		}
		catch (const std::exception& e) {
			log::error("{}: Unexpected exception [{}]", __func__, e.what());
			return {.claims = {}, .is_error = true, .error = e.what(), .http_status = 0};
		}
	} // get
} // namespace oidc::client
