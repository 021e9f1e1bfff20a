#include "oidc/client/token_client.hpp"

#include "oidc/client/log.hpp"
#include "oidc/client/transport.hpp"
#include "oidc/client/version.hpp"

#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdint>
#include <exception>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

// clang-format off
namespace beast = boost::beast; // from <boost/beast.hpp>
// clang-format on

namespace oidc::client
{
	namespace
	{
		auto create_oidc_request(boost::urls::url_view _url, const token_endpoint_binding& _binding)
			-> beast::http::request<beast::http::string_body>
		{
			constexpr auto http_version_number{11};
			beast::http::request<beast::http::string_body> req{
				beast::http::verb::post, get_request_target(_url), http_version_number};

			const auto port{get_port_from_url(_url)};

			req.set(beast::http::field::host, create_host_field(_url, port.value_or("")));
			req.set(beast::http::field::user_agent, version::user_agent);
			req.set(beast::http::field::content_type, "application/x-www-form-urlencoded");
			req.set(beast::http::field::accept, "application/json");

			if (_binding.client_secret) {
				const auto format_bearer_token{[](std::string_view _client_id, std::string_view _client_secret) {
					auto encode_me{fmt::format("{}:{}", encode(_client_id), encode(_client_secret))};
					return safe_base64_encode(encode_me);
				}};

				const auto auth_string{
					fmt::format("Basic {}", format_bearer_token(_binding.client_id, *_binding.client_secret))};

				req.set(beast::http::field::authorization, auth_string);
			}

			return req;
		} // create_oidc_request

		auto remove_client_from_body_if_confidential_client(const token_endpoint_binding& _binding, body_arguments _body)
			-> body_arguments
		{
			if (_binding.client_secret) {
				_body.erase("client_id");
			}

			return _body;
		} // remove_client_from_body_if_confidential_client

		auto is_error_response(const nlohmann::json& _response_to_check) -> bool
		{
			if (const auto error{_response_to_check.find("error")}; error != std::cend(_response_to_check)) {
				std::string token_error_log;
				token_error_log.reserve(500);

				auto error_log_itter{fmt::format_to(
					std::back_inserter(token_error_log), "{}: Token request failed! Error: [{}]", __func__, error->dump())};

				// Optional OAuth 2.0 error parameters follow
				if (const auto error_description{_response_to_check.find("error_description")};
				    error_description != std::cend(_response_to_check))
				{
					error_log_itter = fmt::format_to(error_log_itter, ", Error Description [{}]", error_description->dump());
				}

				if (const auto error_uri{_response_to_check.find("error_uri")}; error_uri != std::cend(_response_to_check))
				{
					error_log_itter = fmt::format_to(error_log_itter, ", Error URI [{}]", error_uri->dump());
				}

				log::warn("{}", token_error_log);
				return true;
			}

			return false;
		} // is_error_response

		auto get_string(const nlohmann::json& _object, const char* _key) -> std::string
		{
			if (const auto iter{_object.find(_key)}; iter != std::end(_object) && iter->is_string()) {
				return iter->get<std::string>();
			}
			return {};
		} // get_string

		auto clamp_lifetime(std::chrono::seconds _lifetime) -> std::chrono::seconds
		{
			if (_lifetime < std::chrono::seconds{0}) {
				log::warn("{}: Negative [expires_in] treated as zero.", __func__);
				return std::chrono::seconds{0};
			}

			if (_lifetime > max_token_lifetime) {
				log::warn("{}: [expires_in] of [{}] seconds clamped.", __func__, _lifetime.count());
				return max_token_lifetime;
			}

			return _lifetime;
		} // clamp_lifetime

		auto get_expires_in(const nlohmann::json& _object) -> std::chrono::seconds
		{
			const auto iter{_object.find("expires_in")};

			if (iter == std::end(_object)) {
				return std::chrono::seconds{0};
			}

			if (iter->is_number_unsigned()) {
				const auto value{iter->get<std::uint64_t>()};
				if (value > static_cast<std::uint64_t>(max_token_lifetime.count())) {
					return clamp_lifetime(std::chrono::seconds::max());
				}
				return std::chrono::seconds{static_cast<std::int64_t>(value)};
			}

			if (iter->is_number_integer()) {
				return clamp_lifetime(std::chrono::seconds{iter->get<std::int64_t>()});
			}

			// Some providers send the lifetime as a string.
			if (iter->is_string()) {
				const auto& text{iter->get_ref<const std::string&>()};
				std::int64_t value{};
				const auto [end, ec]{std::from_chars(text.data(), text.data() + text.size(), value)};

				if (ec == std::errc::result_out_of_range) {
					return clamp_lifetime(text.starts_with('-') ? std::chrono::seconds{-1} : std::chrono::seconds::max());
				}

				if (ec == std::errc{} && end == text.data() + text.size()) {
					return clamp_lifetime(std::chrono::seconds{value});
				}
			}

			log::warn("{}: Ignoring malformed [expires_in] [{}].", __func__, iter->dump());
			return std::chrono::seconds{0};
		} // get_expires_in

		auto parse_token_endpoint(const token_endpoint_binding& _binding) -> boost::urls::url_view
		{
			const auto parsed_uri{boost::urls::parse_uri(_binding.token_endpoint)};

			if (parsed_uri.has_error()) {
				log::error(
					"{}: Error trying to parse token_endpoint [{}]. Please check configuration.",
					__func__,
					_binding.token_endpoint);
				throw std::invalid_argument{"bad endpoint"};
			}

			return *parsed_uri;
		} // parse_token_endpoint

		auto make_token_request(const token_endpoint_binding& _binding, body_arguments _args) -> request_type
		{
			auto req{create_oidc_request(parse_token_endpoint(_binding), _binding)};

			req.body() = url_encode_body(remove_client_from_body_if_confidential_client(_binding, std::move(_args)));
			req.prepare_payload();

			return req;
		} // make_token_request
	} // anonymous namespace

	auto make_token_error(std::string _error) -> token_response
	{
		token_response response;
		response.is_error = true;
		response.error = std::move(_error);
		return response;
	} // make_token_error

	auto parse_token_response(const std::string& _body, int _http_status) -> token_response
	{
		const auto json_res{nlohmann::json::parse(_body, nullptr, false)};
		const auto is_success_status{_http_status >= 200 && _http_status < 300};

		if (json_res.is_discarded() || !json_res.is_object()) {
			log::error("{}: Token endpoint returned a body that is not a JSON object.", __func__);

			auto response{make_token_error(
				is_success_status ? std::string{"invalid token response"} : fmt::format("HTTP {}", _http_status))};
			response.http_status = _http_status;
			return response;
		}

		token_response response{
			.id_token = get_string(json_res, "id_token"),
			.access_token = get_string(json_res, "access_token"),
			.refresh_token = get_string(json_res, "refresh_token"),
			.token_type = get_string(json_res, "token_type"),
			.expires_in = get_expires_in(json_res),
			.is_error = false,
			.error = {},
			.error_description = get_string(json_res, "error_description"),
			.http_status = _http_status};

		if (is_error_response(json_res)) {
			response.is_error = true;
			response.error = get_string(json_res, "error");
		}
		else if (!is_success_status) {
			response.is_error = true;
			response.error = fmt::format("HTTP {}", _http_status);
		}

		return response;
	} // parse_token_response

	auto make_authorization_code_request(
		const token_endpoint_binding& _binding,
		const std::string& _code,
		const std::string& _redirect_uri,
		const std::string& _code_verifier) -> request_type
	{
		body_arguments args{
			{"grant_type", "authorization_code"},
			{"client_id", _binding.client_id},
			{"code", _code},
			{"redirect_uri", _redirect_uri}};

		if (!_code_verifier.empty()) {
			args.emplace("code_verifier", _code_verifier);
		}

		return make_token_request(_binding, std::move(args));
	} // make_authorization_code_request

	auto make_refresh_token_request(const token_endpoint_binding& _binding, const std::string& _refresh_token)
		-> request_type
	{
		body_arguments args{
			{"grant_type", "refresh_token"}, {"client_id", _binding.client_id}, {"refresh_token", _refresh_token}};

		return make_token_request(_binding, std::move(args));
	} // make_refresh_token_request

	http_token_client::http_token_client(transport_options _options)
		: options_{std::move(_options)}
	{
	}

	auto http_token_client::request_authorization_code(
		const token_endpoint_binding& _binding,
		const std::string& _code,
		const std::string& _redirect_uri,
		const std::string& _code_verifier) -> token_response
	{
		return hit_token_endpoint(_binding, [&] {
			return make_authorization_code_request(_binding, _code, _redirect_uri, _code_verifier);
		});
	} // request_authorization_code

	auto http_token_client::request_refresh_token(
		const token_endpoint_binding& _binding,
		const std::string& _refresh_token) -> token_response
	{
		return hit_token_endpoint(_binding, [&] { return make_refresh_token_request(_binding, _refresh_token); });
	} // request_refresh_token

	template <typename MakeRequest>
	auto http_token_client::hit_token_endpoint(const token_endpoint_binding& _binding, MakeRequest&& _make_request)
		-> token_response
	{
		try {
			auto req{std::forward<MakeRequest>(_make_request)()};
			auto res{send_request(parse_token_endpoint(_binding), req, options_)};

			log::debug("{}: Token endpoint responded with status [{}].", __func__, res.result_int());

			return parse_token_response(res.body(), static_cast<int>(res.result_int()));
		}
		catch (const std::exception& e) {
			log::error("{}: Unexpected exception [{}]", __func__, e.what());
			return make_token_error(e.what());
		}
	} // hit_token_endpoint
} // namespace oidc::client
