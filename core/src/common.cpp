#include "oidc/client/common.hpp"

#include "oidc/client/log.hpp"

#include <boost/algorithm/string.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <jwt-cpp/base.h>

#include <iterator>
#include <memory>
#include <numeric>
#include <vector>

namespace oidc::client
{
	auto decode(std::string_view _v) -> std::string
	{
		std::string result;
		int decoded_length = -1;

		if (auto* decoded = curl_easy_unescape(nullptr, _v.data(), static_cast<int>(_v.size()), &decoded_length);
		    decoded) {
			std::unique_ptr<char, void (*)(void*)> s{decoded, curl_free};
			result.assign(decoded, decoded_length);
		}
		else {
			result.assign(_v);
		}

		return result;
	} // decode

	auto encode(std::string_view _to_encode) -> std::string
	{
		char* tmp_encoded_data{curl_easy_escape(nullptr, _to_encode.data(), static_cast<int>(_to_encode.size()))};
		if (tmp_encoded_data == nullptr) {
			return {std::cbegin(_to_encode), std::cend(_to_encode)};
		}

		std::string encoded_data{tmp_encoded_data};

		curl_free(tmp_encoded_data);
		return encoded_data;
	} // encode

	auto to_argument_list(std::string_view _urlencoded_string) -> query_arguments_type
	{
		if (_urlencoded_string.empty()) {
			return {};
		}

		query_arguments_type kvps;

		std::vector<std::string> tokens;
		boost::split(tokens, _urlencoded_string, boost::is_any_of("&"));

		for (auto&& t : tokens) {
			if (t.empty()) {
				continue;
			}

			// Only the first '=' separates the key. Values such as base64 padding may contain more.
			const auto eq{t.find('=')};

			if (eq == std::string::npos) {
				kvps.insert_or_assign(decode(t), "");
				continue;
			}

			// '+' is a space in form encoding. It must be replaced before percent-decoding.
			auto value{t.substr(eq + 1)};
			boost::replace_all(value, "+", " ");
			kvps.insert_or_assign(decode(t.substr(0, eq)), decode(value));
		}

		return kvps;
	} // to_argument_list

	auto url_encode_body(const body_arguments& _args) -> std::string
	{
		if (_args.empty()) {
			return {};
		}

		auto encode_pair{[](const body_arguments::value_type& i) {
			return fmt::format("{}={}", encode(i.first), encode(i.second));
		}};

		return std::transform_reduce(
			std::next(std::cbegin(_args)),
			std::cend(_args),
			encode_pair(*std::cbegin(_args)),
			[](const auto& a, const auto& b) { return fmt::format("{}&{}", a, b); },
			encode_pair);
	} // url_encode_body

	auto safe_base64_encode(std::string_view _view) -> std::string
	{
		return jwt::base::encode<jwt::alphabet::base64>(std::string{_view});
	} // safe_base64_encode

	auto create_host_field(boost::urls::url_view _url, std::string_view _port) -> std::string
	{
		if ((_port == "443" && _url.scheme_id() == boost::urls::scheme::https) ||
		    (_port == "80" && _url.scheme_id() == boost::urls::scheme::http))
		{
			return _url.host();
		}
		return fmt::format("{}:{}", _url.host(), _port);
	} // create_host_field

	auto get_port_from_url(boost::urls::url_view _url) -> std::optional<std::string>
	{
		if (_url.has_port()) {
			return _url.port();
		}

		switch (_url.scheme_id()) {
			case boost::urls::scheme::https:
				log::debug("{}: Detected HTTPS scheme, using port 443.", __func__);
				return "443";
			case boost::urls::scheme::http:
				log::debug("{}: Detected HTTP scheme, using port 80.", __func__);
				return "80";
			default:
				log::error("{}: Cannot deduce port from url [{}].", __func__, std::string_view{_url.buffer()});
				return std::nullopt;
		}
	} // get_port_from_url

	auto get_request_target(boost::urls::url_view _url) -> std::string
	{
		const auto path{_url.encoded_path()};
		std::string target(path.data(), path.size());

		if (target.empty()) {
			target = "/";
		}

		if (_url.has_query()) {
			const auto query{_url.encoded_query()};
			target += '?';
			target.append(query.data(), query.size());
		}

		return target;
	} // get_request_target
} // namespace oidc::client
