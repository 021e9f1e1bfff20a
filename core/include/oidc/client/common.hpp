#ifndef OIDC_CLIENT_COMMON_HPP
#define OIDC_CLIENT_COMMON_HPP

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/url/url_view.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace oidc::client
{
	// clang-format off
	using request_type  = boost::beast::http::request<boost::beast::http::string_body>;
	using response_type = boost::beast::http::response<boost::beast::http::string_body>;

	using query_arguments_type = std::unordered_map<std::string, std::string>;
	using body_arguments       = std::map<std::string, std::string>;
	// clang-format on

	auto decode(std::string_view _v) -> std::string;

	auto encode(std::string_view _to_encode) -> std::string;

	// A key without '=' maps to an empty string. When a key repeats, the last value wins.
	auto to_argument_list(std::string_view _urlencoded_string) -> query_arguments_type;

	auto url_encode_body(const body_arguments& _args) -> std::string;

	auto safe_base64_encode(std::string_view _view) -> std::string;

	auto create_host_field(boost::urls::url_view _url, std::string_view _port) -> std::string;

	auto get_port_from_url(boost::urls::url_view _url) -> std::optional<std::string>;

	// Path plus query. An empty path becomes "/".
	auto get_request_target(boost::urls::url_view _url) -> std::string;
} // namespace oidc::client

#endif // OIDC_CLIENT_COMMON_HPP
