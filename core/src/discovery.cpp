#include "oidc/client/discovery.hpp"

#include "oidc/client/common.hpp"
#include "oidc/client/log.hpp"
#include "oidc/client/transport.hpp"
#include "oidc/client/version.hpp"

#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>
#include <fmt/format.h>

#include <utility>

// clang-format off
namespace beast = boost::beast; // from <boost/beast.hpp>
// clang-format on

namespace oidc::client
{
	namespace
	{
		auto get_json_document(const std::string& _uri, const transport_options& _options) -> std::string
		{
			const auto parsed_uri{boost::urls::parse_uri(_uri)};

			if (parsed_uri.has_error()) {
				log::error("{}: Error trying to parse [{}]. Please check configuration.", __func__, _uri);
				throw discovery_error{fmt::format("Invalid discovery URI [{}].", _uri)};
			}

			const auto url{*parsed_uri};
			const auto port{get_port_from_url(url)};

			if (!port) {
				throw discovery_error{fmt::format("Cannot deduce port from URI [{}].", _uri)};
			}

			// Build Request
			constexpr auto http_version_number{11};
			beast::http::request<beast::http::string_body> req{
				beast::http::verb::get, get_request_target(url), http_version_number};
			req.set(beast::http::field::host, create_host_field(url, *port));
			req.set(beast::http::field::user_agent, version::user_agent);
			req.set(beast::http::field::accept, "application/json");
			req.prepare_payload();

			auto res{send_request(url, req, _options)};

			log::debug("{}: Received the following response: [{}]", __func__, res.body());

			if (beast::http::to_status_class(res.result()) != beast::http::status_class::successful) {
				throw discovery_error{
					fmt::format("Error loading discovery document from [{}]: status [{}].", _uri, res.result_int())};
			}

			return std::move(res.body());
		} // get_json_document
	} // anonymous namespace

	static_discovery_provider::static_discovery_provider(provider_metadata _metadata)
		: metadata_{std::move(_metadata)}
	{
	}

	auto static_discovery_provider::get_provider_metadata() -> provider_metadata
	{
		return metadata_;
	}

	http_discovery_provider::http_discovery_provider(std::string _provider_url, transport_options _options)
		: provider_url_{std::move(_provider_url)}
		, options_{std::move(_options)}
	{
	}

	auto http_discovery_provider::get_provider_metadata() -> provider_metadata
	{
		try {
			auto base{provider_url_};
			while (!base.empty() && base.back() == '/') {
				base.pop_back();
			}

			const auto document_uri{fmt::format("{}/.well-known/openid-configuration", base)};
			auto metadata{
				to_provider_metadata(nlohmann::json::parse(get_json_document(document_uri, options_)))};

			if (!metadata.jwks_uri.empty()) {
				metadata.jwks = get_json_document(metadata.jwks_uri, options_);
			}
			else {
				log::warn("{}: Provider does not advertise [jwks_uri].", __func__);
			}

			return metadata;
		}
		catch (const discovery_error&) {
			throw;
		}
		catch (const std::exception& e) {
			log::error("{}: Unexpected exception [{}]", __func__, e.what());
			throw discovery_error{fmt::format("Error loading discovery document: {}", e.what())};
		}
	} // get_provider_metadata

	auto to_provider_metadata(const nlohmann::json& _document) -> provider_metadata
	{
		const auto get_string{[&_document](const char* _key) -> std::string {
			if (const auto iter{_document.find(_key)}; iter != std::end(_document) && iter->is_string()) {
				return iter->get<std::string>();
			}
			return {};
		}};

		provider_metadata metadata{
			.issuer = get_string("issuer"),
			.authorization_endpoint = get_string("authorization_endpoint"),
			.token_endpoint = get_string("token_endpoint"),
			.userinfo_endpoint = get_string("userinfo_endpoint"),
			.end_session_endpoint = get_string("end_session_endpoint"),
			.jwks_uri = get_string("jwks_uri"),
			.jwks = {}};

		if (metadata.issuer.empty()) {
			throw discovery_error{"Discovery document is missing [issuer]."};
		}

		if (metadata.token_endpoint.empty()) {
			throw discovery_error{"Discovery document is missing [token_endpoint]."};
		}

		return metadata;
	} // to_provider_metadata
} // namespace oidc::client
