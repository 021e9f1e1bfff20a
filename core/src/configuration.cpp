#include "oidc/client/configuration.hpp"

#include "oidc/client/jwks_identity_token_validator.hpp"
#include "oidc/client/log.hpp"

#include <boost/url/parse.hpp>
#include <fmt/format.h>

#include <stdexcept>
#include <utility>

namespace oidc::client
{
	namespace
	{
		using json = nlohmann::json;

		template <typename T>
		auto value_or(const json& _object, const char* _key, T _default) -> T
		{
			if (const auto iter{_object.find(_key)}; iter != std::end(_object)) {
				return iter->get<T>();
			}

			return _default;
		} // value_or

		auto optional_string(const json& _object, const char* _key) -> std::optional<std::string>
		{
			if (const auto iter{_object.find(_key)}; iter != std::end(_object) && !iter->is_null()) {
				return iter->get<std::string>();
			}

			return std::nullopt;
		} // optional_string
	} // anonymous namespace

	auto load_client_options(const nlohmann::json& _config) -> client_options
	{
		client_options options;

		options.client_id = _config.at("client_id").get<std::string>();
		options.client_secret = optional_string(_config, "client_secret");

		const auto style_name{value_or<std::string>(_config, "style", "authorization_code")};
		const auto style{to_authentication_style(style_name)};

		if (!style) {
			throw std::invalid_argument{fmt::format("Invalid authentication style [{}].", style_name)};
		}

		options.style = *style;
		options.load_profile = value_or(_config, "load_profile", true);
		options.filter_claims = value_or(_config, "filter_claims", true);

		if (const auto iter{_config.find("filtered_claims")}; iter != std::end(_config)) {
			options.filtered_claims.clear();

			for (const auto& c : *iter) {
				options.filtered_claims.insert(c.get<std::string>());
			}
		}

		return options;
	} // load_client_options

	auto load_configuration(const nlohmann::json& _config) -> configuration
	{
		const auto& oidc_config{_config.at("openid_connect")};

		configuration config;

		config.log_level = value_or<std::string>(_config, "log_level", "info");
		config.provider_url = oidc_config.at("provider_url").get<std::string>();
		config.tls_certificates_directory = oidc_config.at("tls_certificates_directory").get<std::string>();
		config.clock_skew = std::chrono::seconds{value_or(oidc_config, "clock_skew_in_seconds", 300)};
		config.request_timeout = std::chrono::seconds{value_or(oidc_config, "request_timeout_in_seconds", 30)};
		config.nonstandard_id_token_secret = optional_string(oidc_config, "nonstandard_id_token_secret");

		if (const auto parsed_uri{boost::urls::parse_uri(config.provider_url)}; parsed_uri.has_error()) {
			log::error("{}: Error trying to parse provider_url [{}].", __func__, config.provider_url);
			throw std::invalid_argument{fmt::format("Invalid provider_url [{}].", config.provider_url)};
		}

		if (config.clock_skew.count() < 0) {
			throw std::invalid_argument{"clock_skew_in_seconds must not be negative."};
		}

		if (config.request_timeout.count() <= 0) {
			throw std::invalid_argument{"request_timeout_in_seconds must be greater than zero."};
		}

		config.client = load_client_options(oidc_config);

		return config;
	} // load_configuration

	auto make_http_client(const configuration& _config) -> std::unique_ptr<oidc_client>
	{
		log::trace("{}: Using provider [{}].", __func__, _config.provider_url);

		jwks_validator_options validator_options{
			.client_secret = _config.client.client_secret,
			.nonstandard_id_token_secret = _config.nonstandard_id_token_secret,
			.clock_skew = _config.clock_skew};

		const transport_options http_options{
			.tls_certificates_directory = _config.tls_certificates_directory, .timeout = _config.request_timeout};

		return std::make_unique<oidc_client>(
			_config.client,
			std::make_shared<http_discovery_provider>(_config.provider_url, http_options),
			std::make_shared<http_token_client>(http_options),
			std::make_shared<http_user_info_client>(http_options),
			std::make_shared<jwks_identity_token_validator>(std::move(validator_options)));
	} // make_http_client

	auto configuration_template() -> std::string_view
	{
		// clang-format off
		return R"({
    "log_level": "info",

    "openid_connect": {
        "provider_url": "<string>",
        "client_id": "<string>",
        "client_secret": "<string>",
        "style": "authorization_code",
        "load_profile": true,
        "filter_claims": true,
        "filtered_claims": [
            "iss",
            "exp",
            "nbf",
            "aud",
            "nonce",
            "iat",
            "auth_time",
            "c_hash",
            "at_hash"
        ],
        "tls_certificates_directory": "<string>",
        "clock_skew_in_seconds": 300,
        "request_timeout_in_seconds": 30
    }
}
)";
		// clang-format on
	} // configuration_template
} // namespace oidc::client
