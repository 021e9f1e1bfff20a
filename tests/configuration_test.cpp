#include "oidc/client/configuration.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

namespace oc = oidc::client;

using json = nlohmann::json;

namespace
{
	auto minimal_configuration() -> json
	{
		return json::parse(R"({
			"openid_connect": {
				"provider_url": "https://idp.example.org",
				"client_id": "my-client",
				"tls_certificates_directory": "/etc/ssl/certs"
			}
		})");
	}
} // anonymous namespace

TEST(configuration, applies_defaults)
{
	const auto config{oc::load_configuration(minimal_configuration())};

	EXPECT_EQ(config.log_level, "info");
	EXPECT_EQ(config.provider_url, "https://idp.example.org");
	EXPECT_EQ(config.tls_certificates_directory, "/etc/ssl/certs");
	EXPECT_EQ(config.clock_skew, std::chrono::seconds{300});
	EXPECT_EQ(config.request_timeout, std::chrono::seconds{30});
	EXPECT_FALSE(config.nonstandard_id_token_secret.has_value());

	EXPECT_EQ(config.client.client_id, "my-client");
	EXPECT_FALSE(config.client.client_secret.has_value());
	EXPECT_EQ(config.client.style, oc::authentication_style::authorization_code);
	EXPECT_TRUE(config.client.load_profile);
	EXPECT_TRUE(config.client.filter_claims);
	EXPECT_EQ(config.client.filtered_claims, oc::default_filtered_claims());
	EXPECT_EQ(config.client.filtered_claims.count("at_hash"), 1U);
	EXPECT_EQ(config.client.filtered_claims.count("sub"), 0U);
}

TEST(configuration, reads_every_option)
{
	auto input{minimal_configuration()};
	input["log_level"] = "debug";
	input["openid_connect"]["client_secret"] = "secret";
	input["openid_connect"]["style"] = "hybrid";
	input["openid_connect"]["load_profile"] = false;
	input["openid_connect"]["filter_claims"] = false;
	input["openid_connect"]["filtered_claims"] = json::array({"email"});
	input["openid_connect"]["clock_skew_in_seconds"] = 60;
	input["openid_connect"]["request_timeout_in_seconds"] = 5;

	const auto config{oc::load_configuration(input)};

	EXPECT_EQ(config.log_level, "debug");
	EXPECT_EQ(config.clock_skew, std::chrono::seconds{60});
	EXPECT_EQ(config.request_timeout, std::chrono::seconds{5});
	EXPECT_EQ(config.client.client_secret, "secret");
	EXPECT_EQ(config.client.style, oc::authentication_style::hybrid);
	EXPECT_FALSE(config.client.load_profile);
	EXPECT_FALSE(config.client.filter_claims);
	EXPECT_EQ(config.client.filtered_claims, oc::claim_type_set{"email"});
}

TEST(configuration, rejects_an_unknown_style)
{
	auto input{minimal_configuration()};
	input["openid_connect"]["style"] = "implicit";

	EXPECT_THROW(oc::load_configuration(input), std::invalid_argument);
	EXPECT_THROW(oc::load_client_options(input.at("openid_connect")), std::invalid_argument);
}

TEST(configuration, rejects_a_provider_url_that_is_not_a_uri)
{
	auto input{minimal_configuration()};
	input["openid_connect"]["provider_url"] = "not a url";

	EXPECT_THROW(oc::load_configuration(input), std::invalid_argument);
}

TEST(configuration, rejects_a_negative_clock_skew)
{
	auto input{minimal_configuration()};
	input["openid_connect"]["clock_skew_in_seconds"] = -1;

	EXPECT_THROW(oc::load_configuration(input), std::invalid_argument);
}

TEST(configuration, rejects_a_request_timeout_that_is_not_positive)
{
	auto input{minimal_configuration()};

	input["openid_connect"]["request_timeout_in_seconds"] = 0;
	EXPECT_THROW(oc::load_configuration(input), std::invalid_argument);

	input["openid_connect"]["request_timeout_in_seconds"] = -5;
	EXPECT_THROW(oc::load_configuration(input), std::invalid_argument);
}

TEST(configuration, requires_the_client_id)
{
	auto input{minimal_configuration()};
	input["openid_connect"].erase("client_id");

	EXPECT_THROW(oc::load_configuration(input), json::exception);
}

TEST(configuration, requires_the_openid_connect_section)
{
	EXPECT_THROW(oc::load_configuration(json::object()), json::exception);
}

TEST(configuration, template_is_valid_json)
{
	const auto config = json::parse(oc::configuration_template());

	EXPECT_EQ(config.at("log_level").get<std::string>(), "info");
	EXPECT_EQ(config.at("openid_connect").at("style").get<std::string>(), "authorization_code");
	EXPECT_NO_THROW(oc::load_client_options(config.at("openid_connect")));
}

TEST(configuration, authentication_style_names)
{
	EXPECT_EQ(oc::to_authentication_style("authorization_code"), oc::authentication_style::authorization_code);
	EXPECT_EQ(oc::to_authentication_style("hybrid"), oc::authentication_style::hybrid);
	EXPECT_FALSE(oc::to_authentication_style("Hybrid").has_value());
	EXPECT_EQ(oc::to_string(oc::authentication_style::hybrid), "hybrid");
}
