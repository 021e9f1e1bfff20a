#include "oidc/client/authorize.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace oc = oidc::client;

TEST(authorize_response, parses_a_query_string)
{
	const auto response{oc::parse_authorize_response(
		"https://client.example.org/cb?code=SplxlOBeZQQYbYS6WxSbIA&state=af0ifjsldkj")};

	EXPECT_FALSE(response.is_error());
	EXPECT_EQ(response.code, "SplxlOBeZQQYbYS6WxSbIA");
	EXPECT_EQ(response.state, "af0ifjsldkj");
	EXPECT_FALSE(response.id_token.has_value());
}

TEST(authorize_response, prefers_the_fragment_over_the_query)
{
	const auto response{oc::parse_authorize_response(
		"https://client.example.org/cb?code=from-query#code=from-fragment&id_token=eyJ0.eyJ1.c2ln&state=s1")};

	EXPECT_EQ(response.code, "from-fragment");
	EXPECT_EQ(response.id_token, "eyJ0.eyJ1.c2ln");
	EXPECT_EQ(response.state, "s1");
}

TEST(authorize_response, accepts_a_bare_parameter_list)
{
	const auto response{oc::parse_authorize_response("code=abc&state=xyz&scope=openid+profile")};

	EXPECT_EQ(response.code, "abc");
	EXPECT_EQ(response.state, "xyz");
	EXPECT_EQ(response.scope, "openid profile");
}

TEST(authorize_response, decodes_percent_encoded_values)
{
	const auto response{oc::parse_authorize_response("?code=a%2Bb%3D%3D&state=s%20t&redirect=https%3A%2F%2Fx")};

	EXPECT_EQ(response.code, "a+b==");
	EXPECT_EQ(response.state, "s t");
	EXPECT_EQ(response.values.at("redirect"), "https://x");
}

TEST(authorize_response, keeps_equal_signs_inside_values)
{
	const auto response{oc::parse_authorize_response("code=abc==&state=s")};

	EXPECT_EQ(response.code, "abc==");
}

TEST(authorize_response, reports_provider_errors)
{
	const auto response{oc::parse_authorize_response(
		"https://client.example.org/cb?error=access_denied&error_description=User+declined&state=s1")};

	EXPECT_TRUE(response.is_error());
	EXPECT_EQ(response.error, "access_denied");
	EXPECT_EQ(response.error_description, "User declined");
	EXPECT_FALSE(response.code.has_value());
}

TEST(authorize_response, an_empty_error_is_not_an_error)
{
	const auto response{oc::parse_authorize_response("error=&code=abc&state=s")};

	EXPECT_FALSE(response.is_error());
}

TEST(authorize_response, empty_data_has_no_parameters)
{
	const auto response{oc::parse_authorize_response("")};

	EXPECT_FALSE(response.is_error());
	EXPECT_FALSE(response.code.has_value());
	EXPECT_FALSE(response.state.has_value());
	EXPECT_TRUE(response.values.empty());
}

TEST(authorize_state, reads_and_writes_json)
{
	const oc::authorize_state state{
		.state = "s1", .code_verifier = "verifier", .redirect_uri = "http://127.0.0.1:7890/", .nonce = "n1"};

	const auto json{oc::to_json(state)};
	const auto copy{oc::authorize_state_from_json(json)};

	EXPECT_EQ(copy.state, "s1");
	EXPECT_EQ(copy.code_verifier, "verifier");
	EXPECT_EQ(copy.redirect_uri, "http://127.0.0.1:7890/");
	EXPECT_EQ(copy.nonce, "n1");
}

TEST(authorize_state, nonce_is_optional)
{
	const auto json = nlohmann::json::parse(R"({"state": "s1", "code_verifier": "v", "redirect_uri": "r"})");

	EXPECT_TRUE(oc::authorize_state_from_json(json).nonce.empty());
}

TEST(authorize_state, state_is_required)
{
	const auto json = nlohmann::json::parse(R"({"code_verifier": "v", "redirect_uri": "r"})");

	EXPECT_THROW(oc::authorize_state_from_json(json), nlohmann::json::exception);
}
