#include "oidc/client/discovery.hpp"

#include "mocks/mock_discovery_provider.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace oc = oidc::client;

using json = nlohmann::json;

namespace
{
	auto discovery_document() -> json
	{
		return json::parse(R"({
			"issuer": "https://idp.example.org",
			"authorization_endpoint": "https://idp.example.org/authorize",
			"token_endpoint": "https://idp.example.org/token",
			"userinfo_endpoint": "https://idp.example.org/userinfo",
			"end_session_endpoint": "https://idp.example.org/logout",
			"jwks_uri": "https://idp.example.org/jwks",
			"response_types_supported": ["code", "code id_token"],
			"id_token_signing_alg_values_supported": ["RS256"]
		})");
	}
} // anonymous namespace

TEST(discovery, reads_the_provider_metadata)
{
	const auto metadata{oc::to_provider_metadata(discovery_document())};

	EXPECT_EQ(metadata.issuer, "https://idp.example.org");
	EXPECT_EQ(metadata.authorization_endpoint, "https://idp.example.org/authorize");
	EXPECT_EQ(metadata.token_endpoint, "https://idp.example.org/token");
	EXPECT_EQ(metadata.userinfo_endpoint, "https://idp.example.org/userinfo");
	EXPECT_EQ(metadata.end_session_endpoint, "https://idp.example.org/logout");
	EXPECT_EQ(metadata.jwks_uri, "https://idp.example.org/jwks");
	EXPECT_TRUE(metadata.jwks.empty());
}

TEST(discovery, optional_endpoints_may_be_absent)
{
	auto document{discovery_document()};
	document.erase("userinfo_endpoint");
	document.erase("end_session_endpoint");
	document.erase("jwks_uri");

	const auto metadata{oc::to_provider_metadata(document)};

	EXPECT_TRUE(metadata.userinfo_endpoint.empty());
	EXPECT_TRUE(metadata.end_session_endpoint.empty());
	EXPECT_TRUE(metadata.jwks_uri.empty());
}

TEST(discovery, requires_the_issuer)
{
	auto document{discovery_document()};
	document.erase("issuer");

	EXPECT_THROW(oc::to_provider_metadata(document), oc::discovery_error);

	document["issuer"] = "";
	EXPECT_THROW(oc::to_provider_metadata(document), oc::discovery_error);
}

TEST(discovery, requires_the_token_endpoint)
{
	auto document{discovery_document()};
	document.erase("token_endpoint");

	EXPECT_THROW(oc::to_provider_metadata(document), oc::discovery_error);
}

TEST(discovery, members_of_the_wrong_type_count_as_absent)
{
	auto document{discovery_document()};
	document["issuer"] = 42;

	EXPECT_THROW(oc::to_provider_metadata(document), oc::discovery_error);

	document = discovery_document();
	document["userinfo_endpoint"] = json::array();

	EXPECT_TRUE(oc::to_provider_metadata(document).userinfo_endpoint.empty());
}

TEST(discovery, static_provider_serves_its_snapshot)
{
	auto metadata{oc::test::test_provider_metadata()};
	metadata.jwks = R"({"keys": []})";

	oc::static_discovery_provider provider{metadata};

	const auto first{provider.get_provider_metadata()};
	const auto second{provider.get_provider_metadata()};

	EXPECT_EQ(first.issuer, metadata.issuer);
	EXPECT_EQ(first.token_endpoint, metadata.token_endpoint);
	EXPECT_EQ(first.jwks, R"({"keys": []})");
	EXPECT_EQ(second.issuer, first.issuer);
	EXPECT_EQ(second.jwks, first.jwks);
}
