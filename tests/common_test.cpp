#include "oidc/client/common.hpp"

#include <gtest/gtest.h>

#include <boost/url/parse.hpp>

namespace oc = oidc::client;

TEST(common, url_encode_body_joins_encoded_pairs)
{
	const oc::body_arguments args{
		{"grant_type", "authorization_code"}, {"redirect_uri", "http://127.0.0.1:7890/cb"}, {"code", "a b"}};

	EXPECT_EQ(
		oc::url_encode_body(args),
		"code=a%20b&grant_type=authorization_code&redirect_uri=http%3A%2F%2F127.0.0.1%3A7890%2Fcb");
}

TEST(common, url_encode_body_of_nothing_is_empty)
{
	EXPECT_TRUE(oc::url_encode_body({}).empty());
}

TEST(common, to_argument_list_skips_empty_pairs)
{
	const auto args{oc::to_argument_list("a=1&&b=&c")};

	EXPECT_EQ(args.size(), 3U);
	EXPECT_EQ(args.at("a"), "1");
	EXPECT_EQ(args.at("b"), "");
	EXPECT_EQ(args.at("c"), "");
}

TEST(common, safe_base64_encode_uses_the_standard_alphabet)
{
	EXPECT_EQ(oc::safe_base64_encode("my-client:secret"), "bXktY2xpZW50OnNlY3JldA==");
}

TEST(common, port_defaults_to_the_scheme)
{
	EXPECT_EQ(oc::get_port_from_url(*boost::urls::parse_uri("https://idp.example.org/token")), "443");
	EXPECT_EQ(oc::get_port_from_url(*boost::urls::parse_uri("http://idp.example.org/token")), "80");
	EXPECT_EQ(oc::get_port_from_url(*boost::urls::parse_uri("https://idp.example.org:8443/token")), "8443");
	EXPECT_FALSE(oc::get_port_from_url(*boost::urls::parse_uri("ftp://idp.example.org/token")).has_value());
}

TEST(common, host_field_omits_default_ports)
{
	const auto url{*boost::urls::parse_uri("https://idp.example.org/token")};

	EXPECT_EQ(oc::create_host_field(url, "443"), "idp.example.org");
	EXPECT_EQ(oc::create_host_field(url, "8443"), "idp.example.org:8443");
}

TEST(common, request_target_keeps_path_and_query)
{
	EXPECT_EQ(oc::get_request_target(*boost::urls::parse_uri("https://idp.example.org")), "/");
	EXPECT_EQ(
		oc::get_request_target(*boost::urls::parse_uri("https://idp.example.org/realms/a/token?x=1")),
		"/realms/a/token?x=1");
}
