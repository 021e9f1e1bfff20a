#include "oidc/client/claims.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace oc = oidc::client;

namespace
{
	auto make_identity(oc::claim_set _claims) -> oc::identity
	{
		return {.authentication_type = "oidc", .name_claim_type = "name", .role_claim_type = "role", .claims = std::move(_claims)};
	}
} // anonymous namespace

TEST(claims, merge_keeps_primary_claims_and_adds_new_types)
{
	const auto primary{make_identity({{"sub", "1"}, {"name", "A"}})};
	const oc::claim_set user_info{{"name", "B"}, {"email", "e@x.com"}};

	const auto merged{oc::merge_claims(primary, user_info)};

	const oc::claim_set expected{{"sub", "1"}, {"name", "A"}, {"email", "e@x.com"}};
	EXPECT_EQ(merged.claims, expected);
	EXPECT_EQ(merged.authentication_type, "oidc");
}

TEST(claims, merge_keeps_every_value_of_a_new_repeated_type)
{
	const auto primary{make_identity({{"sub", "1"}})};
	const oc::claim_set user_info{{"groups", "a"}, {"groups", "b"}, {"sub", "2"}};

	const auto merged{oc::merge_claims(primary, user_info)};

	const oc::claim_set expected{{"sub", "1"}, {"groups", "a"}, {"groups", "b"}};
	EXPECT_EQ(merged.claims, expected);
}

TEST(claims, merge_does_not_modify_its_arguments)
{
	const auto primary{make_identity({{"sub", "1"}})};
	const oc::claim_set user_info{{"email", "e@x.com"}};

	static_cast<void>(oc::merge_claims(primary, user_info));

	EXPECT_EQ(primary.claims.size(), 1U);
	EXPECT_EQ(user_info.size(), 1U);
}

TEST(claims, filter_removes_excluded_types)
{
	const auto identity{make_identity({{"sub", "1"}, {"name", "A"}, {"email", "e@x.com"}})};

	const auto filtered{oc::filter_claims(identity, {"email"})};

	const oc::claim_set expected{{"sub", "1"}, {"name", "A"}};
	EXPECT_EQ(filtered.claims, expected);
}

TEST(claims, finalize_merges_then_filters)
{
	const auto primary{make_identity({{"sub", "1"}, {"iss", "https://idp"}, {"aud", "my-client"}, {"name", "A"}})};
	const oc::claim_set user_info{{"name", "B"}, {"email", "e@x.com"}, {"nonce", "leak"}};

	const auto result{oc::finalize_identity(primary, user_info, {"iss", "aud", "nonce"}, true)};

	const oc::claim_set expected{{"sub", "1"}, {"name", "A"}, {"email", "e@x.com"}};
	EXPECT_EQ(result.claims, expected);
}

TEST(claims, finalize_without_filtering_keeps_every_claim)
{
	const auto primary{make_identity({{"sub", "1"}, {"iss", "https://idp"}})};

	const auto result{oc::finalize_identity(primary, std::nullopt, {"iss"}, false)};

	EXPECT_EQ(result.claims, primary.claims);
}

TEST(claims, finalize_without_user_info_only_filters)
{
	const auto primary{make_identity({{"sub", "1"}, {"at_hash", "x"}})};

	const auto result{oc::finalize_identity(primary, std::nullopt, {"at_hash"}, true)};

	const oc::claim_set expected{{"sub", "1"}};
	EXPECT_EQ(result.claims, expected);
}

TEST(claims, to_claims_flattens_a_json_object)
{
	const auto json = nlohmann::json::parse(R"({
		"sub": "248289761001",
		"aud": ["my-client", "other-client"],
		"exp": 1311281970,
		"email_verified": true,
		"middle_name": null
	})");

	const auto claims{oc::to_claims(json)};

	EXPECT_EQ(oc::find_first(claims, "sub"), "248289761001");
	EXPECT_EQ(oc::find_first(claims, "aud"), "my-client");
	EXPECT_EQ(oc::find_first(claims, "exp"), "1311281970");
	EXPECT_EQ(oc::find_first(claims, "email_verified"), "true");
	EXPECT_FALSE(oc::contains_type(claims, "middle_name"));

	const auto audiences{std::count(std::begin(claims), std::end(claims), oc::claim{"aud", "other-client"})};
	EXPECT_EQ(audiences, 1);
}

TEST(claims, to_claims_ignores_values_that_are_not_objects)
{
	EXPECT_TRUE(oc::to_claims(nlohmann::json::array({1, 2})).empty());
	EXPECT_TRUE(oc::to_claims(nlohmann::json("text")).empty());
}

TEST(claims, find_first_returns_nothing_for_an_unknown_type)
{
	const oc::claim_set claims{{"sub", "1"}};

	EXPECT_FALSE(oc::find_first(claims, "email").has_value());
	EXPECT_FALSE(oc::contains_type(claims, "email"));
	EXPECT_TRUE(oc::contains_type(claims, "sub"));
}
