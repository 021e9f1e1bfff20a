#include "oidc/client/claims.hpp"

#include "oidc/client/log.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace oidc::client
{
	auto find_first(const claim_set& _claims, std::string_view _type) -> std::optional<std::string>
	{
		const auto iter{std::find_if(
			std::cbegin(_claims), std::cend(_claims), [_type](const claim& _c) { return _c.type == _type; })};

		if (iter == std::cend(_claims)) {
			return std::nullopt;
		}

		return iter->value;
	} // find_first

	auto contains_type(const claim_set& _claims, std::string_view _type) -> bool
	{
		return std::any_of(
			std::cbegin(_claims), std::cend(_claims), [_type](const claim& _c) { return _c.type == _type; });
	} // contains_type

	auto to_claims(const nlohmann::json& _object) -> claim_set
	{
		claim_set claims;

		if (!_object.is_object()) {
			log::warn("{}: Expected a JSON object, got [{}]. No claims extracted.", __func__, _object.type_name());
			return claims;
		}

		const auto to_value{[](const nlohmann::json& _v) -> std::string {
			if (_v.is_string()) {
				return _v.get<std::string>();
			}
			return _v.dump();
		}};

		for (const auto& [key, value] : _object.items()) {
			if (value.is_null()) {
				continue;
			}

			if (value.is_array()) {
				for (const auto& element : value) {
					claims.push_back({key, to_value(element)});
				}
				continue;
			}

			claims.push_back({key, to_value(value)});
		}

		return claims;
	} // to_claims

	auto merge_claims(const identity& _primary, const claim_set& _secondary) -> identity
	{
		std::unordered_set<std::string_view> primary_types;
		for (const auto& c : _primary.claims) {
			primary_types.insert(c.type);
		}

		identity merged{_primary};

		std::copy_if(
			std::cbegin(_secondary),
			std::cend(_secondary),
			std::back_inserter(merged.claims),
			[&primary_types](const claim& _c) { return primary_types.find(_c.type) == std::end(primary_types); });

		log::trace(
			"{}: Added [{}] claim(s) to the primary identity.",
			__func__,
			merged.claims.size() - _primary.claims.size());

		return merged;
	} // merge_claims

	auto filter_claims(const identity& _identity, const claim_type_set& _excluded) -> identity
	{
		identity filtered{
			.authentication_type = _identity.authentication_type,
			.name_claim_type = _identity.name_claim_type,
			.role_claim_type = _identity.role_claim_type,
			.claims = {}};

		std::copy_if(
			std::cbegin(_identity.claims),
			std::cend(_identity.claims),
			std::back_inserter(filtered.claims),
			[&_excluded](const claim& _c) { return _excluded.find(_c.type) == std::end(_excluded); });

		return filtered;
	} // filter_claims

	auto finalize_identity(
		const identity& _primary,
		const std::optional<claim_set>& _user_info_claims,
		const claim_type_set& _excluded,
		bool _filtering_enabled) -> identity
	{
		auto merged{_user_info_claims ? merge_claims(_primary, *_user_info_claims) : _primary};

		if (!_filtering_enabled) {
			return merged;
		}

		return filter_claims(merged, _excluded);
	} // finalize_identity
} // namespace oidc::client
