#include "oidc/client/authorize.hpp"

#include "oidc/client/log.hpp"

namespace oidc::client
{
	namespace
	{
		auto find_value(const query_arguments_type& _args, const std::string& _key) -> std::optional<std::string>
		{
			if (const auto iter{_args.find(_key)}; iter != std::end(_args)) {
				return iter->second;
			}

			return std::nullopt;
		} // find_value
	} // anonymous namespace

	auto parse_authorize_response(std::string_view _raw_data) -> authorize_response
	{
		auto parameters{_raw_data};

		if (const auto pos{_raw_data.find('#')}; pos != std::string_view::npos) {
			parameters = _raw_data.substr(pos + 1);
		}
		else if (const auto pos{_raw_data.find('?')}; pos != std::string_view::npos) {
			parameters = _raw_data.substr(pos + 1);
		}

		auto args{to_argument_list(parameters)};

		log::trace("{}: Parsed [{}] parameter(s) from the authorization response.", __func__, args.size());

		authorize_response response{
			.error = find_value(args, "error"),
			.error_description = find_value(args, "error_description"),
			.code = find_value(args, "code"),
			.state = find_value(args, "state"),
			.id_token = find_value(args, "id_token"),
			.access_token = find_value(args, "access_token"),
			.token_type = find_value(args, "token_type"),
			.scope = find_value(args, "scope"),
			.expires_in = find_value(args, "expires_in"),
			.values = {}};

		response.values = std::move(args);

		return response;
	} // parse_authorize_response

	auto to_json(const authorize_state& _state) -> nlohmann::json
	{
		return {
			{"state", _state.state},
			{"code_verifier", _state.code_verifier},
			{"redirect_uri", _state.redirect_uri},
			{"nonce", _state.nonce}};
	} // to_json

	auto authorize_state_from_json(const nlohmann::json& _json) -> authorize_state
	{
		return {
			.state = _json.at("state").get<std::string>(),
			.code_verifier = _json.at("code_verifier").get<std::string>(),
			.redirect_uri = _json.at("redirect_uri").get<std::string>(),
			.nonce = _json.value("nonce", std::string{})};
	} // authorize_state_from_json
} // namespace oidc::client
