#include "oidc/client/oidc_client.hpp"

#include "oidc/client/log.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace oidc::client
{
	namespace
	{
		auto fail(std::string _error) -> login_result
		{
			log::error("{}: {}", __func__, _error);
			return make_login_failure(std::move(_error));
		} // fail

		auto discovery_failure_text(const discovery_error& _e) -> std::string
		{
			const std::string_view text{_e.what()};
			return text.empty() ? std::string{"discovery error"} : std::string{text};
		} // discovery_failure_text

		auto publish(const claims_sink& _sink, std::string_view _stage, const claim_set& _claims) -> void
		{
			if (_sink) {
				_sink(_stage, _claims);
			}
		} // publish
	} // anonymous namespace

	auto default_filtered_claims() -> claim_type_set
	{
		// clang-format off
		return {
			std::string{claim_types::issuer},
			std::string{claim_types::expiration},
			std::string{claim_types::not_before},
			std::string{claim_types::audience},
			std::string{claim_types::nonce},
			std::string{claim_types::issued_at},
			std::string{claim_types::authentication_time},
			std::string{claim_types::authorization_code_hash},
			std::string{claim_types::access_token_hash}
		};
		// clang-format on
	} // default_filtered_claims

	oidc_client::oidc_client(
		client_options _options,
		std::shared_ptr<discovery_provider> _discovery,
		std::shared_ptr<token_client> _token_client,
		std::shared_ptr<user_info_client> _user_info_client,
		std::shared_ptr<identity_token_validator> _validator)
		: options_{std::move(_options)}
		, flow_{make_flow_strategy(options_.style)}
		, discovery_{std::move(_discovery)}
		, token_client_{std::move(_token_client)}
		, user_info_client_{std::move(_user_info_client)}
		, validator_{std::move(_validator)}
	{
		if (options_.client_id.empty()) {
			throw std::invalid_argument{"Client id must not be empty."};
		}

		if (!discovery_ || !token_client_ || !user_info_client_ || !validator_) {
			throw std::invalid_argument{"All collaborators of the client must be provided."};
		}

		log::debug("{}: Client [{}] uses the [{}] flow.", __func__, options_.client_id, to_string(options_.style));
	} // oidc_client

	auto oidc_client::validate_response(std::string_view _raw_data, const authorize_state& _state) const -> login_result
	{
		log::trace("{}: Validating authorization response.", __func__);

		const auto response{parse_authorize_response(_raw_data)};

		if (response.is_error()) {
			return fail(*response.error);
		}

		if (!response.code || response.code->empty()) {
			return fail("missing authorization code");
		}

		if (!response.state || response.state->empty()) {
			return fail("missing state");
		}

		if (*response.state != _state.state) {
			return fail("invalid state");
		}

		// One snapshot serves the whole pass.
		provider_metadata metadata;
		try {
			metadata = discovery_->get_provider_metadata();
		}
		catch (const discovery_error& e) {
			return fail(discovery_failure_text(e));
		}

		const auto binding{binding_for(metadata)};

		const flow_context context{
			.tokens = *token_client_,
			.validator = *validator_,
			.metadata = metadata,
			.binding = binding,
			.state = _state,
			.response = response};

		auto outcome{std::visit([&context](const auto& _flow) { return _flow.run(context); }, flow_)};
		if (!outcome.error.empty()) {
			return make_login_failure(std::move(outcome.error));
		}

		if (outcome.tokens.access_token.empty()) {
			return fail("missing access token");
		}

		outcome = process_claims(metadata, std::move(outcome));
		if (!outcome.error.empty()) {
			return make_login_failure(std::move(outcome.error));
		}

		const auto now{std::chrono::system_clock::now()};
		auto& tokens{outcome.tokens};

		std::shared_ptr<refresh_token_handler> handler;
		if (!boost::algorithm::trim_copy(tokens.refresh_token).empty()) {
			handler = std::make_shared<refresh_token_handler>(
				token_client_, binding, tokens.refresh_token, tokens.access_token);
		}

		log::info("{}: Login succeeded for client [{}].", __func__, options_.client_id);

		return make_login_success(
			std::move(outcome.user),
			std::move(tokens.access_token),
			std::move(tokens.id_token),
			std::move(tokens.refresh_token),
			now + std::clamp(tokens.expires_in, std::chrono::seconds{0}, max_token_lifetime),
			now,
			std::move(handler));
	} // validate_response

	auto oidc_client::get_user_info(const std::string& _access_token) const -> user_info_response
	{
		try {
			const auto metadata{discovery_->get_provider_metadata()};
			return user_info_client_->get(metadata.userinfo_endpoint, _access_token);
		}
		catch (const discovery_error& e) {
			log::error("{}: {}", __func__, e.what());
			return {.claims = {}, .is_error = true, .error = discovery_failure_text(e), .http_status = 0};
		}
	} // get_user_info

	auto oidc_client::refresh_token(const std::string& _refresh_token) const -> token_response
	{
		try {
			const auto metadata{discovery_->get_provider_metadata()};
			return token_client_->request_refresh_token(binding_for(metadata), _refresh_token);
		}
		catch (const discovery_error& e) {
			log::error("{}: {}", __func__, e.what());
			return make_token_error(discovery_failure_text(e));
		}
	} // refresh_token

	auto oidc_client::binding_for(const provider_metadata& _metadata) const -> token_endpoint_binding
	{
		return {
			.token_endpoint = _metadata.token_endpoint,
			.client_id = options_.client_id,
			.client_secret = options_.client_secret};
	} // binding_for

	auto oidc_client::process_claims(const provider_metadata& _metadata, flow_outcome _outcome) const -> flow_outcome
	{
		publish(options_.on_claims, "identity_token", _outcome.user.claims);

		std::optional<claim_set> user_info_claims;

		if (options_.load_profile) {
			log::debug("{}: Loading profile from [{}].", __func__, _metadata.userinfo_endpoint);

			auto user_info{user_info_client_->get(_metadata.userinfo_endpoint, _outcome.tokens.access_token)};
			if (user_info.is_error) {
				log::error("{}: Failed to load profile [{}].", __func__, user_info.error);
				_outcome.error = user_info.error.empty() ? std::string{"user info error"} : std::move(user_info.error);
				return _outcome;
			}

			publish(options_.on_claims, "user_info", user_info.claims);
			user_info_claims = std::move(user_info.claims);
		}

		_outcome.user =
			finalize_identity(_outcome.user, user_info_claims, options_.filtered_claims, options_.filter_claims);

		publish(options_.on_claims, "filtered", _outcome.user.claims);

		return _outcome;
	} // process_claims
} // namespace oidc::client
