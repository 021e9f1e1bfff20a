#include "oidc/client/jwks_identity_token_validator.hpp"

#include "oidc/client/log.hpp"

#include <boost/algorithm/string.hpp>
#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <string_view>
#include <system_error>
#include <utility>

namespace oidc::client
{
	namespace
	{
		// clang-format off
		using decoded_jwt  = jwt::decoded_jwt<jwt::traits::nlohmann_json>;
		using jwk_type     = jwt::jwk<jwt::traits::nlohmann_json>;
		using jwks_type    = jwt::jwks<jwt::traits::nlohmann_json>;
		using jwt_verifier = jwt::verifier<jwt::default_clock, jwt::traits::nlohmann_json>;
		// clang-format on

		auto failure(std::string _error) -> identity_token_validation_result
		{
			return {.success = false, .user = {}, .error = std::move(_error)};
		} // failure

		/// Adds the HMAC algorithm \p _alg to \p _verifier, keyed with the client secret.
		///
		/// \returns false if no secret is configured or \p _alg is not HS256, HS384 or HS512.
		auto add_symmetric_algorithm(jwt_verifier& _verifier, const jwks_validator_options& _options, std::string_view _alg)
			-> bool
		{
			std::string key;

			// Some OpenID Providers do not follow OpenID Connect Core 1.0 incorporating errata set 2,
			// Section 3.1.3.7, Bullet Point 8. This variable would allow for non-standard behavior, if provided.
			if (_options.nonstandard_id_token_secret) {
				key = jwt::base::decode<jwt::alphabet::base64url>(
					jwt::base::pad<jwt::alphabet::base64url>(*_options.nonstandard_id_token_secret));
			}
			// ID Tokens using a MAC are signed with the client_secret.
			else if (_options.client_secret) {
				key = *_options.client_secret;
			}
			else {
				log::warn("{}: No secret provided. Unable to use symmetric algorithms.", __func__);
				return false;
			}

			// clang-format off
			if (_alg == "HS256") { _verifier.allow_algorithm(jwt::algorithm::hs256{key}); return true; }
			if (_alg == "HS384") { _verifier.allow_algorithm(jwt::algorithm::hs384{key}); return true; }
			if (_alg == "HS512") { _verifier.allow_algorithm(jwt::algorithm::hs512{key}); return true; }
			// clang-format on

			log::warn("{}: Algorithm [{}] is not supported.", __func__, _alg);
			return false;
		} // add_symmetric_algorithm

		/// Adds the asymmetric algorithm \p _alg to \p _verifier using the public key described by \p _jwk.
		auto add_asymmetric_algorithm_from_jwk(jwt_verifier& _verifier, const jwk_type& _jwk, std::string_view _alg)
			-> bool
		{
			const auto family{_alg.substr(0, 2)};

			if (family == "RS" || family == "PS") {
				// Modulus and exponent parameters (JWA Section 6.3.1)
				const auto pub_key{jwt::helper::create_public_key_from_rsa_components(
					_jwk.get_jwk_claim("n").as_string(), _jwk.get_jwk_claim("e").as_string())};

				// clang-format off
				if (_alg == "RS256") { _verifier.allow_algorithm(jwt::algorithm::rs256{pub_key}); return true; }
				if (_alg == "RS384") { _verifier.allow_algorithm(jwt::algorithm::rs384{pub_key}); return true; }
				if (_alg == "RS512") { _verifier.allow_algorithm(jwt::algorithm::rs512{pub_key}); return true; }
				if (_alg == "PS256") { _verifier.allow_algorithm(jwt::algorithm::ps256{pub_key}); return true; }
				if (_alg == "PS384") { _verifier.allow_algorithm(jwt::algorithm::ps384{pub_key}); return true; }
				if (_alg == "PS512") { _verifier.allow_algorithm(jwt::algorithm::ps512{pub_key}); return true; }
				// clang-format on
			}
			else if (family == "ES") {
				// Curve and coordinate parameters (JWA Section 6.2.1)
				const auto pub_key{jwt::helper::create_public_key_from_ec_components(
					_jwk.get_curve(), _jwk.get_jwk_claim("x").as_string(), _jwk.get_jwk_claim("y").as_string())};

				// clang-format off
				if (_alg == "ES256") { _verifier.allow_algorithm(jwt::algorithm::es256{pub_key}); return true; }
				if (_alg == "ES384") { _verifier.allow_algorithm(jwt::algorithm::es384{pub_key}); return true; }
				if (_alg == "ES512") { _verifier.allow_algorithm(jwt::algorithm::es512{pub_key}); return true; }
				// clang-format on
			}

			log::warn("{}: Algorithm [{}] is not supported.", __func__, _alg);
			return false;
		} // add_asymmetric_algorithm_from_jwk

		/// Adds verification algorithm(s) to \p _verifier, using the JWK named by the token's [kid] when
		/// possible and every compatible signing key of \p _jwks otherwise.
		///
		/// \returns The number of algorithms added.
		auto add_algorithms_to_verifier(
			jwt_verifier& _verifier,
			const jwks_validator_options& _options,
			const jwks_type& _jwks,
			const decoded_jwt& _jwt) -> int
		{
			const auto alg{_jwt.get_algorithm()};
			const auto family{alg.substr(0, 2)};

			// Symmetric algo (JWA Section 3.1)
			if (family == "HS") {
				return add_symmetric_algorithm(_verifier, _options, alg) ? 1 : 0;
			}

			// 'kty' of the keys usable with 'alg' (JWA Section 6.1)
			std::string key_type;
			if (family == "RS" || family == "PS") {
				key_type = "RSA";
			}
			else if (family == "ES") {
				key_type = "EC";
			}
			else {
				log::error("{}: [alg] of [{}] is unsupported.", __func__, alg);
				return 0;
			}

			// The key the token was signed with. This is optional (RFC 7515 Section 4.1.4).
			if (_jwt.has_key_id()) {
				const auto key_id{_jwt.get_key_id()};
				if (_jwks.has_jwk(key_id)) {
					return add_asymmetric_algorithm_from_jwk(_verifier, _jwks.get_jwk(key_id), alg) ? 1 : 0;
				}
				log::warn("{}: Could not find [kid] [{}] in the JWKs list.", __func__, key_id);
			}

			int added{};

			std::for_each(std::cbegin(_jwks), std::cend(_jwks), [&](const jwk_type& _jwk) {
				// Skip JWK if 'use' is not for signing (JWK Section 4.2)
				if (_jwk.has_use() && _jwk.get_use() != "sig") {
					return;
				}

				// Skip JWK if it may not verify (JWK Section 4.3)
				if (_jwk.has_key_operations() && !_jwk.get_key_operations().contains("verify")) {
					return;
				}

				const auto usable{
					_jwk.has_algorithm() ? _jwk.get_algorithm() == alg
										 : (_jwk.has_key_type() && _jwk.get_key_type() == key_type)};

				if (usable && add_asymmetric_algorithm_from_jwk(_verifier, _jwk, alg)) {
					++added;
				}
			});

			return added;
		} // add_algorithms_to_verifier

		/// Rejects token shapes this validator does not handle.
		///
		/// \returns An error message, or an empty string if the token may be verified.
		auto check_token_shape(const decoded_jwt& _jwt, const std::string& _client_id) -> std::string
		{
			// 'typ' is optional for ID Tokens. When present it must be 'JWT' (case insensitive).
			if (_jwt.has_type() && boost::to_lower_copy<std::string>(_jwt.get_type()) != "jwt") {
				return "unsupported token type";
			}

			// We do not currently support JWEs (JWE Section 4.1.2)
			if (_jwt.has_header_claim("enc")) {
				return "encrypted identity tokens are not supported";
			}

			// Nested JWTs (JWT Section 5.2)
			if (_jwt.has_content_type() && boost::to_lower_copy<std::string>(_jwt.get_content_type()) == "jwt") {
				return "nested identity tokens are not supported";
			}

			// JWS Section 4.1.1
			if (!_jwt.has_algorithm()) {
				return "missing algorithm";
			}

			// Unsigned ID Tokens are only allowed when they arrive directly from the token endpoint
			// over TLS and the client opted in. We never opt in.
			if (_jwt.get_algorithm() == "none") {
				return "unsigned identity token";
			}

			// The key of a symmetric algorithm is undefined with several audiences (OIDC Section 3.1.3.7).
			if (_jwt.get_algorithm().substr(0, 2) == "HS" && _jwt.has_audience() && _jwt.get_audience().size() > 1) {
				return "symmetric algorithm with multiple audiences";
			}

			// OIDC Section 3.1.3.7
			if (_jwt.has_payload_claim("azp") && _jwt.get_payload_claim("azp").as_string() != _client_id) {
				return "invalid authorized party";
			}

			// JWS Section 4.1.11
			if (_jwt.has_header_claim("crit")) {
				return "unsupported critical header";
			}

			return {};
		} // check_token_shape
	} // anonymous namespace

	jwks_identity_token_validator::jwks_identity_token_validator(jwks_validator_options _options)
		: options_{std::move(_options)}
	{
	}

	auto jwks_identity_token_validator::validate(
		const std::string& _identity_token,
		const std::string& _client_id,
		const provider_metadata& _metadata) -> identity_token_validation_result
	{
		try {
			const auto decoded{jwt::decode<jwt::traits::nlohmann_json>(_identity_token)};

			if (auto shape_error{check_token_shape(decoded, _client_id)}; !shape_error.empty()) {
				log::error("{}: {}.", __func__, shape_error);
				return failure(std::move(shape_error));
			}

			const auto jwks{jwt::parse_jwks<jwt::traits::nlohmann_json>(
				_metadata.jwks.empty() ? std::string{R"({"keys":[]})"} : _metadata.jwks)};

			auto verifier{jwt::verify<jwt::traits::nlohmann_json>().leeway(
				static_cast<std::size_t>(options_.clock_skew.count()))};

			if (add_algorithms_to_verifier(verifier, options_, jwks, decoded) == 0) {
				log::error("{}: No key available to verify algorithm [{}].", __func__, decoded.get_algorithm());
				return failure("no matching signing key");
			}

			std::error_code ec;
			verifier.verify(decoded, ec);

			if (ec) {
				log::error("{}: JWT verification failed [{}].", __func__, ec.message());
				return failure(ec.message());
			}

			log::trace("{}: JWT verification succeeded.", __func__);

			const nlohmann::json payload = decoded.get_payload_json();

			return {
				.success = true,
				.user = {.authentication_type = "oidc",
			             .name_claim_type = std::string{claim_types::name},
			             .role_claim_type = std::string{claim_types::role},
			             .claims = to_claims(payload)},
				.error = {}};
		}
		catch (const std::exception& e) {
			log::error("{}: Unexpected exception [{}]", __func__, e.what());
			return failure(e.what());
		}
	} // validate
} // namespace oidc::client
