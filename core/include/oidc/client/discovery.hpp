#ifndef OIDC_CLIENT_DISCOVERY_HPP
#define OIDC_CLIENT_DISCOVERY_HPP

#include "oidc/client/transport.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace oidc::client
{
	/// The subset of the OpenID Provider metadata used by the client.
	///
	/// See OpenID Connect Discovery 1.0 Section 3.
	struct provider_metadata
	{
		std::string issuer;
		std::string authorization_endpoint;
		std::string token_endpoint;
		std::string userinfo_endpoint;
		std::string end_session_endpoint;
		std::string jwks_uri;

		// The JWK Set document served at jwks_uri. Empty if it was not retrieved.
		std::string jwks;
	}; // struct provider_metadata

	class discovery_error : public std::runtime_error
	{
	  public:
		using std::runtime_error::runtime_error;
	}; // class discovery_error

	/// Source of provider metadata.
	///
	/// The returned value is a snapshot. Callers take one snapshot per validation pass and never
	/// observe it changing underneath them.
	class discovery_provider
	{
	  public:
		virtual ~discovery_provider() = default;

		/// \throws discovery_error if the metadata cannot be produced.
		virtual auto get_provider_metadata() -> provider_metadata = 0;
	}; // class discovery_provider

	class static_discovery_provider : public discovery_provider
	{
	  public:
		explicit static_discovery_provider(provider_metadata _metadata);

		auto get_provider_metadata() -> provider_metadata override;

	  private:
		provider_metadata metadata_;
	}; // class static_discovery_provider

	// Fetches the discovery document and the JWK Set on every call.
	class http_discovery_provider : public discovery_provider
	{
	  public:
		http_discovery_provider(std::string _provider_url, transport_options _options);

		auto get_provider_metadata() -> provider_metadata override;

	  private:
		std::string provider_url_;
		transport_options options_;
	}; // class http_discovery_provider

	/// Reads provider metadata from a discovery document.
	///
	/// \throws discovery_error if [issuer] or [token_endpoint] is missing.
	auto to_provider_metadata(const nlohmann::json& _document) -> provider_metadata;
} // namespace oidc::client

#endif // OIDC_CLIENT_DISCOVERY_HPP
