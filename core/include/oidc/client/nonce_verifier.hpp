#ifndef OIDC_CLIENT_NONCE_VERIFIER_HPP
#define OIDC_CLIENT_NONCE_VERIFIER_HPP

#include <string_view>

namespace oidc::client
{
	// Ordinal comparison. Pass a missing claim as an empty string.
	auto verify_nonce(std::string_view _session_nonce, std::string_view _token_nonce) -> bool;
} // namespace oidc::client

#endif // OIDC_CLIENT_NONCE_VERIFIER_HPP
