#ifndef OIDC_CLIENT_HASH_BINDER_HPP
#define OIDC_CLIENT_HASH_BINDER_HPP

#include <string>
#include <string_view>

namespace oidc::client
{
	/// Computes the value an identity token carries in [c_hash] or [at_hash] for \p _secret.
	///
	/// The left-most 128 bits of the SHA-256 digest of \p _secret, base64url encoded without padding.
	/// See OpenID Connect Core 1.0 Sections 3.2.2.9 and 3.3.2.11.
	auto compute_left_half_hash(std::string_view _secret) -> std::string;

	/// Checks that \p _claimed_hash binds the identity token to \p _secret.
	///
	/// An empty \p _claimed_hash is accepted. Some providers omit [c_hash] and [at_hash].
	///
	/// \param[in] _secret       The authorization code or access token.
	/// \param[in] _claimed_hash The hash claim taken from the validated identity token.
	///
	/// \returns true if the hash is absent or matches, false otherwise.
	auto verify_hash_binding(std::string_view _secret, std::string_view _claimed_hash) -> bool;
} // namespace oidc::client

#endif // OIDC_CLIENT_HASH_BINDER_HPP
