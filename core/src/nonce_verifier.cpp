#include "oidc/client/nonce_verifier.hpp"

#include "oidc/client/log.hpp"

namespace oidc::client
{
	auto verify_nonce(std::string_view _session_nonce, std::string_view _token_nonce) -> bool
	{
		log::debug("{}: Validating nonce.", __func__);

		if (_session_nonce != _token_nonce) {
			log::error("{}: Nonce [{}] does not match nonce from token [{}].", __func__, _session_nonce, _token_nonce);
			return false;
		}

		return true;
	} // verify_nonce
} // namespace oidc::client
