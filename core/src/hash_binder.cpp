#include "oidc/client/hash_binder.hpp"

#include "oidc/client/log.hpp"

#include <jwt-cpp/base.h>
#include <openssl/sha.h>

#include <array>
#include <cstddef>

namespace oidc::client
{
	auto compute_left_half_hash(std::string_view _secret) -> std::string
	{
		std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};

		// NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
		SHA256(reinterpret_cast<const unsigned char*>(_secret.data()), _secret.size(), digest.data());

		constexpr std::size_t left_half_size{SHA256_DIGEST_LENGTH / 2};

		// NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
		const std::string left_half{reinterpret_cast<const char*>(digest.data()), left_half_size};

		return jwt::base::trim<jwt::alphabet::base64url>(jwt::base::encode<jwt::alphabet::base64url>(left_half));
	} // compute_left_half_hash

	auto verify_hash_binding(std::string_view _secret, std::string_view _claimed_hash) -> bool
	{
		if (_claimed_hash.empty()) {
			log::debug("{}: No hash claim present. Treating binding as satisfied.", __func__);
			return true;
		}

		const auto computed{compute_left_half_hash(_secret)};

		if (computed != _claimed_hash) {
			log::error("{}: Computed hash [{}] does not match hash claim [{}].", __func__, computed, _claimed_hash);
			return false;
		}

		return true;
	} // verify_hash_binding
} // namespace oidc::client
