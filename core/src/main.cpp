#include "oidc/client/authorize.hpp"
#include "oidc/client/configuration.hpp"
#include "oidc/client/log.hpp"
#include "oidc/client/login_result.hpp"
#include "oidc/client/oidc_client.hpp"
#include "oidc/client/version.hpp"

#include <boost/program_options.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <fstream>
#include <string>
#include <string_view>

// clang-format off
namespace po      = boost::program_options;
namespace logging = oidc::client::log;

using json = nlohmann::json;
// clang-format on

auto print_version_info() -> void
{
	namespace version = oidc::client::version;
	const std::string_view sha = version::sha;
	constexpr auto sha_size = 7;
	fmt::print("{} v{}-{}\n", version::binary_name, version::api_version, sha.substr(0, sha_size));
} // print_version_info

auto print_configuration_template() -> void
{
	fmt::print("{}", oidc::client::configuration_template());
} // print_configuration_template

auto print_usage() -> void
{
	fmt::print(R"_(oidc_client - Validates OpenID Connect authorization responses

Usage: oidc_client [OPTION]... CONFIG_FILE_PATH

CONFIG_FILE_PATH must point to a file containing a JSON structure containing
configuration options.

--dump-config-template can be used to generate a default configuration file.
See this option's description for more information.

Exactly one of --validate-response, --user-info or --refresh must be given
unless the program is asked to print information and exit. The result is
printed to stdout as JSON.

Options:
      --validate-response DATA
                     Validate DATA, the URL (or its query string or fragment)
                     the provider redirected the user agent to. Requires
                     --state-file.
      --state-file STATE_FILE_PATH
                     Path to a JSON file holding the state of the login
                     attempt. The object must contain [state],
                     [code_verifier] and [redirect_uri]. [nonce] is optional.
      --user-info ACCESS_TOKEN
                     Fetch the claims of the user owning ACCESS_TOKEN from the
                     UserInfo endpoint.
      --refresh REFRESH_TOKEN
                     Exchange REFRESH_TOKEN for new tokens.
      --dump-config-template
                     Print configuration template to stdout and exit. Some
                     options have values which act as placeholders. If used
                     to generate a configuration file, those options will
                     need to be updated.
  -h, --help         Display this help message and exit.
  -v, --version      Display version information and exit.

)_");

	print_version_info();
} // print_usage

auto set_log_level(const oidc::client::configuration& _config) -> void
{
	spdlog::set_level(logging::to_level(_config.log_level));
} // set_log_level

auto validate_response(const oidc::client::oidc_client& _client, const std::string& _data, const std::string& _state_file)
	-> int
{
	const auto state{oidc::client::authorize_state_from_json(json::parse(std::ifstream{_state_file}))};
	const auto result{_client.validate_response(_data, state)};

	fmt::print("{}\n", oidc::client::to_json(result).dump(4));

	return result.success() ? 0 : 1;
} // validate_response

auto get_user_info(const oidc::client::oidc_client& _client, const std::string& _access_token) -> int
{
	const auto response{_client.get_user_info(_access_token)};

	if (response.is_error) {
		fmt::print("{}\n", json{{"success", false}, {"error", response.error}}.dump(4));
		return 1;
	}

	auto claims{json::array()};
	for (const auto& c : response.claims) {
		claims.push_back({{"type", c.type}, {"value", c.value}});
	}

	fmt::print("{}\n", json{{"success", true}, {"claims", claims}}.dump(4));

	return 0;
} // get_user_info

auto refresh(const oidc::client::oidc_client& _client, const std::string& _refresh_token) -> int
{
	const auto response{_client.refresh_token(_refresh_token)};

	if (response.is_error) {
		// clang-format off
		fmt::print("{}\n", json{
			{"success", false},
			{"error", response.error},
			{"error_description", response.error_description},
			{"http_status", response.http_status}
		}.dump(4));
		// clang-format on
		return 1;
	}

	// clang-format off
	fmt::print("{}\n", json{
		{"success", true},
		{"access_token", response.access_token},
		{"identity_token", response.id_token},
		{"refresh_token", response.refresh_token},
		{"token_type", response.token_type},
		{"expires_in", response.expires_in.count()}
	}.dump(4));
	// clang-format on

	return 0;
} // refresh

auto main(int _argc, char* _argv[]) -> int
{
	po::options_description opts_desc{""};

	// clang-format off
	opts_desc.add_options()
		("config-file,f", po::value<std::string>(), "")
		("validate-response", po::value<std::string>(), "")
		("state-file", po::value<std::string>(), "")
		("user-info", po::value<std::string>(), "")
		("refresh", po::value<std::string>(), "")
		("dump-config-template", "")
		("help,h", "")
		("version,v", "");
	// clang-format on

	po::positional_options_description pod;
	pod.add("config-file", 1);

	try {
		po::variables_map vm;
		po::store(po::command_line_parser(_argc, _argv).options(opts_desc).positional(pod).run(), vm);
		po::notify(vm);

		if (vm.count("help") > 0) {
			print_usage();
			return 0;
		}

		if (vm.count("version") > 0) {
			print_version_info();
			return 0;
		}

		if (vm.count("dump-config-template") > 0) {
			print_configuration_template();
			return 0;
		}

		if (vm.count("config-file") == 0) {
			fmt::print(stderr, "Error: Missing [CONFIG_FILE_PATH] parameter.\n");
			return 1;
		}

		const auto operations = vm.count("validate-response") + vm.count("user-info") + vm.count("refresh");
		if (operations != 1) {
			fmt::print(stderr, "Error: Expected exactly one of --validate-response, --user-info or --refresh.\n");
			return 1;
		}

		if (vm.count("validate-response") > 0 && vm.count("state-file") == 0) {
			fmt::print(stderr, "Error: --validate-response requires --state-file.\n");
			return 1;
		}

		const auto config = oidc::client::load_configuration(
			json::parse(std::ifstream{vm["config-file"].as<std::string>()}));

		spdlog::set_pattern("[%Y-%m-%d %T.%e] [P:%P] [%^%l%$] [T:%t] %v");
		set_log_level(config);

		logging::trace("Initializing client.");
		const auto client = oidc::client::make_http_client(config);

		if (vm.count("validate-response") > 0) {
			return validate_response(
				*client, vm["validate-response"].as<std::string>(), vm["state-file"].as<std::string>());
		}

		if (vm.count("user-info") > 0) {
			return get_user_info(*client, vm["user-info"].as<std::string>());
		}

		return refresh(*client, vm["refresh"].as<std::string>());
	}
	catch (const std::exception& e) {
		fmt::print(stderr, "Error: {}\n", e.what());
	}

	return 1;
} // main
