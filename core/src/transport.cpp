#include "oidc/client/transport.hpp"

#include "oidc/client/common.hpp"
#include "oidc/client/log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <openssl/err.h>

#include <stdexcept>
#include <utility>

// clang-format off
namespace beast = boost::beast; // from <boost/beast.hpp>
namespace net   = boost::asio;  // from <boost/asio.hpp>
// clang-format on

namespace oidc::client
{
	namespace
	{
		auto make_secure_context(const std::string& _tls_certificates_directory) -> net::ssl::context
		{
			net::ssl::context ctx{net::ssl::context::tlsv12_client};

			ctx.add_verify_path(_tls_certificates_directory);
			ctx.set_verify_mode(net::ssl::verify_peer);

			return ctx;
		} // make_secure_context
	} // anonymous namespace

	transport::transport(net::io_context& _ctx, std::chrono::seconds _timeout)
		: io_ctx_{_ctx}
		, timeout_{_timeout}
	{
	}

	auto transport::exchange(const std::string& _host, const std::string& _port, request_type& _request)
		-> response_type
	{
		net::ip::tcp::resolver resolver{io_ctx_};
		const auto endpoints{resolver.resolve(_host, _port)};

		open(_host, endpoints);
		auto res{write_then_read(_request)};
		close();

		return res;
	} // exchange

	auto transport::timeout() const noexcept -> std::chrono::seconds
	{
		return timeout_;
	}

	// Runs a single asynchronous operation to completion. A deadline set on the stream with
	// expires_after() cancels it, which surfaces as beast::error::timeout.
	template <typename Initiation>
	auto transport::run_until_complete(Initiation&& _initiate) -> void
	{
		beast::error_code ec;
		std::forward<Initiation>(_initiate)([&ec](beast::error_code _ec, auto&&...) { ec = _ec; });

		io_ctx_.restart();
		io_ctx_.run();

		if (ec) {
			throw beast::system_error{ec};
		}
	} // run_until_complete

	plain_transport::plain_transport(net::io_context& _ctx, std::chrono::seconds _timeout)
		: transport{_ctx, _timeout}
		, stream_{_ctx}
	{
	}

	auto plain_transport::open(const std::string&, const net::ip::tcp::resolver::results_type& _endpoints) -> void
	{
		stream_.expires_after(timeout());
		run_until_complete([&](auto&& _handler) { stream_.async_connect(_endpoints, std::move(_handler)); });
	}

	auto plain_transport::write_then_read(request_type& _request) -> response_type
	{
		stream_.expires_after(timeout());
		run_until_complete([&](auto&& _handler) { beast::http::async_write(stream_, _request, std::move(_handler)); });

		beast::flat_buffer buffer;
		response_type res;

		stream_.expires_after(timeout());
		run_until_complete([&](auto&& _handler) { beast::http::async_read(stream_, buffer, res, std::move(_handler)); });

		return res;
	} // write_then_read

	auto plain_transport::close() noexcept -> void
	{
		beast::error_code ec;
		stream_.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
	}

	tls_transport::tls_transport(net::io_context& _ctx, const transport_options& _options)
		: transport{_ctx, _options.timeout}
		, secure_ctx_{make_secure_context(_options.tls_certificates_directory)}
		, stream_{_ctx, secure_ctx_}
	{
	}

	auto tls_transport::bind_to_host(const std::string& _host) -> void
	{
		// Many hosts need SNI to handshake successfully.
		if (!SSL_set_tlsext_host_name(stream_.native_handle(), _host.c_str())) {
			beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
			throw beast::system_error{ec};
		}

		// A certificate chaining to a trusted CA is not enough. It must also name the provider.
		stream_.set_verify_callback(net::ssl::host_name_verification{_host});
	} // bind_to_host

	auto tls_transport::native_handle() -> SSL*
	{
		return stream_.native_handle();
	}

	auto tls_transport::open(const std::string& _host, const net::ip::tcp::resolver::results_type& _endpoints) -> void
	{
		bind_to_host(_host);

		auto& tcp{beast::get_lowest_layer(stream_)};

		tcp.expires_after(timeout());
		run_until_complete([&](auto&& _handler) { tcp.async_connect(_endpoints, std::move(_handler)); });

		tcp.expires_after(timeout());
		run_until_complete(
			[&](auto&& _handler) { stream_.async_handshake(net::ssl::stream_base::client, std::move(_handler)); });
	} // open

	auto tls_transport::write_then_read(request_type& _request) -> response_type
	{
		auto& tcp{beast::get_lowest_layer(stream_)};

		tcp.expires_after(timeout());
		run_until_complete([&](auto&& _handler) { beast::http::async_write(stream_, _request, std::move(_handler)); });

		beast::flat_buffer buffer;
		response_type res;

		tcp.expires_after(timeout());
		run_until_complete([&](auto&& _handler) { beast::http::async_read(stream_, buffer, res, std::move(_handler)); });

		return res;
	} // write_then_read

	auto tls_transport::close() noexcept -> void
	{
		// No close_notify exchange. The response has been read in full.
		beast::error_code ec;
		beast::get_lowest_layer(stream_).socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
	}

	auto transport_factory(const boost::urls::scheme& _scheme, net::io_context& _ctx, const transport_options& _options)
		-> std::unique_ptr<transport>
	{
		if (_scheme == boost::urls::scheme::http) {
			return std::make_unique<plain_transport>(_ctx, _options.timeout);
		}

		if (_scheme == boost::urls::scheme::https) {
			return std::make_unique<tls_transport>(_ctx, _options);
		}

		throw std::invalid_argument{"Scheme is not supported."};
	} // transport_factory

	auto send_request(boost::urls::url_view _url, request_type& _request, const transport_options& _options)
		-> response_type
	{
		const auto port{get_port_from_url(_url)};

		if (!port) {
			throw std::invalid_argument{"Cannot deduce port from url."};
		}

		net::io_context io_ctx;

		auto conn{transport_factory(_url.scheme_id(), io_ctx, _options)};
		auto res{conn->exchange(std::string{_url.host()}, *port, _request)};

		log::debug("{}: Received response with status [{}].", __func__, res.result_int());

		return res;
	} // send_request
} // namespace oidc::client
