#ifndef OIDC_CLIENT_TRANSPORT_HPP
#define OIDC_CLIENT_TRANSPORT_HPP

#include "oidc/client/common.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/url/scheme.hpp>
#include <boost/url/url_view.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace oidc::client
{
	struct transport_options
	{
		std::string tls_certificates_directory;
		std::chrono::seconds timeout{30};
	}; // struct transport_options

	// One request, one connection. Every network step is bounded by the timeout.
	class transport
	{
	  public:
		transport(boost::asio::io_context& _ctx, std::chrono::seconds _timeout);
		virtual ~transport() = default;

		auto exchange(const std::string& _host, const std::string& _port, request_type& _request) -> response_type;

	  protected:
		auto timeout() const noexcept -> std::chrono::seconds;

		template <typename Initiation>
		auto run_until_complete(Initiation&& _initiate) -> void;

	  private:
		virtual auto open(const std::string& _host, const boost::asio::ip::tcp::resolver::results_type& _endpoints)
			-> void = 0;
		virtual auto write_then_read(request_type& _request) -> response_type = 0;
		virtual auto close() noexcept -> void = 0;

		boost::asio::io_context& io_ctx_;
		std::chrono::seconds timeout_;
	}; // class transport

	class plain_transport : public transport
	{
	  public:
		plain_transport(boost::asio::io_context& _ctx, std::chrono::seconds _timeout);

	  private:
		auto open(const std::string& _host, const boost::asio::ip::tcp::resolver::results_type& _endpoints)
			-> void override;
		auto write_then_read(request_type& _request) -> response_type override;
		auto close() noexcept -> void override;

		boost::beast::tcp_stream stream_;
	}; // class plain_transport

	class tls_transport : public transport
	{
	  public:
		tls_transport(boost::asio::io_context& _ctx, const transport_options& _options);

		// Sets SNI and requires the peer certificate to be issued for _host.
		auto bind_to_host(const std::string& _host) -> void;

		auto native_handle() -> SSL*;

	  private:
		auto open(const std::string& _host, const boost::asio::ip::tcp::resolver::results_type& _endpoints)
			-> void override;
		auto write_then_read(request_type& _request) -> response_type override;
		auto close() noexcept -> void override;

		boost::asio::ssl::context secure_ctx_;
		boost::beast::ssl_stream<boost::beast::tcp_stream> stream_;
	}; // class tls_transport

	/// \throws std::invalid_argument if the scheme is neither http nor https.
	auto transport_factory(
		const boost::urls::scheme& _scheme,
		boost::asio::io_context& _ctx,
		const transport_options& _options) -> std::unique_ptr<transport>;

	auto send_request(boost::urls::url_view _url, request_type& _request, const transport_options& _options)
		-> response_type;
} // namespace oidc::client

#endif // OIDC_CLIENT_TRANSPORT_HPP
