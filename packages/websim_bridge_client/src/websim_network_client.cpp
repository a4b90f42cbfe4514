/**
 *************************************************************************
 *
 * @file websim_network_client.cpp
 *
 * Network communication with a websim endpoint, implementation.
 *
 ************************************************************************/


#include "websim_network_client.hpp"

#include <iostream>
#include <thread>
#include <utility>

#include <asio/error.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/uri.hpp>

#include <websim_bridge_share/exception.hpp>
#include <websim_bridge_share/websim_bridge_messages.hpp>


namespace websim_bridge
{
void check_ws_url(const std::string& url)
{
	const websocketpp::uri parsed(url);

	// Also rejects ports outside 1..65535.
	if (!parsed.get_valid())
		throw invalid_configuration_exception("Invalid endpoint address \"" + url + "\".");

	if (parsed.get_scheme() != "ws")
		throw invalid_configuration_exception("Endpoint address \"" + url + "\" must start with ws://.");

	if (parsed.get_host().empty())
		throw invalid_configuration_exception("Endpoint address \"" + url + "\" has no host.");
}


//////////////////////////////////////////////////////////////////////////
//
// websim_network_client
//
//////////////////////////////////////////////////////////////////////////


websim_network_client::websim_network_client
(std::string ws_url,
 connection_settings settings)
	: io_context_(new asio::io_context),
	  endpoint_(new websocket_client),

	  ws_url_(std::move(ws_url)),
	  settings_(settings)
{
	check_ws_url(ws_url_);

	// Failures are reported through exceptions and our own log lines.
	endpoint_->clear_access_channels(websocketpp::log::alevel::all);
	endpoint_->clear_error_channels(websocketpp::log::elevel::all);

	endpoint_->init_asio(io_context_.get());
	endpoint_->set_max_message_size(max_frame_size);

	endpoint_->set_socket_init_handler
	([](websocketpp::connection_hdl, asio::ip::tcp::socket& socket)
	{
		std::error_code error;
		socket.set_option(asio::ip::tcp::no_delay(true), error);
		if (error)
			std::cerr << "websim_network_client: Could not disable Nagle's algorithm: "
				<< error.message() << '\n';
	});
}


websim_network_client::~websim_network_client() noexcept
{
	drop_connection();
}


void websim_network_client::connect()
{
	if (connection_)
		throw already_connected_exception("Already connected to " + ws_url_ + ".");

	// Retry, so the endpoint may be started after the follower.
	for (int attempt = 1; attempt <= settings_.connect_attempts; ++attempt)
	{
		try
		{
			connect_once();

			std::cout << "websim_network_client::connect(): Connected to " << ws_url_ << ".\n";
			return;
		}
		catch (const std::system_error& exc)
		{
			std::cerr << "websim_network_client::connect(): Failed to connect ("
				<< attempt << "/" << settings_.connect_attempts << "): "
				<< exc.what() << '\n';
		}

		if (attempt < settings_.connect_attempts)
			std::this_thread::sleep_for(settings_.retry_delay);
	}

	throw connection_failed_exception("Cannot connect to endpoint at " + ws_url_ + ".");
}


void websim_network_client::disconnect()
{
	if (!connection_)
		throw not_connected_exception("Not connected.");

	if (is_open())
	{
		std::error_code error;
		connection_->close(websocketpp::close::status::normal, "follower disconnect", error);

		if (error)
			std::cerr << "websim_network_client::disconnect(): Closing the connection failed: "
				<< error.message() << '\n';
		else if (!run_until(
			[this] { return connection_->get_state() == websocketpp::session::state::closed; },
			settings_.attempt_timeout))
			std::cerr << "websim_network_client::disconnect(): "
				<< "The endpoint did not complete the closing handshake.\n";
	}

	drop_connection();
	std::cout << "websim_network_client::disconnect(): Disconnected.\n";
}


void websim_network_client::send(const std::string& payload)
{
	if (!connection_)
		throw not_connected_exception("Not connected.");

	// Picks up a close that arrived since the last call.
	io_context_->restart();
	io_context_->poll();

	std::error_code result;
	if (!is_open())
		result = asio::error::not_connected;
	else
		result = connection_->send(payload, websocketpp::frame::opcode::text);

	if (!result && !run_until(
		[this] { return !is_open() || connection_->get_buffered_amount() == 0; },
		settings_.send_timeout))
		result = asio::error::timed_out;

	if (!result && !is_open())
		result = asio::error::not_connected;

	if (result)
	{
		if (connection_->get_ec())
			result = connection_->get_ec();

		drop_connection();
		std::cerr << "websim_network_client::send(): Failed to send, dropping connection: "
			<< result.message() << '\n';
		throw transport_closed_exception("Failed to send frame: " + result.message());
	}
}


std::optional<std::string> websim_network_client::try_receive()
{
	if (!connection_)
		return std::nullopt;

	io_context_->restart();
	io_context_->poll();

	if (!inbox_.empty())
	{
		std::string payload = std::move(inbox_.front());
		inbox_.pop_front();
		return payload;
	}

	if (!is_open())
	{
		const auto close_code = connection_->get_remote_close_code();
		if (close_code != websocketpp::close::status::blank)
			std::cout << "websim_network_client::try_receive(): Connection closed by endpoint (code "
				<< close_code << ").\n";
		else
			std::cerr << "websim_network_client::try_receive(): Connection lost: "
				<< connection_->get_ec().message() << '\n';

		drop_connection();
	}

	return std::nullopt;
}


bool websim_network_client::is_connected() const noexcept
{
	return connection_ != nullptr;
}


const connection_settings& websim_network_client::settings() const noexcept
{
	return settings_;
}


const std::string& websim_network_client::ws_url() const noexcept
{
	return ws_url_;
}


void websim_network_client::connect_once()
{
	std::error_code error;
	const websocket_client::connection_ptr connection = endpoint_->get_connection(ws_url_, error);
	if (error)
		throw std::system_error(error);

	connection->set_open_handshake_timeout(static_cast<long>(
		std::chrono::duration_cast<std::chrono::milliseconds>(settings_.attempt_timeout).count()));

	connection->set_message_handler
	([this, owner = connection.get()]
	 (websocketpp::connection_hdl, websocket_client::message_ptr message)
	{
		// Late delivery for a dropped connection.
		if (owner != connection_.get())
			return;

		if (message->get_opcode() != websocketpp::frame::opcode::text)
		{
			std::cerr << "websim_network_client: Ignoring a binary message of "
				<< message->get_payload().size() << " bytes.\n";
			return;
		}

		inbox_.push_back(message->get_payload());
	});

	connection_ = connection;
	inbox_.clear();
	endpoint_->connect(connection);

	const bool settled = run_until(
		[this] { return connection_->get_state() != websocketpp::session::state::connecting; },
		settings_.attempt_timeout);

	if (settled && is_open())
		return;

	error = settled ? connection_->get_ec() : std::error_code(asio::error::timed_out);
	if (!error)
		error = asio::error::connection_refused;

	drop_connection();
	throw std::system_error(error);
}


bool websim_network_client::run_until
(const std::function<bool()>& done,
 std::chrono::duration<double> timeout)
{
	const auto deadline = std::chrono::steady_clock::now()
		+ std::chrono::duration_cast<std::chrono::steady_clock::duration>(timeout);

	io_context_->restart();
	while (!done())
	{
		// Nothing ran: the deadline passed or no work is left.
		if (io_context_->run_one_until(deadline) == 0)
			return done();
	}

	return true;
}


bool websim_network_client::is_open() const
{
	return connection_ && connection_->get_state() == websocketpp::session::state::open;
}


void websim_network_client::drop_connection() noexcept
{
	inbox_.clear();
	if (!connection_)
		return;

	const std::shared_ptr<websocket_client_connection> connection = std::move(connection_);

	// Aborts pending operations, so their handlers release the connection.
	std::error_code ignored;
	connection->get_raw_socket().close(ignored);

	try
	{
		io_context_->restart();
		io_context_->poll();
	}
	catch (const std::exception& exc)
	{
		std::cerr << "websim_network_client::drop_connection(): " << exc.what() << '\n';
	}
}
} /* namespace websim_bridge */
