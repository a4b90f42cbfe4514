/**
 *************************************************************************
 *
 * @file websim_endpoint_server.cpp
 *
 * Reference endpoint for websim followers, implementation.
 *
 ************************************************************************/


#include "websim_endpoint_server.hpp"

#include <iostream>
#include <system_error>
#include <utility>

#include <asio/ip/tcp.hpp>

#include <websim_bridge_share/exception.hpp>
#include <websim_bridge_share/websim_bridge_messages.hpp>


namespace websim_bridge
{
namespace
{
std::chrono::steady_clock::duration publish_period_of(double rate_hz)
{
	if (!(rate_hz > 0.))
		throw invalid_configuration_exception("The publish rate must be positive.");

	return std::chrono::duration_cast<std::chrono::steady_clock::duration>
		(std::chrono::duration<double>(1. / rate_hz));
}


std::vector<std::string> checked_joint_names(std::vector<std::string> joint_names)
{
	if (joint_names.empty())
		throw invalid_configuration_exception("At least one joint name is required.");

	return joint_names;
}
}


//////////////////////////////////////////////////////////////////////////
//
// websim_endpoint_server
//
//////////////////////////////////////////////////////////////////////////


websim_endpoint_server::websim_endpoint_server
	(const std::string& ip,
	 std::uint16_t port,
	 std::vector<std::string> joint_names,
	 double rate_hz)
	:
	joint_names_(checked_joint_names(std::move(joint_names))),
	publish_period_(publish_period_of(rate_hz)),
	port_(0)
{
	// Sessions log connects, disconnects and rejected frames themselves.
	server_.clear_access_channels(websocketpp::log::alevel::all);
	server_.clear_error_channels(websocketpp::log::elevel::all);

	server_.init_asio(&io_context_);
	server_.set_reuse_addr(true);
	server_.set_max_message_size(max_frame_size);

	server_.set_socket_init_handler
		([](websocketpp::connection_hdl, asio::ip::tcp::socket& socket)
	{
		std::error_code error;
		socket.set_option(asio::ip::tcp::no_delay(true), error);
		if (error)
			std::cerr << "websim_endpoint_server: Could not disable Nagle's algorithm: "
				<< error.message() << '\n';
	});

	server_.set_open_handler([this](websocketpp::connection_hdl connection) { on_open(std::move(connection)); });
	server_.set_message_handler
		([this](websocketpp::connection_hdl connection, websocket_server::message_ptr message)
	{
		on_message(std::move(connection), std::move(message));
	});
	server_.set_close_handler([this](websocketpp::connection_hdl connection) { on_close(std::move(connection)); });
	server_.set_fail_handler([this](websocketpp::connection_hdl connection) { on_fail(std::move(connection)); });

	port_ = listen(ip, port);
	server_.start_accept();

	internal_thread_ = std::thread([this] { task_main(); });
}


websim_endpoint_server::~websim_endpoint_server() noexcept
{
	// Open connections are cut without closing handshake.
	io_context_.stop();
	try { internal_thread_.join(); }
	catch (const std::system_error& exc)
	{
		std::cerr << "websim_endpoint_server::~websim_endpoint_server(): " <<
			"Joining the internal thread failed: " << exc.what() << '\n';
	}
}


std::uint16_t websim_endpoint_server::port() const noexcept
{
	return port_;
}


std::size_t websim_endpoint_server::session_count() const
{
	std::lock_guard<std::mutex> state_guard(sessions_lock_);
	return sessions_.size();
}


void websim_endpoint_server::task_main()
{
	while (true)
	{
		try
		{
			// Returns once stopped by the destructor.
			io_context_.run();
			return;
		}
		catch (const std::exception& exc)
		{
			std::cerr << "websim_endpoint_server::task_main(): " <<
				"A session handler threw, continuing. " <<
				"Exception message: " << exc.what() << '\n';
		}
	}
}


void websim_endpoint_server::on_open(websocketpp::connection_hdl connection)
{
	auto session = std::make_shared<websim_endpoint_session>
		(server_, connection, joint_names_, publish_period_);

	{
		std::lock_guard<std::mutex> state_guard(sessions_lock_);
		sessions_[connection] = session;
	}

	session->start();
}


void websim_endpoint_server::on_message
	(websocketpp::connection_hdl connection,
	 websocket_server::message_ptr message)
{
	if (const auto session = find_session(connection))
		session->ingest(message);
}


void websim_endpoint_server::on_close(websocketpp::connection_hdl connection)
{
	std::shared_ptr<websim_endpoint_session> session;
	{
		std::lock_guard<std::mutex> state_guard(sessions_lock_);
		const auto entry = sessions_.find(connection);
		if (entry == sessions_.end())
			return;

		session = std::move(entry->second);
		sessions_.erase(entry);
	}

	std::string reason = "connection closed";
	std::error_code error;
	const websocket_server::connection_ptr con = server_.get_con_from_hdl(connection, error);
	if (!error)
	{
		if (con->get_remote_close_code() != websocketpp::close::status::blank)
			reason = "close code " + std::to_string(con->get_remote_close_code());
		else if (con->get_ec())
			reason = con->get_ec().message();
	}

	session->stop(reason);
}


void websim_endpoint_server::on_fail(websocketpp::connection_hdl connection)
{
	std::error_code error;
	const websocket_server::connection_ptr con = server_.get_con_from_hdl(connection, error);

	std::cerr << "websim_endpoint_server::on_fail(): WebSocket handshake with "
		<< (error ? std::string("unknown peer") : con->get_remote_endpoint()) << " failed: "
		<< (error ? error.message() : con->get_ec().message()) << '\n';
}


std::uint16_t websim_endpoint_server::listen
	(const std::string& ip, std::uint16_t port)
{
	server_.listen(asio::ip::tcp::endpoint(asio::ip::make_address(ip), port));

	std::error_code error;
	const asio::ip::tcp::endpoint local = server_.get_local_endpoint(error);
	if (error)
		throw std::system_error(error, "Cannot determine the bound port");

	std::cout << "websim_endpoint_server::listen(): Listening on ws://"
		<< ip << ":" << local.port() << ".\n";

	return local.port();
}


std::shared_ptr<websim_endpoint_session> websim_endpoint_server::find_session
	(const websocketpp::connection_hdl& connection) const
{
	std::lock_guard<std::mutex> state_guard(sessions_lock_);
	const auto entry = sessions_.find(connection);
	return entry == sessions_.end() ? nullptr : entry->second;
}


} /* namespace websim_bridge */
