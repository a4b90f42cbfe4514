#ifndef INCLUDED__WEBSIM_BRIDGE_ENDPOINT__WEBSIM_ENDPOINT_SERVER_HPP
#define INCLUDED__WEBSIM_BRIDGE_ENDPOINT__WEBSIM_ENDPOINT_SERVER_HPP
/**
 *************************************************************************
 *
 * @file websim_endpoint_server.hpp
 *
 * Reference endpoint for websim followers.
 *
 ************************************************************************/



#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>

#include "websim_endpoint_session.hpp"


namespace websim_bridge
{


/**
 *************************************************************************
 *
 * @class websim_endpoint_server
 *
 * WebSocket server accepting any number of followers. Each connection
 * gets its own websim_endpoint_session with its own joint state,
 * starting at zero.
 *
 * All sessions run on one io_context, driven by an internal thread
 * that lives as long as the server.
 *
 ************************************************************************/
class websim_endpoint_server
{
public:

	static constexpr double default_rate_hz = 60.;


	/**
	 * Starts listening immediately. Port 0 picks a free port.
	 *
	 * @throw invalid_configuration_exception on an empty joint schema
	 *		or a non-positive rate.
	 * @throw websocketpp::exception if ip:port cannot be bound.
	 */
	websim_endpoint_server
		(const std::string& ip,
		 std::uint16_t port,
		 std::vector<std::string> joint_names,
		 double rate_hz = default_rate_hz);

	~websim_endpoint_server() noexcept;


	// Port actually bound.
	[[nodiscard]] std::uint16_t port() const noexcept;

	// Number of open follower connections.
	[[nodiscard]] std::size_t session_count() const;


private:

	void task_main();

	void on_open(websocketpp::connection_hdl connection);
	void on_message(websocketpp::connection_hdl connection, websocket_server::message_ptr message);
	void on_close(websocketpp::connection_hdl connection);
	void on_fail(websocketpp::connection_hdl connection);

	std::uint16_t listen(const std::string& ip, std::uint16_t port);

	std::shared_ptr<websim_endpoint_session> find_session
		(const websocketpp::connection_hdl& connection) const;


	const std::vector<std::string> joint_names_;
	const std::chrono::steady_clock::duration publish_period_;

	asio::io_context io_context_;
	websocket_server server_;
	std::uint16_t port_;

	mutable std::mutex sessions_lock_;
	std::map<websocketpp::connection_hdl,
		std::shared_ptr<websim_endpoint_session>,
		std::owner_less<websocketpp::connection_hdl>> sessions_;

	std::thread internal_thread_;
};


} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_ENDPOINT__WEBSIM_ENDPOINT_SERVER_HPP
