#ifndef INCLUDED__WEBSIM_BRIDGE_ENDPOINT__WEBSIM_ENDPOINT_SESSION_HPP
#define INCLUDED__WEBSIM_BRIDGE_ENDPOINT__WEBSIM_ENDPOINT_SESSION_HPP
/**
 *************************************************************************
 *
 * @file websim_endpoint_session.hpp
 *
 * One follower connection of a websim_endpoint_server.
 *
 ************************************************************************/



#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <asio/steady_timer.hpp>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "endpoint_joint_state.hpp"


namespace websim_bridge
{


using websocket_server = websocketpp::server<websocketpp::config::asio>;


/**
 *************************************************************************
 *
 * @class websim_endpoint_session
 *
 * Joint state of one WebSocket connection plus its two duties:
 * - ingest: applies valid commands received from the follower to q,
 * - publish: sends the current q as state frame at a fixed period.
 *
 * Received messages are handed in by the server. The publish chain
 * keeps the session alive until stop() is called.
 *
 * All member functions must run on the server's io_context thread.
 *
 ************************************************************************/
class websim_endpoint_session
	: public std::enable_shared_from_this<websim_endpoint_session>
{
public:

	websim_endpoint_session
		(websocket_server& server,
		 websocketpp::connection_hdl connection,
		 std::vector<std::string> joint_names,
		 std::chrono::steady_clock::duration publish_period);


	/**
	 * Starts publishing. Must be called on a shared_ptr owned session.
	 */
	void start();


	void ingest(const websocket_server::message_ptr& message);


	/**
	 * Ends the publish chain. Called once the connection is closed.
	 */
	void stop(const std::string& reason);


private:

	void schedule_publish();
	void publish();

	// Asks websocketpp to close the connection; stop() follows from the close handler.
	void close(const char* task, const std::error_code& error);


	websocket_server& server_;
	const websocketpp::connection_hdl connection_;
	asio::steady_timer publish_timer_;
	std::string remote_;

	endpoint_joint_state state_;

	const std::chrono::steady_clock::duration publish_period_;
	std::chrono::steady_clock::time_point next_publish_;
	bool stopped_;

	std::chrono::steady_clock::time_point last_ingest_log_;

	static constexpr std::chrono::seconds ingest_log_interval_{1};
};


} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_ENDPOINT__WEBSIM_ENDPOINT_SESSION_HPP
