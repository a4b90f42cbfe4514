#ifndef INCLUDED__WEBSIM_BRIDGE_CLIENT__WEBSIM_NETWORK_CLIENT_HPP
#define INCLUDED__WEBSIM_BRIDGE_CLIENT__WEBSIM_NETWORK_CLIENT_HPP
/**
 *************************************************************************
 *
 * @file websim_network_client.hpp
 *
 * Network communication with a websim endpoint.
 *
 ************************************************************************/

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include <websim_bridge_share/websocket_forward.hpp>


namespace websim_bridge
{
/**
 * Retry budget and timeouts of a websim_network_client.
 */
struct connection_settings
{
	int connect_attempts = 10;
	std::chrono::duration<double> attempt_timeout{2.0};
	std::chrono::duration<double> retry_delay{0.5};
	std::chrono::duration<double> send_timeout{1.0};
};


/**
 * Accepts plain "ws://host[:port][/path]" addresses with a port
 * in 1..65535.
 *
 * @throw invalid_configuration_exception otherwise.
 */
void check_ws_url(const std::string& url);


/**
 *************************************************************************
 *
 * @class websim_network_client
 *
 * Owns the WebSocket connection to a websim endpoint and exchanges
 * text messages over it, one JSON frame per message.
 *
 * Usage notes:
 * - The connection is only established by connect(), never implicitly.
 * - Any transport failure drops the connection; a new connect() is
 *		required before further sends.
 * - There is no background thread. The connection only makes progress
 *		inside connect(), disconnect(), send() and try_receive(), which
 *		must all be called from the same thread.
 *
 ************************************************************************/
class websim_network_client
{
public:
	/**
	 * @throw invalid_configuration_exception if ws_url is not accepted
	 *		by check_ws_url().
	 */
	websim_network_client(
		std::string ws_url,
		connection_settings settings = {});

	~websim_network_client() noexcept;


	/**
	 * Connects to the endpoint, retrying up to connect_attempts times.
	 *
	 * @throw already_connected_exception if a connection exists; it is left untouched.
	 * @throw connection_failed_exception if all attempts failed.
	 */
	void connect();


	/**
	 * Closes the connection. The connection is dropped even if closing fails.
	 *
	 * @throw not_connected_exception if there is no connection.
	 */
	void disconnect();


	/**
	 * Sends one text message and waits at most send_timeout until it
	 * is written.
	 *
	 * @throw not_connected_exception if there is no connection.
	 * @throw transport_closed_exception if the connection was closed, lost
	 *		or timed out; the connection is dropped in that case.
	 */
	void send(const std::string& payload);


	/**
	 * Returns the next received text message, or std::nullopt if none
	 * is available. Never waits.
	 *
	 * A lost connection is dropped silently and reported as std::nullopt,
	 * after all messages received before have been returned.
	 */
	std::optional<std::string> try_receive();


	[[nodiscard]] bool is_connected() const noexcept;

	[[nodiscard]] const connection_settings& settings() const noexcept;

	[[nodiscard]] const std::string& ws_url() const noexcept;

private:
	void connect_once();

	/**
	 * Runs the io_context until done returns true, the timeout has passed
	 * or nothing is left to do. Returns done().
	 */
	bool run_until(
		const std::function<bool()>& done,
		std::chrono::duration<double> timeout);

	[[nodiscard]] bool is_open() const;

	void drop_connection() noexcept;


	std::unique_ptr<asio::io_context> io_context_;
	std::unique_ptr<websocket_client> endpoint_;

	const std::string ws_url_;
	const connection_settings settings_;

	std::shared_ptr<websocket_client_connection> connection_;

	std::deque<std::string> inbox_;
};
}

#endif // INCLUDED__WEBSIM_BRIDGE_CLIENT__WEBSIM_NETWORK_CLIENT_HPP
