/**
 *************************************************************************
 *
 * @file websim_endpoint_session.cpp
 *
 * One follower connection of a websim_endpoint_server, implementation.
 *
 ************************************************************************/


#include "websim_endpoint_session.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <websim_bridge_share/websim_bridge_messages.hpp>
#include <websim_bridge_share/websim_bridge_util.hpp>


namespace websim_bridge
{


//////////////////////////////////////////////////////////////////////////
//
// websim_endpoint_session
//
//////////////////////////////////////////////////////////////////////////


websim_endpoint_session::websim_endpoint_session
	(websocket_server& server,
	 websocketpp::connection_hdl connection,
	 std::vector<std::string> joint_names,
	 std::chrono::steady_clock::duration publish_period)
	:
	server_(server),
	connection_(std::move(connection)),
	publish_timer_(server.get_io_service()),

	state_(std::move(joint_names)),

	publish_period_(publish_period),
	next_publish_(),
	stopped_(false)
{
	std::error_code error;
	const websocket_server::connection_ptr con = server_.get_con_from_hdl(connection_, error);
	remote_ = error ? std::string("unknown peer") : con->get_remote_endpoint();
}


void websim_endpoint_session::start()
{
	std::cout << "websim_endpoint_session::start(): Follower connected from " << remote_ << ".\n";

	// First state frame goes out right away.
	next_publish_ = std::chrono::steady_clock::now() - publish_period_;
	schedule_publish();
}


void websim_endpoint_session::ingest(const websocket_server::message_ptr& message)
{
	if (message->get_opcode() != websocketpp::frame::opcode::text)
	{
		std::cerr << "websim_endpoint_session::ingest(): Ignoring binary message from "
			<< remote_ << ".\n";
		return;
	}

	const ingest_result result = state_.ingest(message->get_payload());

	if (result != ingest_result::applied)
	{
		std::cerr << "websim_endpoint_session::ingest(): Rejected frame from "
			<< remote_ << " (" << to_string(result) << ").\n";
		return;
	}

	const auto now = std::chrono::steady_clock::now();
	if (now - last_ingest_log_ < ingest_log_interval_)
		return;
	last_ingest_log_ = now;

	std::cout << "websim_endpoint_session::ingest(): Applied command #"
		<< state_.last_applied_seq() << " from " << remote_ << ".\n";
}


void websim_endpoint_session::stop(const std::string& reason)
{
	if (stopped_)
		return;
	stopped_ = true;

	publish_timer_.cancel();

	std::cout << "websim_endpoint_session::stop(): Follower at " << remote_
		<< " disconnected (" << reason << ").\n";
}


void websim_endpoint_session::schedule_publish()
{
	// Do not try to catch up on missed periods.
	const auto now = std::chrono::steady_clock::now();
	next_publish_ = std::max(next_publish_ + publish_period_, now);

	publish_timer_.expires_at(next_publish_);
	publish_timer_.async_wait
		([self = shared_from_this()](const std::error_code& error)
	{
		// Only fails if the timer was cancelled by stop().
		if (error || self->stopped_)
			return;

		self->publish();
	});
}


void websim_endpoint_session::publish()
{
	std::error_code error;
	const websocket_server::connection_ptr con = server_.get_con_from_hdl(connection_, error);
	if (error)
	{
		close("publish", error);
		return;
	}

	// Skip periods while a slow follower has not taken the previous frames.
	if (con->get_buffered_amount() < max_frame_size)
	{
		error = con->send
			(encode_frame(state_.publish(websim_bridge_util::wall_clock_seconds())),
			 websocketpp::frame::opcode::text);

		if (error)
		{
			close("publish", error);
			return;
		}
	}

	schedule_publish();
}


void websim_endpoint_session::close
	(const char* task,
	 const std::error_code& error)
{
	std::cerr << "websim_endpoint_session::close(): Connection error in " << task
		<< " (" << error.message() << "), dropping " << remote_ << ".\n";

	// Fails if the connection is closing already, which is not worth reporting.
	std::error_code close_error;
	server_.close(connection_, websocketpp::close::status::internal_endpoint_error, task, close_error);

	stop(error.message());
}


} /* namespace websim_bridge */
