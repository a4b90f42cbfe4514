/**
 *************************************************************************
 *
 * @file websim_follower.cpp
 *
 * Client side implementation of the websim bridge, implementation.
 *
 ************************************************************************/


#include "websim_follower.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include <websim_bridge_share/exception.hpp>
#include <websim_bridge_share/websim_bridge_util.hpp>


namespace websim_bridge
{
namespace
{
follower_config validated(follower_config config)
{
	config.validate();
	return config;
}


std::string join_names(const std::vector<std::string>& names)
{
	std::string joined;
	for (const auto& name : names)
		joined += (joined.empty() ? "" : ", ") + name;
	return joined;
}
}


//////////////////////////////////////////////////////////////////////////
//
// websim_follower
//
//////////////////////////////////////////////////////////////////////////


websim_follower::websim_follower
(follower_config config,
 std::function<void()> calibration)
	: config_(validated(std::move(config))),
	  lifecycle_(config_.kind, std::move(calibration)),
	  shaper_(config_.joint_names,
	          safety_limits(config_.joint_names, config_.max_relative_target,
	                        config_.joint_min, config_.joint_max)),
	  cache_(config_.joint_names),
	  connection_(std::make_unique<websim_network_client>
		  (config_.ws_url, config_.connection)),
	  seq_(0)
{
	if (config_.log_file_path)
	{
		trajectory_log_ = std::make_unique<logger>
			(*config_.log_file_path, config_.joint_names, 2, 3, 0);
		start_trajectory_log();
	}
}


websim_follower::~websim_follower() noexcept
{
	stop_trajectory_log();
}


void websim_follower::connect(bool calibrate)
{
	if (connection_->is_connected())
		throw already_connected_exception("websim_follower is already connected.");

	if (calibrate && !lifecycle_.is_calibrated())
		lifecycle_.calibrate();

	connection_->connect();
	lifecycle_.configure();

	if (trajectory_log_ && !trajectory_log_->logging())
		start_trajectory_log();

	std::cout << "websim_follower::connect(): Connected to "
		<< config_.ws_url << ".\n";
}


void websim_follower::disconnect()
{
	connection_->disconnect();
	stop_trajectory_log();

	std::cout << "websim_follower::disconnect(): Disconnected.\n";
}


bool websim_follower::is_connected() const noexcept
{
	return connection_->is_connected();
}


observation_snapshot websim_follower::observe()
{
	if (const auto payload = connection_->try_receive())
	{
		const decoded_frame frame = decode_frame(*payload);
		if (const auto* state = std::get_if<state_frame>(&frame))
			cache_.update(*state);
	}

	return cache_.snapshot();
}


act_result websim_follower::act(const joint_targets& target)
{
	const observation_snapshot previous = cache_.snapshot();
	const shape_result shaped = shaper_.shape(target, previous.positions);

	if (shaped.empty_target)
		std::cerr << "websim_follower::act(): Target is empty, holding the current pose. "
			"Action keys must end with \"" << websim_bridge_util::position_suffix << "\".\n";

	if (!shaped.ignored_joints.empty())
		std::cerr << "websim_follower::act(): Ignoring unknown joints: "
			<< join_names(shaped.ignored_joints) << ".\n";

	command_joint_position command;
	command.seq = ++seq_;
	command.names = config_.joint_names;
	command.target = websim_bridge_util::convert_to_std_vector(shaped.goal);
	command.timestamp = websim_bridge_util::wall_clock_seconds();

	log_command(command, shaped);

	bool delivered = false;
	try
	{
		connection_->send(encode_frame(command));
		delivered = true;
	}
	catch (const not_connected_exception& exc)
	{
		std::cerr << "websim_follower::act(): Command #" << command.seq
			<< " not sent: " << exc.what() << '\n';
	}
	catch (const transport_closed_exception& exc)
	{
		std::cerr << "websim_follower::act(): Command #" << command.seq
			<< " not sent: " << exc.what() << '\n';
	}

	// Assumed applied until telemetry arrives, also if it was never sent.
	cache_.assume(shaped.goal, command.timestamp);
	log_trajectory(command, delivered);

	act_result result;
	result.goal.names = config_.joint_names;
	result.goal.positions = shaped.goal;
	result.goal.timestamp = command.timestamp;
	result.seq = command.seq;
	result.delivered = delivered;
	result.empty_target = shaped.empty_target;
	return result;
}


act_result websim_follower::send_action(const std::map<std::string, double>& action)
{
	const std::string_view suffix = websim_bridge_util::position_suffix;

	joint_targets target;
	for (const auto& [key, value] : action)
	{
		if (key.size() > suffix.size() && key.ends_with(suffix))
			target[key.substr(0, key.size() - suffix.size())] = value;
	}

	return act(target);
}


observation_snapshot websim_follower::confirmed_observation() const
{
	return cache_.confirmed_snapshot();
}


std::vector<std::string> websim_follower::action_features() const
{
	std::vector<std::string> features;
	features.reserve(config_.joint_names.size());
	for (const auto& name : config_.joint_names)
		features.push_back(name + std::string(websim_bridge_util::position_suffix));
	return features;
}


std::vector<std::string> websim_follower::observation_features() const
{
	std::vector<std::string> features = action_features();
	features.emplace_back("timestamp");
	return features;
}


const follower_config& websim_follower::config() const noexcept
{
	return config_;
}


follower_lifecycle& websim_follower::lifecycle() noexcept
{
	return lifecycle_;
}


std::uint64_t websim_follower::last_sequence() const noexcept
{
	return seq_;
}


void websim_follower::log_command
(const command_joint_position& command,
 const shape_result& shaped)
{
	const auto now = std::chrono::steady_clock::now();
	if (command.seq > always_logged_commands_ && now - last_send_log_ < send_log_interval_)
		return;
	last_send_log_ = now;

	std::ostringstream line;
	line << std::fixed << std::setprecision(3) << std::showpos;
	for (std::size_t i = 0; i < command.target.size() && i < 3; ++i)
		line << (i == 0 ? "" : ", ") << command.target[i];
	if (command.target.size() > 3)
		line << ", ...";

	std::cout << "websim_follower::act(): Sending command #" << command.seq
		<< " [" << line.str() << "]";
	if (!shaped.clamped_joints.empty())
		std::cout << ", clamped: " << join_names(shaped.clamped_joints);
	std::cout << '\n';
}


void websim_follower::log_trajectory
(const command_joint_position& command,
 bool delivered)
{
	if (!trajectory_log_ || !trajectory_log_->logging())
		return;

	trajectory_log_->add_joint_data(websim_bridge_util::convert_to_eigen(command.target));
	trajectory_log_->add_joint_data(cache_.confirmed_snapshot().positions);
	trajectory_log_->add_single_data(static_cast<double>(command.seq));
	trajectory_log_->add_single_data(command.timestamp);
	trajectory_log_->add_single_data(delivered ? 1. : 0.);

	try
	{
		trajectory_log_->log();
	}
	catch (const std::ios_base::failure& exc)
	{
		std::cerr << "websim_follower::log_trajectory(): Could not write "
			<< *config_.log_file_path << ", " << trajectory_log_->buffered_rows()
			<< " rows pending: " << exc.what() << '\n';
	}
}


void websim_follower::start_trajectory_log()
{
	trajectory_log_->start_logging
		({"commanded", "observed"}, {"seq", "timestamp", "delivered"}, {});
}


void websim_follower::stop_trajectory_log() noexcept
{
	if (!trajectory_log_)
		return;

	try
	{
		trajectory_log_->stop_logging();
	}
	catch (const std::exception& exc)
	{
		std::cerr << "websim_follower::stop_trajectory_log(): Could not write "
			<< *config_.log_file_path << ": " << exc.what() << '\n';
	}
}
} /* namespace websim_bridge */
