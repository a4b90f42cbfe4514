#ifndef INCLUDED__WEBSIM_BRIDGE_CLIENT__WEBSIM_FOLLOWER_HPP
#define INCLUDED__WEBSIM_BRIDGE_CLIENT__WEBSIM_FOLLOWER_HPP
/**
 *************************************************************************
 *
 * @file websim_follower.hpp
 *
 * Client side implementation of the websim bridge.
 *
 ************************************************************************/


#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <websim_bridge_share/websim_bridge_logger.hpp>
#include <websim_bridge_share/websim_bridge_messages.hpp>

#include "command_shaper.hpp"
#include "follower_config.hpp"
#include "follower_lifecycle.hpp"
#include "observation_cache.hpp"
#include "websim_network_client.hpp"


namespace websim_bridge
{
/**
 * Outcome of websim_follower::act().
 */
struct act_result
{
	// Shaped goal, as assumed applied.
	observation_snapshot goal;
	std::uint64_t seq = 0;

	// False if the command could not be sent; the channel is down then.
	bool delivered = false;

	// The target contained no joints, so the goal holds the previous pose.
	bool empty_target = false;
};


/**
 *************************************************************************
 *
 * @class websim_follower
 *
 * Streams joint position commands to a websim endpoint and caches the
 * joint states it publishes.
 *
 * Usage notes:
 * - Call observe() and act() from the control loop; neither blocks
 *		longer than the configured send timeout.
 * - A lost connection does not throw from act(). It is reported via
 *		act_result::delivered and is_connected(); reconnecting is up to
 *		the caller.
 * - After act(), the cache assumes the shaped goal was applied until
 *		telemetry says otherwise. confirmed_observation() only reflects
 *		telemetry.
 *
 ************************************************************************/
class websim_follower
{
public:
	/**
	 * @throw invalid_configuration_exception if the configuration is invalid.
	 */
	explicit websim_follower(
		follower_config config,
		std::function<void()> calibration = {});

	~websim_follower() noexcept;


	/**
	 * Connects to the endpoint. If calibrate is set and the device is not
	 * calibrated yet, calibration runs first.
	 *
	 * @throw already_connected_exception if already connected.
	 * @throw connection_failed_exception if the retry budget is exhausted.
	 */
	void connect(bool calibrate = false);


	/**
	 * @throw not_connected_exception if not connected.
	 */
	void disconnect();

	[[nodiscard]] bool is_connected() const noexcept;


	/**
	 * Merges at most one pending state frame, then returns the cached
	 * state. Never waits for telemetry; bad frames are dropped.
	 */
	observation_snapshot observe();


	/**
	 * Shapes target against the cached state and the safety limits and
	 * sends it as the next command.
	 */
	act_result act(const joint_targets& target);


	/**
	 * Same as act(), for actions keyed "<joint>.pos". Other keys are ignored.
	 */
	act_result send_action(const std::map<std::string, double>& action);


	[[nodiscard]] observation_snapshot confirmed_observation() const;

	[[nodiscard]] std::vector<std::string> action_features() const;
	[[nodiscard]] std::vector<std::string> observation_features() const;

	[[nodiscard]] const follower_config& config() const noexcept;
	[[nodiscard]] follower_lifecycle& lifecycle() noexcept;
	[[nodiscard]] std::uint64_t last_sequence() const noexcept;

private:
	void log_command(const command_joint_position& command, const shape_result& shaped);
	void log_trajectory(const command_joint_position& command, bool delivered);
	void start_trajectory_log();
	void stop_trajectory_log() noexcept;


	const follower_config config_;

	follower_lifecycle lifecycle_;
	command_shaper shaper_;
	observation_cache cache_;
	std::unique_ptr<websim_network_client> connection_;
	std::unique_ptr<logger> trajectory_log_;

	std::uint64_t seq_;
	std::chrono::steady_clock::time_point last_send_log_;

	static constexpr std::uint64_t always_logged_commands_ = 4;
	static constexpr std::chrono::seconds send_log_interval_{1};
};
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_CLIENT__WEBSIM_FOLLOWER_HPP
