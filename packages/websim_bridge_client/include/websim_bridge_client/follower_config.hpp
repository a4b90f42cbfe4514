#ifndef INCLUDED__WEBSIM_BRIDGE_CLIENT__FOLLOWER_CONFIG_HPP
#define INCLUDED__WEBSIM_BRIDGE_CLIENT__FOLLOWER_CONFIG_HPP
/**
 *************************************************************************
 *
 * @file follower_config.hpp
 *
 * Configuration of a websim_follower.
 *
 ************************************************************************/


#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include <websim_bridge_share/websim_bridge_util.hpp>

#include "command_shaper.hpp"
#include "websim_network_client.hpp"


namespace websim_bridge
{
/**
 * Device variant behind the channel; selects the lifecycle behaviour.
 */
enum class follower_kind
	: std::uint8_t
{
	physical_device,
	simulated_endpoint
};

void to_json(nlohmann::json& json, const follower_kind& object);
void from_json(const nlohmann::json& json, follower_kind& object);


/**
 *************************************************************************
 *
 * @class follower_config
 *
 * Everything a websim_follower needs to know about its endpoint.
 *
 ************************************************************************/
struct follower_config
{
	// Plain ws:// address of the endpoint, e.g. "ws://127.0.0.1:8765".
	std::string ws_url = websim_bridge_util::default_ws_url;

	// Canonical order, shared with the endpoint.
	std::vector<std::string> joint_names = websim_bridge_util::default_joint_names();

	std::optional<relative_limit> max_relative_target;
	std::optional<std::vector<double>> joint_min;
	std::optional<std::vector<double>> joint_max;

	follower_kind kind = follower_kind::simulated_endpoint;
	connection_settings connection;

	// Write a csv trajectory log of all commands, if set. Rows reach the
	// file in batches of logger::default_flush_rows and on disconnect.
	std::optional<std::string> log_file_path;


	/**
	 * @throw invalid_configuration_exception on empty or duplicate joint
	 *		names, an unusable ws_url, invalid safety limits or an empty
	 *		retry budget.
	 */
	void validate() const;
};

void to_json(nlohmann::json& json, const follower_config& object);
void from_json(const nlohmann::json& json, follower_config& object);


/**
 * Reads a follower_config from a JSON file. Missing keys keep their
 * defaults. The result is validated.
 *
 * @throw invalid_configuration_exception if the file cannot be read,
 *		is no valid JSON or fails validation.
 */
follower_config load_follower_config(const std::string& path);
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_CLIENT__FOLLOWER_CONFIG_HPP
