#ifndef INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSIM_BRIDGE_MESSAGES_HPP
#define INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSIM_BRIDGE_MESSAGES_HPP
/**
 *************************************************************************
 *
 * @file websim_bridge_messages.hpp
 *
 * Frames that are exchanged between follower and endpoint.
 *
 ************************************************************************/


#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>


namespace websim_bridge
{
/**
 * Every frame is one WebSocket text message holding a single UTF-8 JSON
 * object. Larger messages close the connection on either side.
 */
inline constexpr std::uint64_t max_frame_size = 1u << 20;


/**
 *************************************************************************
 *
 * @enum command_mode
 *
 * Interpretation of the target values of a command.
 *
 ************************************************************************/
enum class command_mode
	: std::uint8_t
{
	joint_position
};

[[nodiscard]] const char* to_string(command_mode mode) noexcept;

void to_json(nlohmann::json& json, const command_mode& object);
void from_json(const nlohmann::json& json, command_mode& object);


/**
 *************************************************************************
 *
 * @class command_joint_position
 *
 * Commands the endpoint to move all joints to the given positions.
 * names and target are aligned and of equal length.
 *
 ************************************************************************/
struct command_joint_position
{
	static constexpr char type[] = "cmd";

	std::uint64_t seq = 0;
	command_mode mode = command_mode::joint_position;
	std::vector<std::string> names;
	std::vector<double> target;
	double timestamp = 0.;

	bool operator==(const command_joint_position&) const = default;
};

void to_json(nlohmann::json& json, const command_joint_position& object);
void from_json(const nlohmann::json& json, command_joint_position& object);


/**
 *************************************************************************
 *
 * @class state_frame
 *
 * Joint positions published by the endpoint. Without names, positions
 * are aligned to the receiver's canonical joint order.
 *
 ************************************************************************/
struct state_frame
{
	static constexpr char type[] = "state";

	std::optional<std::vector<std::string>> names;
	std::vector<double> joint_pos;
	std::optional<double> timestamp;

	bool operator==(const state_frame&) const = default;
};

void to_json(nlohmann::json& json, const state_frame& object);
void from_json(const nlohmann::json& json, state_frame& object);


/**
 *************************************************************************
 *
 * @enum frame_error
 *
 * Reason a received frame was dropped.
 *
 ************************************************************************/
enum class frame_error
	: std::uint8_t
{
	malformed_frame,
	missing_type,
	unknown_type,
	unknown_mode,
	schema_mismatch
};

[[nodiscard]] const char* to_string(frame_error error) noexcept;


struct rejected_frame
{
	frame_error error;

	// Empty if there was no memory left to describe the error.
	std::string reason;
};


using decoded_frame = std::variant<rejected_frame, command_joint_position, state_frame>;


/**
 * Serializes a frame into a single compact JSON object.
 */
std::string encode_frame(const command_joint_position& command);
std::string encode_frame(const state_frame& state);


/**
 * Parses and validates a frame.
 *
 * Never throws: invalid JSON, missing fields, unknown type or mode,
 * length mismatches and allocation failures all yield a rejected_frame.
 */
decoded_frame decode_frame(std::string_view payload) noexcept;
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSIM_BRIDGE_MESSAGES_HPP
