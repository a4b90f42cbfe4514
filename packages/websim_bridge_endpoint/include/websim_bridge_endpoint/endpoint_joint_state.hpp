#ifndef INCLUDED__WEBSIM_BRIDGE_ENDPOINT__ENDPOINT_JOINT_STATE_HPP
#define INCLUDED__WEBSIM_BRIDGE_ENDPOINT__ENDPOINT_JOINT_STATE_HPP
/**
 *************************************************************************
 *
 * @file endpoint_joint_state.hpp
 *
 * Authoritative joint state of one endpoint session.
 *
 ************************************************************************/


#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <websim_bridge_share/websim_bridge_messages.hpp>
#include <websim_bridge_share/websim_bridge_util.hpp>


namespace websim_bridge
{
enum class ingest_result
	: std::uint8_t
{
	applied,
	bad_frame,
	not_a_command,
	unsupported_mode,
	bad_target_length
};

[[nodiscard]] const char* to_string(ingest_result result) noexcept;


/**
 *************************************************************************
 *
 * @class endpoint_joint_state
 *
 * Holds q, one position per canonical joint, starting at zero.
 *
 * q is only ever replaced as a whole by an accepted command, so
 * publish() never sees a partially applied target.
 *
 ************************************************************************/
class endpoint_joint_state
{
public:
	explicit endpoint_joint_state(std::vector<std::string> joint_names);


	/**
	 * Decodes payload and applies it if it is a joint position command
	 * with one target per canonical joint. Anything else leaves q untouched.
	 */
	ingest_result ingest(std::string_view payload);


	[[nodiscard]] state_frame publish(double timestamp) const;


	[[nodiscard]] const joint_positions& q() const noexcept;
	[[nodiscard]] const std::vector<std::string>& joint_names() const noexcept;

	// Sequence number of the last applied command, 0 if none.
	[[nodiscard]] std::uint64_t last_applied_seq() const noexcept;

private:
	const std::vector<std::string> joint_names_;
	joint_positions q_;
	std::uint64_t last_applied_seq_;
};
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_ENDPOINT__ENDPOINT_JOINT_STATE_HPP
