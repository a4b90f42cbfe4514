/**
 *************************************************************************
 *
 * @file endpoint_joint_state.cpp
 *
 * Authoritative joint state of one endpoint session, implementation.
 *
 ************************************************************************/


#include "endpoint_joint_state.hpp"

#include <utility>
#include <variant>


namespace websim_bridge
{
const char* to_string(ingest_result result) noexcept
{
	switch (result)
	{
	case ingest_result::applied:
		return "applied";
	case ingest_result::bad_frame:
		return "bad frame";
	case ingest_result::not_a_command:
		return "not a command";
	case ingest_result::unsupported_mode:
		return "unsupported mode";
	case ingest_result::bad_target_length:
		return "bad target length";
	}
	return "unknown";
}


//////////////////////////////////////////////////////////////////////////
//
// endpoint_joint_state
//
//////////////////////////////////////////////////////////////////////////


endpoint_joint_state::endpoint_joint_state(std::vector<std::string> joint_names)
	: joint_names_(std::move(joint_names)),
	  q_(joint_positions::Zero(static_cast<Eigen::Index>(joint_names_.size()))),
	  last_applied_seq_(0)
{
}


ingest_result endpoint_joint_state::ingest(std::string_view payload)
{
	const decoded_frame frame = decode_frame(payload);

	if (const auto* rejected = std::get_if<rejected_frame>(&frame))
	{
		switch (rejected->error)
		{
		case frame_error::unknown_type:
			return ingest_result::not_a_command;
		case frame_error::unknown_mode:
			return ingest_result::unsupported_mode;
		default:
			return ingest_result::bad_frame;
		}
	}

	const auto* command = std::get_if<command_joint_position>(&frame);
	if (!command)
		return ingest_result::not_a_command;

	if (command->mode != command_mode::joint_position)
		return ingest_result::unsupported_mode;

	if (command->target.size() != joint_names_.size())
		return ingest_result::bad_target_length;

	q_ = websim_bridge_util::convert_to_eigen(command->target);
	last_applied_seq_ = command->seq;
	return ingest_result::applied;
}


state_frame endpoint_joint_state::publish(double timestamp) const
{
	state_frame state;
	state.names = joint_names_;
	state.joint_pos = websim_bridge_util::convert_to_std_vector(q_);
	state.timestamp = timestamp;
	return state;
}


const joint_positions& endpoint_joint_state::q() const noexcept
{
	return q_;
}


const std::vector<std::string>& endpoint_joint_state::joint_names() const noexcept
{
	return joint_names_;
}


std::uint64_t endpoint_joint_state::last_applied_seq() const noexcept
{
	return last_applied_seq_;
}
} /* namespace websim_bridge */
