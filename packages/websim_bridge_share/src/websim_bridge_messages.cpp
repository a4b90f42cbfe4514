/**
 *************************************************************************
 *
 * @file websim_bridge_messages.cpp
 *
 * Frames that are exchanged between follower and endpoint,
 * implementation.
 *
 ************************************************************************/


#include "websim_bridge_messages.hpp"

#include <exception>
#include <new>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>


namespace websim_bridge
{
namespace
{
decoded_frame decode_command(const nlohmann::json& json)
{
	const auto mode = json.find("mode");
	if (mode == json.end() || !mode->is_string())
		return rejected_frame{frame_error::malformed_frame, "command without mode"};

	if (mode->get_ref<const std::string&>() != to_string(command_mode::joint_position))
		return rejected_frame
			{frame_error::unknown_mode, "unsupported mode: " + mode->get<std::string>()};

	auto command = json.get<command_joint_position>();
	if (command.names.size() != command.target.size())
		return rejected_frame
			{frame_error::schema_mismatch,
			 "command has " + std::to_string(command.names.size()) + " names but " +
			 std::to_string(command.target.size()) + " targets"};

	return command;
}


decoded_frame decode_state(const nlohmann::json& json)
{
	auto state = json.get<state_frame>();
	if (state.names && state.names->size() != state.joint_pos.size())
		return rejected_frame
			{frame_error::schema_mismatch,
			 "state has " + std::to_string(state.names->size()) + " names but " +
			 std::to_string(state.joint_pos.size()) + " positions"};

	return state;
}
}


//////////////////////////////////////////////////////////////////////////
//
// command_mode
//
//////////////////////////////////////////////////////////////////////////


const char* to_string(command_mode mode) noexcept
{
	switch (mode)
	{
	case command_mode::joint_position:
		return "joint_position";
	}
	return "unknown";
}


void to_json(nlohmann::json& json, const command_mode& object)
{
	json = to_string(object);
}


void from_json(const nlohmann::json& json, command_mode& object)
{
	if (json.get_ref<const std::string&>() != to_string(command_mode::joint_position))
		throw std::domain_error("unsupported command mode");

	object = command_mode::joint_position;
}


//////////////////////////////////////////////////////////////////////////
//
// command_joint_position
//
//////////////////////////////////////////////////////////////////////////


void to_json(nlohmann::json& json, const command_joint_position& object)
{
	json["type"] = command_joint_position::type;
	json["seq"] = object.seq;
	json["mode"] = object.mode;
	json["names"] = object.names;
	json["target"] = object.target;
	json["timestamp"] = object.timestamp;
}


void from_json(const nlohmann::json& json, command_joint_position& object)
{
	if (!json.at("seq").is_number_unsigned())
		throw std::domain_error("command sequence number must be unsigned");

	json.at("seq").get_to(object.seq);
	json.at("mode").get_to(object.mode);
	json.at("names").get_to(object.names);
	json.at("target").get_to(object.target);
	json.at("timestamp").get_to(object.timestamp);
}


//////////////////////////////////////////////////////////////////////////
//
// state_frame
//
//////////////////////////////////////////////////////////////////////////


void to_json(nlohmann::json& json, const state_frame& object)
{
	json["type"] = state_frame::type;
	if (object.names)
		json["names"] = *object.names;
	json["joint_pos"] = object.joint_pos;
	if (object.timestamp)
		json["timestamp"] = *object.timestamp;
}


void from_json(const nlohmann::json& json, state_frame& object)
{
	const auto names = json.find("names");
	if (names != json.end() && !names->is_null())
		object.names = names->get<std::vector<std::string>>();
	else
		object.names.reset();

	json.at("joint_pos").get_to(object.joint_pos);

	const auto timestamp = json.find("timestamp");
	if (timestamp != json.end() && !timestamp->is_null())
		object.timestamp = timestamp->get<double>();
	else
		object.timestamp.reset();
}


//////////////////////////////////////////////////////////////////////////
//
// frame_error
//
//////////////////////////////////////////////////////////////////////////


const char* to_string(frame_error error) noexcept
{
	switch (error)
	{
	case frame_error::malformed_frame:
		return "malformed frame";
	case frame_error::missing_type:
		return "missing type";
	case frame_error::unknown_type:
		return "unknown type";
	case frame_error::unknown_mode:
		return "unknown mode";
	case frame_error::schema_mismatch:
		return "schema mismatch";
	}
	return "unknown error";
}


//////////////////////////////////////////////////////////////////////////
//
// encoding / decoding
//
//////////////////////////////////////////////////////////////////////////


std::string encode_frame(const command_joint_position& command)
{
	return nlohmann::json(command).dump();
}


std::string encode_frame(const state_frame& state)
{
	return nlohmann::json(state).dump();
}


decoded_frame decode_frame(std::string_view payload) noexcept
{
	try
	{
		const auto json = nlohmann::json::parse(payload.begin(), payload.end());
		if (!json.is_object())
			return rejected_frame{frame_error::malformed_frame, "frame is not a JSON object"};

		const auto type = json.find("type");
		if (type == json.end())
			return rejected_frame{frame_error::missing_type, "frame without type"};
		if (!type->is_string())
			return rejected_frame{frame_error::malformed_frame, "frame type is not a string"};

		const auto& type_name = type->get_ref<const std::string&>();
		if (type_name == command_joint_position::type)
			return decode_command(json);
		if (type_name == state_frame::type)
			return decode_state(json);

		return rejected_frame{frame_error::unknown_type, "unknown frame type: " + type_name};
	}
	catch (const std::bad_alloc&)
	{
		// An empty reason needs no allocation.
		return rejected_frame{frame_error::malformed_frame, {}};
	}
	catch (const std::exception& exc)
	{
		try
		{
			return rejected_frame{frame_error::malformed_frame, exc.what()};
		}
		catch (const std::bad_alloc&)
		{
			return rejected_frame{frame_error::malformed_frame, {}};
		}
	}
}
} /* namespace websim_bridge */
