/**
 *************************************************************************
 *
 * @file follower_config.cpp
 *
 * Configuration of a websim_follower, implementation.
 *
 ************************************************************************/


#include "follower_config.hpp"

#include <fstream>
#include <set>

#include <nlohmann/json.hpp>

#include <websim_bridge_share/exception.hpp>


namespace websim_bridge
{
//////////////////////////////////////////////////////////////////////////
//
// follower_kind
//
//////////////////////////////////////////////////////////////////////////


void to_json(nlohmann::json& json, const follower_kind& object)
{
	json = object == follower_kind::physical_device ? "physical_device" : "simulated_endpoint";
}


void from_json(const nlohmann::json& json, follower_kind& object)
{
	const auto& kind = json.get_ref<const std::string&>();
	if (kind == "physical_device")
		object = follower_kind::physical_device;
	else if (kind == "simulated_endpoint")
		object = follower_kind::simulated_endpoint;
	else
		throw invalid_configuration_exception("Unknown follower kind " + kind + ".");
}


//////////////////////////////////////////////////////////////////////////
//
// follower_config
//
//////////////////////////////////////////////////////////////////////////


void follower_config::validate() const
{
	if (joint_names.empty())
		throw invalid_configuration_exception("At least one joint name is required.");

	const std::set<std::string> unique_names(joint_names.begin(), joint_names.end());
	if (unique_names.size() != joint_names.size())
		throw invalid_configuration_exception("Joint names must be unique.");

	check_ws_url(ws_url);

	if (connection.connect_attempts < 1)
		throw invalid_configuration_exception("connect_attempts must be at least 1.");

	if (connection.attempt_timeout.count() < 0. ||
		connection.retry_delay.count() < 0. ||
		connection.send_timeout.count() < 0.)
		throw invalid_configuration_exception("Connection timeouts must not be negative.");

	// Throws on inconsistent limits.
	[[maybe_unused]] const safety_limits limits(joint_names, max_relative_target, joint_min, joint_max);
}


void to_json(nlohmann::json& json, const follower_config& object)
{
	json["ws_url"] = object.ws_url;
	json["joint_names"] = object.joint_names;

	if (!object.max_relative_target)
		json["max_relative_target"] = nullptr;
	else if (const double* step = std::get_if<double>(&*object.max_relative_target))
		json["max_relative_target"] = *step;
	else
		json["max_relative_target"] = std::get<std::map<std::string, double>>(*object.max_relative_target);

	json["joint_min"] = object.joint_min ? nlohmann::json(*object.joint_min) : nlohmann::json(nullptr);
	json["joint_max"] = object.joint_max ? nlohmann::json(*object.joint_max) : nlohmann::json(nullptr);

	json["kind"] = object.kind;
	json["connection"] =
	{
		{"connect_attempts", object.connection.connect_attempts},
		{"attempt_timeout", object.connection.attempt_timeout.count()},
		{"retry_delay", object.connection.retry_delay.count()},
		{"send_timeout", object.connection.send_timeout.count()}
	};

	json["log_file_path"] = object.log_file_path.value_or("");
}


void from_json(const nlohmann::json& json, follower_config& object)
{
	object.ws_url = json.value("ws_url", object.ws_url);
	object.joint_names = json.value("joint_names", object.joint_names);

	const auto max_relative_target = json.find("max_relative_target");
	if (max_relative_target == json.end() || max_relative_target->is_null())
		object.max_relative_target.reset();
	else if (max_relative_target->is_number())
		object.max_relative_target = max_relative_target->get<double>();
	else if (max_relative_target->is_object())
		object.max_relative_target = max_relative_target->get<std::map<std::string, double>>();
	else
		throw invalid_configuration_exception("max_relative_target must be a number or an object.");

	const auto read_bounds = [&json](const char* key, std::optional<std::vector<double>>& bounds)
	{
		const auto entry = json.find(key);
		if (entry == json.end() || entry->is_null())
			bounds.reset();
		else
			bounds = entry->get<std::vector<double>>();
	};
	read_bounds("joint_min", object.joint_min);
	read_bounds("joint_max", object.joint_max);

	if (json.contains("kind"))
		json.at("kind").get_to(object.kind);

	if (json.contains("connection"))
	{
		const auto& connection = json.at("connection");
		auto& settings = object.connection;

		settings.connect_attempts = connection.value("connect_attempts", settings.connect_attempts);
		settings.attempt_timeout = std::chrono::duration<double>
			(connection.value("attempt_timeout", settings.attempt_timeout.count()));
		settings.retry_delay = std::chrono::duration<double>
			(connection.value("retry_delay", settings.retry_delay.count()));
		settings.send_timeout = std::chrono::duration<double>
			(connection.value("send_timeout", settings.send_timeout.count()));
	}

	const std::string log_file_path = json.value("log_file_path", std::string{});
	if (log_file_path.empty())
		object.log_file_path.reset();
	else
		object.log_file_path = log_file_path;
}


follower_config load_follower_config(const std::string& path)
{
	std::ifstream file(path);
	if (!file)
		throw invalid_configuration_exception("Cannot open configuration file " + path + ".");

	follower_config config;
	try
	{
		nlohmann::json::parse(file).get_to(config);
	}
	catch (const nlohmann::json::exception& exc)
	{
		throw invalid_configuration_exception
			("Invalid configuration file " + path + ": " + exc.what());
	}

	config.validate();
	return config;
}
} /* namespace websim_bridge */
