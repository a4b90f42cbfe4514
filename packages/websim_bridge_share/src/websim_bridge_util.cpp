/**
 *************************************************************************
 *
 * @file websim_bridge_util.cpp
 *
 * Utility functions that are needed in multiple places.
 *
 ************************************************************************/
#include "websim_bridge_util.hpp"

#include <algorithm>
#include <chrono>

namespace websim_bridge
{
std::vector<std::string> websim_bridge_util::default_joint_names()
{
	return
	{
		"shoulder_pan",
		"shoulder_lift",
		"elbow_flex",
		"wrist_flex",
		"wrist_roll",
		"gripper"
	};
}


double websim_bridge_util::wall_clock_seconds()
{
	return std::chrono::duration<double>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}


joint_positions websim_bridge_util::convert_to_eigen(const std::vector<double>& std_vector)
{
	joint_positions out = Eigen::Map<const joint_positions>(
		std_vector.data(), static_cast<Eigen::Index>(std_vector.size()));
	return out;
}


std::vector<double> websim_bridge_util::convert_to_std_vector(const joint_positions& eigen_vector)
{
	return {eigen_vector.data(), eigen_vector.data() + eigen_vector.size()};
}


Eigen::Index websim_bridge_util::index_of(
	const std::vector<std::string>& names,
	std::string_view name)
{
	const auto it = std::find(names.begin(), names.end(), name);
	if (it == names.end())
		return -1;

	return static_cast<Eigen::Index>(it - names.begin());
}
}
/* namespace websim_bridge*/
