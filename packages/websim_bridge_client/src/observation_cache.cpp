/**
 *************************************************************************
 *
 * @file observation_cache.cpp
 *
 * Last known joint state of the followed robot, implementation.
 *
 ************************************************************************/


#include "observation_cache.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>


namespace websim_bridge
{
//////////////////////////////////////////////////////////////////////////
//
// observation_snapshot
//
//////////////////////////////////////////////////////////////////////////


double observation_snapshot::position(const std::string& name) const
{
	const Eigen::Index index = websim_bridge_util::index_of(names, name);
	if (index < 0)
		throw std::out_of_range("unknown joint: " + name);

	return positions(index);
}


std::map<std::string, double> observation_snapshot::as_features() const
{
	std::map<std::string, double> features;
	for (std::size_t i = 0; i < names.size(); ++i)
		features[names[i] + std::string(websim_bridge_util::position_suffix)] =
			positions(static_cast<Eigen::Index>(i));

	features["timestamp"] = timestamp;
	return features;
}


bool observation_snapshot::operator==(const observation_snapshot& other) const
{
	return names == other.names &&
		timestamp == other.timestamp &&
		positions.size() == other.positions.size() &&
		positions == other.positions;
}


//////////////////////////////////////////////////////////////////////////
//
// observation_cache
//
//////////////////////////////////////////////////////////////////////////


observation_cache::observation_cache(std::vector<std::string> joint_names)
	: joint_names_(std::move(joint_names))
{
	latest_.names = joint_names_;
	latest_.positions = joint_positions::Zero(static_cast<Eigen::Index>(joint_names_.size()));
	latest_.timestamp = websim_bridge_util::wall_clock_seconds();
	confirmed_ = latest_;
}


void observation_cache::update(const state_frame& frame)
{
	const std::vector<std::string>& names = frame.names ? *frame.names : joint_names_;
	const std::size_t count = std::min(names.size(), frame.joint_pos.size());

	const double timestamp = frame.timestamp.value_or(websim_bridge_util::wall_clock_seconds());

	std::lock_guard lck(state_lock_);
	for (std::size_t i = 0; i < count; ++i)
	{
		const Eigen::Index index = websim_bridge_util::index_of(joint_names_, names[i]);
		if (index < 0)
			continue;

		confirmed_.positions(index) = frame.joint_pos[i];
		latest_.positions(index) = frame.joint_pos[i];
	}

	confirmed_.timestamp = timestamp;
	latest_.timestamp = timestamp;
}


void observation_cache::assume(const joint_positions& positions, double timestamp)
{
	if (positions.size() != static_cast<Eigen::Index>(joint_names_.size()))
		throw std::invalid_argument("assumed positions do not match the joint schema");

	std::lock_guard lck(state_lock_);
	latest_.positions = positions;
	latest_.timestamp = timestamp;
}


observation_snapshot observation_cache::snapshot() const
{
	std::lock_guard lck(state_lock_);
	return latest_;
}


observation_snapshot observation_cache::confirmed_snapshot() const
{
	std::lock_guard lck(state_lock_);
	return confirmed_;
}


const std::vector<std::string>& observation_cache::joint_names() const noexcept
{
	return joint_names_;
}
} /* namespace websim_bridge */
