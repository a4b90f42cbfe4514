/**
 *************************************************************************
 *
 * @file command_shaper.cpp
 *
 * Safety clamping of commanded joint positions, implementation.
 *
 ************************************************************************/


#include "command_shaper.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <websim_bridge_share/exception.hpp>


namespace websim_bridge
{
namespace
{
constexpr double infinity = std::numeric_limits<double>::infinity();


void check_step(double step, const std::string& joint)
{
	if (std::isnan(step) || step < 0.)
		throw invalid_configuration_exception
			("max_relative_target for " + joint + " must be a non-negative number.");
}
}


//////////////////////////////////////////////////////////////////////////
//
// safety_limits
//
//////////////////////////////////////////////////////////////////////////


safety_limits::safety_limits(Eigen::Index joint_count)
	: max_step_(joint_positions::Constant(joint_count, infinity)),
	  lower_(joint_positions::Constant(joint_count, -infinity)),
	  upper_(joint_positions::Constant(joint_count, infinity))
{
}


safety_limits::safety_limits(
	const std::vector<std::string>& joint_names,
	const std::optional<relative_limit>& max_relative_target,
	const std::optional<std::vector<double>>& joint_min,
	const std::optional<std::vector<double>>& joint_max)
	: safety_limits(static_cast<Eigen::Index>(joint_names.size()))
{
	if (max_relative_target)
	{
		if (const double* step = std::get_if<double>(&*max_relative_target))
		{
			check_step(*step, "all joints");
			max_step_.setConstant(*step);
		}
		else
		{
			for (const auto& [name, step] : std::get<std::map<std::string, double>>(*max_relative_target))
			{
				const Eigen::Index index = websim_bridge_util::index_of(joint_names, name);
				if (index < 0)
					throw invalid_configuration_exception
						("max_relative_target names unknown joint " + name + ".");

				check_step(step, name);
				max_step_(index) = step;
			}
		}
	}

	if (joint_min.has_value() != joint_max.has_value())
		throw invalid_configuration_exception("joint_min and joint_max must be given together.");

	if (!joint_min)
		return;

	if (joint_min->size() != joint_names.size() || joint_max->size() != joint_names.size())
		throw invalid_configuration_exception
			("joint_min and joint_max must have one entry per joint (" +
			 std::to_string(joint_names.size()) + ").");

	for (std::size_t i = 0; i < joint_names.size(); ++i)
	{
		const double lo = (*joint_min)[i];
		const double hi = (*joint_max)[i];
		if (std::isnan(lo) || std::isnan(hi) || lo > hi)
			throw invalid_configuration_exception
				("Invalid bounds for joint " + joint_names[i] + ".");

		lower_(static_cast<Eigen::Index>(i)) = lo;
		upper_(static_cast<Eigen::Index>(i)) = hi;
	}
}


const joint_positions& safety_limits::max_step() const noexcept
{
	return max_step_;
}


const joint_positions& safety_limits::lower() const noexcept
{
	return lower_;
}


const joint_positions& safety_limits::upper() const noexcept
{
	return upper_;
}


Eigen::Index safety_limits::joint_count() const noexcept
{
	return max_step_.size();
}


//////////////////////////////////////////////////////////////////////////
//
// command_shaper
//
//////////////////////////////////////////////////////////////////////////


command_shaper::command_shaper(
	std::vector<std::string> joint_names,
	safety_limits limits)
	: joint_names_(std::move(joint_names)),
	  limits_(std::move(limits))
{
	if (limits_.joint_count() != static_cast<Eigen::Index>(joint_names_.size()))
		throw invalid_configuration_exception("Safety limits do not match the joint schema.");
}


shape_result command_shaper::shape(
	const joint_targets& target,
	const joint_positions& previous) const
{
	const auto count = static_cast<Eigen::Index>(joint_names_.size());
	if (previous.size() != count)
		throw std::invalid_argument("previous positions do not match the joint schema");

	shape_result result;
	result.empty_target = target.empty();

	// Joints without a (finite) target hold their position.
	joint_positions candidate = previous;
	for (const auto& [name, value] : target)
	{
		const Eigen::Index index = websim_bridge_util::index_of(joint_names_, name);
		if (index < 0)
		{
			result.ignored_joints.push_back(name);
			continue;
		}

		if (std::isfinite(value))
			candidate(index) = value;
	}

	result.goal = candidate;
	for (Eigen::Index i = 0; i < count; ++i)
	{
		double& value = result.goal(i);

		const double step = limits_.max_step()(i);
		if (value - previous(i) > step)
			value = previous(i) + step;
		else if (value - previous(i) < -step)
			value = previous(i) - step;

		value = std::clamp(value, limits_.lower()(i), limits_.upper()(i));

		if (value != candidate(i))
			result.clamped_joints.push_back(joint_names_[static_cast<std::size_t>(i)]);
	}

	return result;
}


const std::vector<std::string>& command_shaper::joint_names() const noexcept
{
	return joint_names_;
}


const safety_limits& command_shaper::limits() const noexcept
{
	return limits_;
}
} /* namespace websim_bridge */
