#ifndef INCLUDED__WEBSIM_BRIDGE_CLIENT__COMMAND_SHAPER_HPP
#define INCLUDED__WEBSIM_BRIDGE_CLIENT__COMMAND_SHAPER_HPP
/**
 *************************************************************************
 *
 * @file command_shaper.hpp
 *
 * Safety clamping of commanded joint positions.
 *
 ************************************************************************/


#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <websim_bridge_share/websim_bridge_util.hpp>


namespace websim_bridge
{
/**
 * Partial target pose, joint name -> position.
 */
using joint_targets = std::map<std::string, double>;

/**
 * Maximum step per command, either for all joints or per joint name.
 */
using relative_limit = std::variant<double, std::map<std::string, double>>;


/**
 *************************************************************************
 *
 * @class safety_limits
 *
 * Per-joint relative step limits and absolute bounds, aligned to the
 * canonical joint names. Joints without a limit use infinite bounds.
 *
 ************************************************************************/
class safety_limits
{
public:
	/**
	 * No limits at all.
	 */
	explicit safety_limits(Eigen::Index joint_count);


	/**
	 * Builds limits from their configured form. Absolute bounds
	 * are only applied if both joint_min and joint_max are given.
	 *
	 * @throw invalid_configuration_exception if a limit is negative or NaN,
	 *		names an unknown joint, mismatches the joint count,
	 *		or if joint_min exceeds joint_max.
	 */
	safety_limits(
		const std::vector<std::string>& joint_names,
		const std::optional<relative_limit>& max_relative_target,
		const std::optional<std::vector<double>>& joint_min,
		const std::optional<std::vector<double>>& joint_max);


	[[nodiscard]] const joint_positions& max_step() const noexcept;
	[[nodiscard]] const joint_positions& lower() const noexcept;
	[[nodiscard]] const joint_positions& upper() const noexcept;

	[[nodiscard]] Eigen::Index joint_count() const noexcept;

private:
	joint_positions max_step_;
	joint_positions lower_;
	joint_positions upper_;
};


/**
 * Outcome of command_shaper::shape().
 */
struct shape_result
{
	joint_positions goal;

	// The target contained no joints at all, goal equals previous.
	bool empty_target = false;

	// Target names that are not part of the joint schema.
	std::vector<std::string> ignored_joints;

	// Joints whose value was changed by a limit.
	std::vector<std::string> clamped_joints;
};


/**
 *************************************************************************
 *
 * @class command_shaper
 *
 * Turns a partial target pose into a full, safety-bounded goal.
 *
 * For every joint, the target value is used if present (and finite),
 * the previous value otherwise. The step towards it is then clamped to
 * the relative limit, and the result clamped into the absolute bounds.
 *
 ************************************************************************/
class command_shaper
{
public:
	command_shaper(
		std::vector<std::string> joint_names,
		safety_limits limits);


	[[nodiscard]] shape_result shape(
		const joint_targets& target,
		const joint_positions& previous) const;


	[[nodiscard]] const std::vector<std::string>& joint_names() const noexcept;
	[[nodiscard]] const safety_limits& limits() const noexcept;

private:
	std::vector<std::string> joint_names_;
	safety_limits limits_;
};
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_CLIENT__COMMAND_SHAPER_HPP
