#ifndef INCLUDED__WEBSIM_BRIDGE_CLIENT__OBSERVATION_CACHE_HPP
#define INCLUDED__WEBSIM_BRIDGE_CLIENT__OBSERVATION_CACHE_HPP
/**
 *************************************************************************
 *
 * @file observation_cache.hpp
 *
 * Last known joint state of the followed robot.
 *
 ************************************************************************/


#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <websim_bridge_share/websim_bridge_messages.hpp>
#include <websim_bridge_share/websim_bridge_util.hpp>


namespace websim_bridge
{
/**
 *************************************************************************
 *
 * @class observation_snapshot
 *
 * Joint positions aligned to the canonical joint names, plus the time
 * they were observed at (seconds since the unix epoch).
 *
 ************************************************************************/
struct observation_snapshot
{
	std::vector<std::string> names;
	joint_positions positions;
	double timestamp = 0.;

	/**
	 * @throw std::out_of_range if name is not part of the schema.
	 */
	[[nodiscard]] double position(const std::string& name) const;

	/**
	 * Flat "<joint>.pos" -> position map plus a "timestamp" entry.
	 */
	[[nodiscard]] std::map<std::string, double> as_features() const;

	bool operator==(const observation_snapshot& other) const;
};


/**
 *************************************************************************
 *
 * @class observation_cache
 *
 * Holds one position per configured joint, merged from state frames.
 *
 * Two states are kept: the confirmed state only contains telemetry,
 * while the latest state additionally contains positions assumed
 * after sending a command. Readers always receive copies.
 *
 ************************************************************************/
class observation_cache
{
public:
	/**
	 * All joints start at 0.0, stamped with the construction time.
	 */
	explicit observation_cache(std::vector<std::string> joint_names);


	/**
	 * Merges a state frame. Positions are matched by name if the frame
	 * carries names, by index into the canonical joint names otherwise.
	 * Unknown names are ignored.
	 */
	void update(const state_frame& frame);


	/**
	 * Records positions that were commanded but not yet observed.
	 * Only affects snapshot(), not confirmed_snapshot().
	 */
	void assume(const joint_positions& positions, double timestamp);


	[[nodiscard]] observation_snapshot snapshot() const;
	[[nodiscard]] observation_snapshot confirmed_snapshot() const;

	[[nodiscard]] const std::vector<std::string>& joint_names() const noexcept;

private:
	const std::vector<std::string> joint_names_;

	mutable std::mutex state_lock_;
	observation_snapshot latest_;
	observation_snapshot confirmed_;
};
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_CLIENT__OBSERVATION_CACHE_HPP
