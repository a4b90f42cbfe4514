#ifndef INCLUDED__WEBSIM_BRIDGE_CLIENT__FOLLOWER_LIFECYCLE_HPP
#define INCLUDED__WEBSIM_BRIDGE_CLIENT__FOLLOWER_LIFECYCLE_HPP
/**
 *************************************************************************
 *
 * @file follower_lifecycle.hpp
 *
 * Calibration and configuration hooks of a follower device.
 *
 ************************************************************************/


#include <functional>

#include "follower_config.hpp"


namespace websim_bridge
{
/**
 *************************************************************************
 *
 * @class follower_lifecycle
 *
 * Lifecycle hooks, selected by the device variant at construction.
 *
 * - simulated_endpoint: always calibrated, all hooks are no-ops.
 * - physical_device: calibrated once calibrate() ran the given
 *		calibration routine (a no-op if none is given).
 *
 ************************************************************************/
class follower_lifecycle
{
public:
	explicit follower_lifecycle(
		follower_kind kind,
		std::function<void()> calibration = {});


	[[nodiscard]] follower_kind kind() const noexcept;
	[[nodiscard]] bool is_calibrated() const noexcept;

	void calibrate();
	void configure();

private:
	follower_kind kind_;
	std::function<void()> calibration_;
	bool calibrated_;
};
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_CLIENT__FOLLOWER_LIFECYCLE_HPP
