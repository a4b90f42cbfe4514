/**
 *************************************************************************
 *
 * @file follower_lifecycle.cpp
 *
 * Calibration and configuration hooks of a follower device,
 * implementation.
 *
 ************************************************************************/


#include "follower_lifecycle.hpp"

#include <iostream>
#include <utility>


namespace websim_bridge
{
follower_lifecycle::follower_lifecycle(
	follower_kind kind,
	std::function<void()> calibration)
	: kind_(kind),
	  calibration_(std::move(calibration)),
	  calibrated_(kind == follower_kind::simulated_endpoint)
{
}


follower_kind follower_lifecycle::kind() const noexcept
{
	return kind_;
}


bool follower_lifecycle::is_calibrated() const noexcept
{
	return calibrated_;
}


void follower_lifecycle::calibrate()
{
	if (kind_ == follower_kind::simulated_endpoint)
		return;

	std::cout << "follower_lifecycle::calibrate(): Calibrating physical device.\n";
	if (calibration_)
		calibration_();

	calibrated_ = true;
}


void follower_lifecycle::configure()
{
	// Neither variant has anything to configure over the channel yet.
}
} /* namespace websim_bridge */
