/*********************************
*
* @file websim_bridge_util.hpp
*
* Static utilities
*
*********************************/

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Core>

namespace websim_bridge
{
	using joint_positions = Eigen::VectorXd;


	class websim_bridge_util
	{
	public:

		/**
		* Joint schema of the SO-101 arm, in canonical order.
		*/
		static std::vector<std::string> default_joint_names();

		static constexpr char default_ip[] = "127.0.0.1";
		static constexpr unsigned short default_port = 8765;
		static constexpr char default_ws_url[] = "ws://127.0.0.1:8765";

		/**
		* Key suffix of joint positions in teleoperation actions
		* and observations, e.g. "elbow_flex.pos".
		*/
		static constexpr std::string_view position_suffix = ".pos";

		/**
		* Seconds since the unix epoch, used for all frame timestamps.
		*/
		static double wall_clock_seconds();

		static joint_positions convert_to_eigen(const std::vector<double>& std_vector);
		static std::vector<double> convert_to_std_vector(const joint_positions& eigen_vector);

		/**
		* Returns the index of name within names, or -1.
		*/
		static Eigen::Index index_of(
			const std::vector<std::string>& names,
			std::string_view name);
	};
}
/* namespace websim_bridge*/
