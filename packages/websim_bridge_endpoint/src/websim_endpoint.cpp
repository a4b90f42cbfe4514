/**
 *************************************************************************
 *
 * @file websim_endpoint.cpp
 *
 * Standalone reference endpoint for websim followers.
 *
 ************************************************************************/


#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include <websim_bridge_share/websim_bridge_util.hpp>

#include "websim_endpoint_server.hpp"


namespace
{
struct endpoint_arguments
{
	std::string ip;
	std::uint16_t port;
	double rate_hz;
	std::vector<std::string> joint_names;
};

endpoint_arguments parse_arguments(int argc, char* argv[]);
}


int main(int argc, char* argv[])
{
	endpoint_arguments arguments;
	try
	{
		arguments = parse_arguments(argc, argv);
	}
	catch (const std::exception& e)
	{
		std::cerr << e.what() << '\n';
		std::cout << "Use websim_endpoint --help for more program options." << '\n';
		return EXIT_FAILURE;
	}

	try
	{
		std::cout << "Starting websim endpoint on ws://" << arguments.ip << ":" << arguments.port
			<< ", publishing " << arguments.joint_names.size() << " joints at "
			<< arguments.rate_hz << " Hz.\n";

		websim_bridge::websim_endpoint_server server
			(arguments.ip, arguments.port, arguments.joint_names, arguments.rate_hz);

		std::cout << '\n' << "Press Enter to stop endpoint." << std::endl;
		std::cin.get();
		return EXIT_SUCCESS;
	}
	catch (const std::exception& e)
	{
		std::cerr << "Starting the endpoint failed with error:\n"
			<< e.what() << '\n';
		return EXIT_FAILURE;
	}
}


namespace
{
endpoint_arguments parse_arguments(int argc, char* argv[])
{
	argparse::ArgumentParser program("websim_endpoint", WEBSIM_BRIDGE_VERSION);

	program.add_argument("--ip")
	       .help("address to listen on")
	       .default_value(std::string{websim_bridge::websim_bridge_util::default_ip});

	program.add_argument("--port")
	       .help("port to listen on")
	       .default_value(int{websim_bridge::websim_bridge_util::default_port})
	       .scan<'i', int>();

	program.add_argument("--rate")
	       .help("state publish rate in Hz")
	       .default_value(websim_bridge::websim_endpoint_server::default_rate_hz)
	       .scan<'g', double>();

	program.add_argument("--joints")
	       .help("canonical joint names, in order")
	       .nargs(argparse::nargs_pattern::at_least_one)
	       .default_value(websim_bridge::websim_bridge_util::default_joint_names());

	program.parse_args(argc, argv);

	const int port = program.get<int>("--port");
	if (port < 0 || port > 65535)
		throw std::invalid_argument("--port must be within 0 and 65535.");

	endpoint_arguments arguments;
	arguments.ip = program.get<std::string>("--ip");
	arguments.port = static_cast<std::uint16_t>(port);
	arguments.rate_hz = program.get<double>("--rate");
	arguments.joint_names = program.get<std::vector<std::string>>("--joints");
	return arguments;
}
}
