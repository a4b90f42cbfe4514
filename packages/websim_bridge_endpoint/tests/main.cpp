#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <argparse/argparse.hpp>

#include <websim_bridge_share/exception.hpp>
#include <websim_bridge_share/websim_bridge_messages.hpp>
#include <websim_bridge_client/websim_follower.hpp>
#include <websim_bridge_client/websim_network_client.hpp>
#include <websim_bridge_endpoint/endpoint_joint_state.hpp>
#include <websim_bridge_endpoint/websim_endpoint_server.hpp>


static void ingest_test();
static void publish_test();
static void server_configuration_test();
static void loopback_test();
static void oversized_frame_test();


namespace
{
void expect(bool condition, const std::string& what)
{
	if (!condition)
		throw std::runtime_error("expectation failed: " + what);
}


template <typename TException, typename TFunctor>
void expect_throws(TFunctor functor, const std::string& what)
{
	try
	{
		functor();
	}
	catch (const TException&)
	{
		return;
	}
	throw std::runtime_error("expected exception not thrown: " + what);
}


// Polls condition for up to two seconds.
bool eventually(const std::function<bool()>& condition)
{
	const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
	while (std::chrono::steady_clock::now() < deadline)
	{
		if (condition())
			return true;
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	return condition();
}


std::string command(std::uint64_t seq, std::vector<double> target)
{
	websim_bridge::command_joint_position cmd;
	cmd.seq = seq;
	for (std::size_t i = 0; i < target.size(); ++i)
		cmd.names.push_back("j" + std::to_string(i));
	cmd.target = std::move(target);
	cmd.timestamp = 1.;
	return websim_bridge::encode_frame(cmd);
}


const std::vector<std::pair<std::string, std::function<void()>>> test_cases
{
	{"ingest", ingest_test},
	{"publish", publish_test},
	{"server_configuration", server_configuration_test},
	{"loopback", loopback_test},
	{"oversized_frame", oversized_frame_test}
};
}


int main(int argc, char* argv[])
{
	argparse::ArgumentParser program("websim_bridge_endpoint_test");

	program.add_argument("-t", "--test")
	       .help("run only the named test case")
	       .metavar("NAME");

	try
	{
		program.parse_args(argc, argv);
	}
	catch (const std::exception& e)
	{
		std::cerr << e.what() << '\n';
		std::cerr << program;
		return EXIT_FAILURE;
	}

	const auto selected = program.present("--test");
	int executed = 0;
	int failed = 0;

	for (const auto& [name, test] : test_cases)
	{
		if (selected && *selected != name)
			continue;

		std::cout <<
			"--------------------------------------------------------------------------------\n"
			"Executing " << name << " test: " << '\n';
		++executed;
		try
		{
			test();
			std::cout << "passed." << '\n';
		}
		catch (const std::exception& e)
		{
			std::cerr << name << " FAILED: " << e.what() << '\n';
			++failed;
		}
	}

	if (executed == 0)
	{
		std::cerr << "Unknown test case " << selected.value_or("") << ".\n";
		return EXIT_FAILURE;
	}

	std::cout << '\n' << executed - failed << " of " << executed << " test cases passed.\n";
	return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}


void ingest_test()
{
	using websim_bridge::ingest_result;

	websim_bridge::endpoint_joint_state state({"a", "b", "c"});
	expect(state.q() == websim_bridge::joint_positions::Zero(3), "q starts at zero");

	expect(state.ingest(command(1, {0.1, 0.2, 0.3})) == ingest_result::applied, "valid command");
	const websim_bridge::joint_positions applied = state.q();
	expect(applied(0) == 0.1 && applied(1) == 0.2 && applied(2) == 0.3, "q is replaced");

	expect(state.ingest(command(2, {9., 9.})) == ingest_result::bad_target_length, "short target");
	expect(state.q() == applied && state.last_applied_seq() == 1, "rejected command leaves q alone");

	expect(state.ingest("{") == ingest_result::bad_frame, "broken JSON");
	expect(state.ingest(R"({"type":"state","joint_pos":[1,2,3]})") == ingest_result::not_a_command, "state frame");
	expect(state.ingest(R"({"type":"ping"})") == ingest_result::not_a_command, "unknown type");
	expect(state.ingest(
		R"({"type":"cmd","seq":3,"mode":"velocity","names":["a","b","c"],"target":[1,1,1],"timestamp":0})")
		== ingest_result::unsupported_mode, "unsupported mode");
	expect(state.q() == applied, "q survives all rejections");

	expect(state.ingest(command(4, {-1., -2., -3.})) == ingest_result::applied, "next valid command");
	expect(state.q()(2) == -3. && state.last_applied_seq() == 4, "next valid command is applied");
}


void publish_test()
{
	websim_bridge::endpoint_joint_state state({"a", "b"});
	static_cast<void>(state.ingest(command(1, {0.5, -0.5})));

	const auto frame = state.publish(42.);
	expect(frame.names && *frame.names == std::vector<std::string>{"a", "b"}, "names are published");
	expect(frame.joint_pos == std::vector<double>{0.5, -0.5}, "q is published");
	expect(frame.timestamp && *frame.timestamp == 42., "timestamp is published");

	const auto decoded = websim_bridge::decode_frame(websim_bridge::encode_frame(frame));
	expect(std::holds_alternative<websim_bridge::state_frame>(decoded), "published frame decodes");
}


void server_configuration_test()
{
	expect_throws<websim_bridge::invalid_configuration_exception>(
		[] { websim_bridge::websim_endpoint_server server("127.0.0.1", 0, {}); }, "no joints");
	expect_throws<websim_bridge::invalid_configuration_exception>(
		[] { websim_bridge::websim_endpoint_server server("127.0.0.1", 0, {"a"}, 0.); }, "zero rate");

	websim_bridge::websim_endpoint_server server("127.0.0.1", 0, {"a"});
	expect(server.port() != 0, "an ephemeral port is bound");
	expect(server.session_count() == 0, "no sessions yet");
}


void loopback_test()
{
	const std::vector<std::string> names{"a", "b"};
	auto server = std::make_unique<websim_bridge::websim_endpoint_server>("127.0.0.1", 0, names, 100.);

	websim_bridge::follower_config config;
	config.ws_url = "ws://127.0.0.1:" + std::to_string(server->port());
	config.joint_names = names;
	config.connection.connect_attempts = 3;
	config.connection.retry_delay = std::chrono::duration<double>(0.05);

	websim_bridge::websim_follower follower(config);
	follower.connect();
	expect(follower.is_connected(), "follower connected");
	expect(eventually([&server] { return server->session_count() == 1; }), "server counts the session");

	const auto sent = follower.act({{"a", 0.5}, {"b", -0.25}});
	expect(sent.delivered && sent.seq == 1, "command delivered");

	expect(eventually([&follower]
	{
		static_cast<void>(follower.observe());
		const auto confirmed = follower.confirmed_observation();
		return confirmed.position("a") == 0.5 && confirmed.position("b") == -0.25;
	}), "commanded targets come back as telemetry");

	follower.disconnect();
	expect(!follower.is_connected(), "follower disconnected");
	expect(eventually([&server] { return server->session_count() == 0; }), "server drops the session");

	follower.connect();
	expect(eventually([&server] { return server->session_count() == 1; }), "new session after reconnect");

	// Each session has its own joint state, so telemetry restarts at zero.
	expect(eventually([&follower]
	{
		static_cast<void>(follower.observe());
		return follower.confirmed_observation().position("a") == 0.;
	}), "new session starts at zero");

	server.reset();

	for (int i = 0; i < 400 && follower.is_connected(); ++i)
	{
		static_cast<void>(follower.observe());
		static_cast<void>(follower.act({{"a", 0.1}}));
		std::this_thread::sleep_for(std::chrono::milliseconds(5));
	}
	expect(!follower.is_connected(), "follower notices the endpoint is gone");

	const auto result = follower.act({{"a", 0.2}});
	expect(!result.delivered, "act reports the command as undelivered");
}


void oversized_frame_test()
{
	websim_bridge::websim_endpoint_server server("127.0.0.1", 0, {"a"});
	websim_bridge::websim_network_client client("ws://127.0.0.1:" + std::to_string(server.port()));

	client.connect();
	expect(eventually([&server] { return server.session_count() == 1; }), "server counts the session");

	try
	{
		client.send(std::string(websim_bridge::max_frame_size + 1, ' '));
	}
	catch (const websim_bridge::transport_closed_exception& exc)
	{
		// The server may close before the write has finished.
		std::cout << "oversized frame cut the write: " << exc.what() << '\n';
	}

	expect(eventually([&server, &client]
	{
		static_cast<void>(client.try_receive());
		return server.session_count() == 0;
	}), "server closes the session");
	expect(eventually([&client]
	{
		static_cast<void>(client.try_receive());
		return !client.is_connected();
	}), "client sees the close");
}
