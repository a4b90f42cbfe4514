#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <argparse/argparse.hpp>

#include <websim_bridge_share/exception.hpp>
#include <websim_bridge_share/websim_bridge_logger.hpp>
#include <websim_bridge_share/websim_bridge_messages.hpp>
#include <websim_bridge_share/websim_bridge_util.hpp>


static void command_round_trip_test();
static void state_round_trip_test();
static void decode_rejection_test();
static void decode_out_of_memory_test();
static void util_test();
static void logger_test();
static void logger_flush_test();


namespace
{
// While set, every allocation of this process fails.
std::atomic<bool> fail_allocations{false};


void expect(bool condition, const std::string& what)
{
	if (!condition)
		throw std::runtime_error("expectation failed: " + what);
}


websim_bridge::frame_error rejection_of(std::string_view payload)
{
	const auto frame = websim_bridge::decode_frame(payload);
	const auto* rejected = std::get_if<websim_bridge::rejected_frame>(&frame);
	if (!rejected)
		throw std::runtime_error("payload was accepted: " + std::string(payload));
	return rejected->error;
}


const std::vector<std::pair<std::string, std::function<void()>>> test_cases
{
	{"command_round_trip", command_round_trip_test},
	{"state_round_trip", state_round_trip_test},
	{"decode_rejection", decode_rejection_test},
	{"decode_out_of_memory", decode_out_of_memory_test},
	{"util", util_test},
	{"logger", logger_test},
	{"logger_flush", logger_flush_test}
};
}


void* operator new(std::size_t size)
{
	if (fail_allocations)
		throw std::bad_alloc();

	if (void* memory = std::malloc(size == 0 ? 1 : size))
		return memory;
	throw std::bad_alloc();
}


void operator delete(void* memory) noexcept
{
	std::free(memory);
}


void operator delete(void* memory, std::size_t) noexcept
{
	std::free(memory);
}


int main(int argc, char* argv[])
{
	argparse::ArgumentParser program("websim_bridge_share_test");

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


void command_round_trip_test()
{
	websim_bridge::command_joint_position command;
	command.seq = 42;
	command.names = {"shoulder_pan", "gripper", "elbow_flex"};
	command.target = {0.25, -1.5, 1e-7};
	command.timestamp = 1718000000.123456;

	const auto frame = websim_bridge::decode_frame(websim_bridge::encode_frame(command));
	const auto* decoded = std::get_if<websim_bridge::command_joint_position>(&frame);

	expect(decoded != nullptr, "command decodes as command");
	expect(*decoded == command, "decoded command equals the original");
	expect(decoded->names[1] == "gripper", "name order is kept");
}


void state_round_trip_test()
{
	websim_bridge::state_frame state;
	state.names = std::vector<std::string>{"a", "b"};
	state.joint_pos = {0.2, 0.3};
	state.timestamp = 12.5;

	auto frame = websim_bridge::decode_frame(websim_bridge::encode_frame(state));
	const auto* decoded = std::get_if<websim_bridge::state_frame>(&frame);
	expect(decoded != nullptr && *decoded == state, "named state round trip");

	frame = websim_bridge::decode_frame(R"({"type":"state","joint_pos":[0.2,0.3]})");
	decoded = std::get_if<websim_bridge::state_frame>(&frame);
	expect(decoded != nullptr, "positional state decodes");
	expect(!decoded->names && !decoded->timestamp, "names and timestamp are optional");
	expect(decoded->joint_pos == std::vector<double>{0.2, 0.3}, "positions are kept");

	frame = websim_bridge::decode_frame(R"({"type":"state","names":null,"joint_pos":[1.0]})");
	decoded = std::get_if<websim_bridge::state_frame>(&frame);
	expect(decoded != nullptr && !decoded->names, "null names count as absent");
}


void decode_rejection_test()
{
	using websim_bridge::frame_error;

	expect(rejection_of("not json") == frame_error::malformed_frame, "invalid JSON");
	expect(rejection_of("[1, 2]") == frame_error::malformed_frame, "JSON array");
	expect(rejection_of(R"({"seq":1})") == frame_error::missing_type, "missing type");
	expect(rejection_of(R"({"type":5})") == frame_error::malformed_frame, "numeric type");
	expect(rejection_of(R"({"type":"hello"})") == frame_error::unknown_type, "unknown type");

	expect(rejection_of(
		R"({"type":"cmd","seq":1,"mode":"torque","names":["a"],"target":[0.0],"timestamp":0.0})")
		== frame_error::unknown_mode, "unknown mode");
	expect(rejection_of(
		R"({"type":"cmd","seq":1,"names":["a"],"target":[0.0],"timestamp":0.0})")
		== frame_error::malformed_frame, "command without mode");
	expect(rejection_of(
		R"({"type":"cmd","seq":1,"mode":"joint_position","names":["a","b"],"target":[0.0],"timestamp":0.0})")
		== frame_error::schema_mismatch, "names and target mismatch");
	expect(rejection_of(
		R"({"type":"cmd","seq":-1,"mode":"joint_position","names":["a"],"target":[0.0],"timestamp":0.0})")
		== frame_error::malformed_frame, "negative sequence number");
	expect(rejection_of(
		R"({"type":"cmd","seq":1,"mode":"joint_position","names":["a"],"target":["x"],"timestamp":0.0})")
		== frame_error::malformed_frame, "non-numeric target");
	expect(rejection_of(
		R"({"type":"state","names":["a"],"joint_pos":[0.0,1.0]})")
		== frame_error::schema_mismatch, "state names and positions mismatch");
	expect(rejection_of(R"({"type":"state"})") == frame_error::malformed_frame, "state without positions");
}


void decode_out_of_memory_test()
{
	const std::string payload =
		R"({"type":"cmd","seq":1,"mode":"joint_position","names":["shoulder_pan"],"target":[0.0],"timestamp":0.0})";

	fail_allocations = true;
	const auto frame = websim_bridge::decode_frame(payload);
	fail_allocations = false;

	const auto* rejected = std::get_if<websim_bridge::rejected_frame>(&frame);
	expect(rejected != nullptr, "frame is rejected when memory runs out");
	expect(rejected->error == websim_bridge::frame_error::malformed_frame, "rejected as malformed");
	expect(rejected->reason.empty(), "reason stays empty");

	expect(std::holds_alternative<websim_bridge::command_joint_position>(websim_bridge::decode_frame(payload)),
		"the same payload decodes once memory is back");
}


void util_test()
{
	using websim_bridge::websim_bridge_util;

	const auto names = websim_bridge_util::default_joint_names();
	expect(names.size() == 6 && names.front() == "shoulder_pan" && names.back() == "gripper",
		"default schema is the SO-101 arm");

	expect(websim_bridge_util::index_of(names, "elbow_flex") == 2, "index of a known joint");
	expect(websim_bridge_util::index_of(names, "elbow") == -1, "index of an unknown joint");

	const std::vector<double> values{1., -2., 3.5};
	expect(websim_bridge_util::convert_to_std_vector(websim_bridge_util::convert_to_eigen(values)) == values,
		"eigen conversion keeps values");

	const double before = websim_bridge_util::wall_clock_seconds();
	expect(before > 1.6e9, "wall clock is seconds since the unix epoch");
	expect(websim_bridge_util::wall_clock_seconds() >= before, "wall clock does not run backwards");
}


void logger_test()
{
	const std::string file =
		(std::filesystem::temp_directory_path() / "websim_bridge_share_test_log.csv").string();

	{
		websim_bridge::logger log(file, {"a", "b"}, 1, 1, 1);

		bool rejected = false;
		try
		{
			log.start_logging({"commanded", "observed"}, {"seq"}, {"note"});
		}
		catch (const websim_bridge::invalid_configuration_exception&)
		{
			rejected = true;
		}
		expect(rejected, "header mismatch is rejected");
		expect(!log.logging(), "rejected header does not start logging");

		log.start_logging({"commanded"}, {"seq"}, {"note"});
		expect(log.logging(), "logging after start");

		log.add_joint_data((websim_bridge::joint_positions(2) << 0.5, -0.5).finished());
		log.add_single_data(1.);
		log.add_arbitrary_data("first");
		log.log();

		// Padded with zeros and "none".
		log.log();

		log.stop_logging();
		expect(!log.logging(), "not logging after stop");
	}

	std::ifstream in(file);
	std::vector<std::string> lines;
	for (std::string line; std::getline(in, line);)
		lines.push_back(line);
	in.close();
	std::remove(file.c_str());

	expect(lines.size() == 3, "header plus two rows");
	expect(lines[0] == "commanded.a,commanded.b,seq,note", "header is built from prefixes");
	expect(lines[1] == "0.500000,-0.500000,1.000000,first", "data row");
	expect(lines[2] == "0.000000,0.000000,0.000000,none", "padded row");
}


namespace
{
std::vector<std::string> read_lines(const std::string& file)
{
	std::ifstream in(file);
	std::vector<std::string> lines;
	for (std::string line; std::getline(in, line);)
		lines.push_back(line);
	return lines;
}
}


void logger_flush_test()
{
	const std::string file =
		(std::filesystem::temp_directory_path() / "websim_bridge_share_test_flush.csv").string();
	std::remove(file.c_str());

	const auto add_row = [](websim_bridge::logger& log, double seq)
	{
		log.add_joint_data((websim_bridge::joint_positions(1) << seq).finished());
		log.add_single_data(seq);
		log.log();
	};

	{
		websim_bridge::logger log(file, {"a"}, 1, 1, 0, 3);
		log.start_logging({"commanded"}, {"seq"}, {});

		add_row(log, 1.);
		expect(!std::filesystem::exists(file), "nothing written below the threshold");
		expect(log.buffered_rows() == 2, "header and one row buffered");

		add_row(log, 2.);
		expect(log.buffered_rows() == 0, "full buffer is written");
		expect(read_lines(file).size() == 3, "header and two rows on disk");

		add_row(log, 3.);
		add_row(log, 4.);
		add_row(log, 5.);
		expect(read_lines(file).size() == 6, "second batch is appended");

		add_row(log, 6.);
		log.stop_logging();
	}

	const auto lines = read_lines(file);
	expect(lines.size() == 7, "header plus six rows");
	expect(lines[0] == "commanded.a,seq", "single header");
	expect(lines[1] == "1.000000,1.000000" && lines[6] == "6.000000,6.000000", "rows in order");

	// A new recording replaces the file even after flushes.
	{
		websim_bridge::logger log(file, {"a"}, 1, 1, 0, 3);
		log.start_logging({"commanded"}, {"seq"}, {});
		add_row(log, 7.);
		log.stop_logging();
	}
	expect(read_lines(file).size() == 2, "file replaced by the next recording");

	std::remove(file.c_str());
}
