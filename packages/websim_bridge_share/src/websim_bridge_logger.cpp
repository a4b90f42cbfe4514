/**
 *************************************************************************
 *
 * @file websim_bridge_logger.cpp
 *
 * Buffered csv recorder, implementation.
 *
 ************************************************************************/
#include "websim_bridge_logger.hpp"

#include <fstream>
#include <iostream>
#include <utility>

#include "exception.hpp"


namespace websim_bridge
{
namespace
{
constexpr const char* padded_number = "0.000000";
constexpr const char* padded_text = "none";
}


logger::logger(
	std::string filename,
	std::vector<std::string> joint_names,
	int num_joint_data,
	int num_single,
	int size_arbitrary,
	std::size_t flush_rows)
	: filename_(std::move(filename)),
	  joint_names_(std::move(joint_names)),
	  joint_groups_(num_joint_data),
	  single_count_(num_single),
	  text_count_(size_arbitrary),
	  flush_rows_(flush_rows == 0 ? 1 : flush_rows)
{
}


logger::~logger() noexcept
{
	try
	{
		stop_logging();
	}
	catch (const std::exception& exc)
	{
		std::cerr << "logger::~logger(): Lost recording for " << filename_ << ": " << exc.what() << '\n';
	}
}


//////////////////////////////////////////////////////////////////////////
//
// recording
//
//////////////////////////////////////////////////////////////////////////


void logger::start_logging(
	const std::vector<std::string>& joint_data_prefixes,
	const std::vector<std::string>& single_header,
	const std::vector<std::string>& arbitrary_header)
{
	discard_log();

	std::string mismatched;
	if (std::cmp_not_equal(joint_data_prefixes.size(), joint_groups_))
		mismatched += " joint prefixes";
	if (std::cmp_not_equal(single_header.size(), single_count_))
		mismatched += " single values";
	if (std::cmp_not_equal(arbitrary_header.size(), text_count_))
		mismatched += " text entries";

	if (!mismatched.empty())
		throw invalid_configuration_exception(
			"logger::start_logging(): Header does not match the column layout in:" + mismatched);

	std::vector<std::string> header;
	header.reserve(column_count());

	for (const auto& prefix : joint_data_prefixes)
		for (const auto& joint : joint_names_)
			header.push_back(prefix + "." + joint);
	header.insert(header.end(), single_header.begin(), single_header.end());
	header.insert(header.end(), arbitrary_header.begin(), arbitrary_header.end());

	append_row(header);
	active_ = true;
}


void logger::stop_logging()
{
	if (!active_)
		return;

	const std::string contents = rows_.str();
	const bool append = flushed_;
	discard_log();

	write_rows(contents, append);
}


void logger::log()
{
	fit_pending_to_layout();

	std::vector<std::string> cells;
	cells.reserve(column_count());

	for (const auto& group : pending_joints_)
		for (Eigen::Index j = 0; std::cmp_less(j, joint_names_.size()); ++j)
			cells.push_back(j < group.size() ? std::to_string(group(j)) : padded_number);
	for (double value : pending_singles_)
		cells.push_back(std::to_string(value));
	cells.insert(cells.end(), pending_texts_.begin(), pending_texts_.end());

	append_row(cells);
	drop_pending();

	if (buffered_rows_ < flush_rows_)
		return;

	write_rows(rows_.str(), flushed_);
	rows_.str({});
	buffered_rows_ = 0;
	flushed_ = true;
}


void logger::discard_log()
{
	rows_.str({});
	buffered_rows_ = 0;
	flushed_ = false;
	drop_pending();
	active_ = false;
}


bool logger::logging() const noexcept
{
	return active_;
}


std::size_t logger::buffered_rows() const noexcept
{
	return buffered_rows_;
}


void logger::add_joint_data(const joint_positions& data)
{
	pending_joints_.push_back(data);
}


void logger::add_single_data(double data)
{
	pending_singles_.push_back(data);
}


void logger::add_arbitrary_data(const std::string& data)
{
	pending_texts_.push_back(data);
}


//////////////////////////////////////////////////////////////////////////
//
// helpers
//
//////////////////////////////////////////////////////////////////////////


std::size_t logger::column_count() const
{
	return joint_groups_ * joint_names_.size() + single_count_ + text_count_;
}


void logger::drop_pending()
{
	pending_joints_.clear();
	pending_singles_.clear();
	pending_texts_.clear();
}


void logger::append_row(const std::vector<std::string>& cells)
{
	const char* separator = "";
	for (const auto& cell : cells)
	{
		rows_ << separator << cell;
		separator = ",";
	}
	rows_ << '\n';
	++buffered_rows_;
}


void logger::write_rows(const std::string& contents, bool append) const
{
	std::ofstream file(filename_, std::ios::out | (append ? std::ios::app : std::ios::trunc));
	if (!file)
		throw std::ios_base::failure("cannot open log file " + filename_);
	file << contents;
	if (!file)
		throw std::ios_base::failure("cannot write log file " + filename_);
}


void logger::fit_pending_to_layout()
{
	std::string surplus;
	std::string padded;

	const auto fit = [&](auto& entries, int expected, const auto& filler, const char* category)
	{
		if (std::cmp_greater(entries.size(), expected))
		{
			entries.resize(expected);
			surplus += category;
		}
		else if (std::cmp_less(entries.size(), expected))
		{
			entries.resize(expected, filler);
			padded += category;
		}
	};

	fit(pending_joints_, joint_groups_,
		joint_positions(joint_positions::Zero(static_cast<Eigen::Index>(joint_names_.size()))), " joints");
	fit(pending_singles_, single_count_, 0., " single values");
	fit(pending_texts_, text_count_, std::string(padded_text), " text entries");

	for (const auto& group : pending_joints_)
		if (std::cmp_not_equal(group.size(), joint_names_.size()))
		{
			padded += " joint entries";
			break;
		}

	if (!surplus.empty())
		std::cout << "logger::log(): Dropping surplus entries in:" << surplus << '\n';
	if (!padded.empty())
		std::cout << "logger::log(): Padding missing entries in:" << padded << '\n';
}
} /* namespace websim_bridge */
