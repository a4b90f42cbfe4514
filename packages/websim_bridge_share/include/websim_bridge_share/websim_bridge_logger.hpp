#ifndef INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSIM_BRIDGE_LOGGER_HPP
#define INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSIM_BRIDGE_LOGGER_HPP
/**
 *************************************************************************
 *
 * @file websim_bridge_logger.hpp
 *
 * Buffered csv recorder for joint trajectories.
 *
 ************************************************************************/


#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include "websim_bridge_util.hpp"


namespace websim_bridge
{
/***************************************************
*
* @class logger
*
* Collects rows of three column groups in memory and
* writes them to a csv file. At most flush_rows rows
* are held; the buffer is appended to the file when
* full and when the recording ends:
*
*  - joint groups, one column per schema joint,
*    named "<prefix>.<joint>"
*  - numeric single values (seq, timestamps, ...)
*  - free text entries
*
* The column layout is fixed at construction. Only
* start_logging() throws on a layout mismatch; rows
* with missing entries are padded with 0 or "none"
* and surplus entries are dropped with a warning.
*
***************************************************/
class logger
{
public:
	static constexpr std::size_t default_flush_rows = 4096;

	/// flush_rows of 0 is treated as 1.
	logger(
		std::string filename,
		std::vector<std::string> joint_names,
		int num_joint_data,
		int num_single,
		int size_arbitrary,
		std::size_t flush_rows = default_flush_rows);

	/// Flushes an unfinished recording.
	~logger() noexcept;

	/**
	 * Begins a new recording and buffers its header row. Anything
	 * recorded before is dropped. Throws invalid_configuration_exception
	 * if a header list does not match the layout; the logger then
	 * stays idle.
	 */
	void start_logging(
		const std::vector<std::string>& joint_data_prefixes,
		const std::vector<std::string>& single_header,
		const std::vector<std::string>& arbitrary_header);

	/**
	 * Ends the recording and writes the remaining rows. The first write
	 * of a recording replaces the target file, later ones append.
	 * No-op while idle. Throws std::ios_base::failure if the file
	 * cannot be opened; the rows are lost in that case.
	 */
	void stop_logging();

	/**
	 * Turns the entries added since the last row into a buffered row.
	 * Writes the buffer once it holds flush_rows rows. Throws
	 * std::ios_base::failure if that write fails; the rows stay
	 * buffered and the recording goes on.
	 */
	void log();

	/**
	 * Ends the recording and drops the buffered rows. Rows written
	 * by an earlier flush stay in the target file.
	 */
	void discard_log();

	/// Rows waiting for the next write, header included.
	[[nodiscard]] std::size_t buffered_rows() const noexcept;

	[[nodiscard]] bool logging() const noexcept;

	void add_joint_data(const joint_positions& data);
	void add_single_data(double data);
	void add_arbitrary_data(const std::string& data);

private:
	std::string filename_;
	std::vector<std::string> joint_names_;

	int joint_groups_;
	int single_count_;
	int text_count_;

	std::vector<joint_positions> pending_joints_;
	std::vector<double> pending_singles_;
	std::vector<std::string> pending_texts_;

	const std::size_t flush_rows_;

	bool active_ = false;
	std::ostringstream rows_;
	std::size_t buffered_rows_ = 0;
	// true once this recording has written to the file
	bool flushed_ = false;

	[[nodiscard]] std::size_t column_count() const;
	void drop_pending();
	void append_row(const std::vector<std::string>& cells);
	void write_rows(const std::string& contents, bool append) const;

	// pads or truncates the pending entries to the layout, warns on either
	void fit_pending_to_layout();
};

} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSIM_BRIDGE_LOGGER_HPP
