/**
 *************************************************************************
 *
 * @file exception.hpp
 *
 * Error types of the bridge. All of them derive from bridge_exception.
 *
 ************************************************************************/

#pragma once


#include <stdexcept>
#include <string>


namespace websim_bridge
{
/**
 *************************************************************************
 *
 * @class bridge_exception
 *
 * Common base carrying a human readable reason, so high level code
 * can handle every bridge failure in one catch clause.
 *
 ************************************************************************/
class bridge_exception : public std::runtime_error
{
public:
	explicit bridge_exception(const std::string& reason)
		: std::runtime_error(reason)
	{
	}
};


/// connect() on a follower that still holds a live connection.
class already_connected_exception : public bridge_exception
{
public:
	using bridge_exception::bridge_exception;
};


/// The operation needs a connection and there is none.
class not_connected_exception : public bridge_exception
{
public:
	using bridge_exception::bridge_exception;
};


/// Every connect attempt within the retry budget failed.
class connection_failed_exception : public bridge_exception
{
public:
	using bridge_exception::bridge_exception;
};


/**
 * A send failed because the peer closed or the write timed out.
 * The connection handle has been dropped by the time this is thrown.
 */
class transport_closed_exception : public bridge_exception
{
public:
	using bridge_exception::bridge_exception;
};


/// Rejected follower, endpoint or logger setup.
class invalid_configuration_exception : public bridge_exception
{
public:
	using bridge_exception::bridge_exception;
};
} /* namespace websim_bridge */
