#ifndef INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSOCKET_FORWARD_HPP
#define INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSOCKET_FORWARD_HPP
/**
 *************************************************************************
 *
 * @file websocket_forward.hpp
 *
 * Forward declarations for asio and the websocketpp client.
 *
 ************************************************************************/

namespace asio
{
class io_context;
} /* namespace asio */


namespace websocketpp
{
namespace config
{
struct asio_client;
} /* namespace websocketpp::config */

template <typename config> class client;
template <typename config> class connection;
} /* namespace websocketpp */


namespace websim_bridge
{
using websocket_client = websocketpp::client<websocketpp::config::asio_client>;
using websocket_client_connection = websocketpp::connection<websocketpp::config::asio_client>;
} /* namespace websim_bridge */

#endif // INCLUDED__WEBSIM_BRIDGE_SHARE__WEBSOCKET_FORWARD_HPP
