#ifndef REALTIME_CLIENTPP_CONFIG_HPP
#define REALTIME_CLIENTPP_CONFIG_HPP

#define REALTIME_CLIENTPP_NAMESPACE realtime_clientpp

#include "common/cppconfig.hpp"

#include <boost/signals2.hpp>
#include <boost/asio.hpp>
#include <string>

namespace REALTIME_CLIENTPP_NAMESPACE
{
namespace lib
{

typedef std::string SubscriptionId;
typedef std::string EventName;
namespace asio = boost::asio;
typedef asio::strand<asio::io_service::executor_type> Strand;

using boost::signals2::signal;

}
}

#endif // REALTIME_CLIENTPP_CONFIG_HPP
