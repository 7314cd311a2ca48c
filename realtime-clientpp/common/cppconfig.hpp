#ifndef REALTIME_CLIENTPP_CPPCONFIG_HPP
#define REALTIME_CLIENTPP_CPPCONFIG_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace REALTIME_CLIENTPP_NAMESPACE
{
namespace lib
{
using std::string;
using std::map;
using std::vector;

using std::function;
using std::bind;
using std::ref;

using std::shared_ptr;
using std::weak_ptr;
using std::make_shared;

}
}

#endif // REALTIME_CLIENTPP_CPPCONFIG_HPP
