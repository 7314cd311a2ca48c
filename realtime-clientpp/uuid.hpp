#ifndef REALTIME_CLIENTPP_UUID_HPP
#define REALTIME_CLIENTPP_UUID_HPP

#include "config.hpp"

#include <uuid/uuid.h>

namespace REALTIME_CLIENTPP_NAMESPACE
{
namespace lib
{

namespace uuid
{
    // Random (v4) id, lowercase
    inline string client_id()
    {
        uuid_t uuid;
        char strId[37];
        uuid_generate_random(uuid);
        uuid_unparse_lower(uuid, strId);
        return strId;
    }
}

}
}

#endif // REALTIME_CLIENTPP_UUID_HPP
