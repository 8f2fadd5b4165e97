//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Types.hpp"

namespace lion::frontends::lioncode
{

const char *toString(Type type)
{
    switch (type)
    {
        case Type::Number:
            return "number";
        case Type::String:
            return "string";
        case Type::Boolean:
            return "boolean";
        case Type::Unknown:
            return "unknown";
    }
    return "unknown";
}

} // namespace lion::frontends::lioncode
