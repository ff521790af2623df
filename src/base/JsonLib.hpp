#ifndef __PTYMUX_JSON_LIB__
#define __PTYMUX_JSON_LIB__

#include "nlohmann/json.hpp"

namespace ptymux {
/**
 * @brief Event payloads and host commands are `nlohmann::json` values.
 */
using json = nlohmann::json;
}  // namespace ptymux

#endif  // __PTYMUX_JSON_LIB__
