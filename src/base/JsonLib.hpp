#ifndef __WB_JSON_LIB__
#define __WB_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

#endif  // __WB_JSON_LIB__
