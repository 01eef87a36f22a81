#pragma once

#include <string>

namespace buildq::util {

// Random RFC4122 v4 id in canonical lowercase form. Used for job ids and
// callback attempt ids.
std::string NewId();

} // namespace buildq::util
