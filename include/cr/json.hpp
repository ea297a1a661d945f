#pragma once

#include <string>
#include <string_view>

namespace cr {

std::string json_escape(std::string_view s);

} // namespace cr
