#pragma once

#include "Logger/Logger.hpp"

namespace fishbowl::server {

//! Returns the server logger, configured on first use.
Logging::Logger Logger();

} // namespace fishbowl::server
