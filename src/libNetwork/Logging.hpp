#pragma once

#include "Logger/Logger.hpp"

namespace fishbowl::network {

//! Returns the transport logger, configured on first use.
Logging::Logger Logger();

} // namespace fishbowl::network