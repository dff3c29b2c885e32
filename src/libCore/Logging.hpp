#pragma once

#include "Logger/Logger.hpp"

namespace fishbowl {

//! Returns the engine logger, configured on first use.
Logging::Logger Logger();

} // namespace fishbowl
