#pragma once

#include "Logger/Logger.hpp"

namespace wordsmith::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wordsmith::network
