#include "inspector/log.hpp"

namespace inspector {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

} // namespace inspector
