#pragma once

// Compatibility header for std::format
// Uses std::format when available, falls back to the fmt library bundled with spdlog

#if CODENEXUS_HAS_STD_FORMAT
#include <format>
namespace codenexus {
using std::format;
using std::format_to;
} // namespace codenexus
#else
#include <spdlog/fmt/fmt.h>

namespace codenexus {
using fmt::format;
using fmt::format_to;
} // namespace codenexus
#endif
