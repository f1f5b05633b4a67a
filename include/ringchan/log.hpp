#ifndef RINGCHAN_LOG_HPP
#define RINGCHAN_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace ringchan {

// Library-wide logger named "ringchan". Created on first use with a colour
// stdout sink at info level; SPDLOG_LEVEL (e.g. "ringchan=debug") is applied
// on creation.
spdlog::logger &logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace ringchan

#endif // RINGCHAN_LOG_HPP
