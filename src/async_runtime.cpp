#include "ringchan/async_runtime.hpp"

namespace ringchan {

async_runtime g_runtime;

} // namespace ringchan
