#pragma once

// This component provides platform-dependent miscellanea.

namespace webapi {
namespace correlation {

// Register the specified `on_fork` function to be invoked in a child process
// after `fork`.  Return zero on success, or a nonzero error code otherwise.
int at_fork_in_child(void (*on_fork)());

}  // namespace correlation
}  // namespace webapi
