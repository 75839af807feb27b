#pragma once

#include <functional>

namespace gridsync {

/**
 * Deferred work hook: run the task on a later main-loop iteration,
 * never synchronously inside the caller.
 */
using Scheduler = std::function<void(std::function<void()>)>;

/**
 * Queue task on the default GLib main context with zero delay.
 * The source is not cancelled once added.
 */
void dispatch_next_tick(std::function<void()> task);

} // namespace gridsync
