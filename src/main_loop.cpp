#include "main_loop.hpp"
#include "logger.hpp"
#include <glib.h>
#include <exception>
#include <utility>

namespace gridsync {

void dispatch_next_tick(std::function<void()> task) {
    struct TickData { std::function<void()> task; };
    auto* data = new TickData{std::move(task)};
    g_timeout_add(0, +[](gpointer user_data) -> gboolean {
        auto* d = static_cast<TickData*>(user_data);
        try {
            if (d->task) {
                d->task();
            }
        } catch (const std::exception& e) {
            Logger::error(std::string("[MainLoop] Deferred task failed: ") + e.what());
        } catch (...) {
            Logger::error("[MainLoop] Deferred task failed with a non-standard exception");
        }
        delete d;
        return G_SOURCE_REMOVE;
    }, data);
}

} // namespace gridsync
