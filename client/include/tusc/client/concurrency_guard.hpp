#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "tusc/client/logger.hpp"
#include "tusc/client/process_probe.hpp"
#include "tusc/client/state_store.hpp"

namespace tusc::client
{

    struct ConcurrencyReport
    {
        std::size_t active{};
        std::optional<std::string> warning;
    };

    // Advisory only. Another process may start writing between this check and
    // our next save; nothing here excludes it. Use the result for warnings,
    // never as a lock.
    class ConcurrencyGuard
    {
    public:
        ConcurrencyGuard(StateStore &store, const ProcessProbe &probe,
                         std::chrono::seconds activity_window = std::chrono::minutes(5), Logger logger = {});

        // Counts other owners that are alive and saved within the activity
        // window. Records of dead owners are purged on the way.
        ConcurrencyReport check_active(const StateKey &key);

    private:
        StateStore &store_;
        const ProcessProbe &probe_;
        std::chrono::seconds activity_window_;
        Logger logger_;
    };

} // namespace tusc::client
