#include "tusc/client/concurrency_guard.hpp"

#include <string>
#include <utility>

namespace tusc::client
{

    ConcurrencyGuard::ConcurrencyGuard(StateStore &store, const ProcessProbe &probe,
                                       std::chrono::seconds activity_window, Logger logger)
        : store_(store),
          probe_(probe),
          activity_window_(activity_window),
          logger_(std::move(logger)) {}

    ConcurrencyReport ConcurrencyGuard::check_active(const StateKey &key)
    {
        ConcurrencyReport report;
        const auto now = std::chrono::system_clock::now();
        for (const auto &record : store_.records(key))
        {
            if (record.owner == store_.owner())
            {
                continue;
            }
            if (!probe_.is_alive(record.owner))
            {
                logger_.log("guard", "purging record of exited process ", record.owner);
                store_.remove(record);
                continue;
            }
            if (now - record.modified < activity_window_)
            {
                ++report.active;
            }
        }
        if (report.active > 0)
        {
            report.warning = "detected " + std::to_string(report.active) +
                             " other active upload(s) of this file; progress may be duplicated";
            logger_.warn("guard", *report.warning);
        }
        return report;
    }

} // namespace tusc::client
