#include "tusc/client/process_probe.hpp"

#include "tusc/http_message.hpp"

#ifdef _WIN32
#include <process.h>
#else
#include <cerrno>
#include <limits>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace tusc::client
{

    bool SignalProcessProbe::is_alive(const std::string &owner) const
    {
#ifdef _WIN32
        (void)owner;
        return true;
#else
        const auto pid = http::parse_unsigned(owner);
        if (!pid || *pid == 0 || *pid > static_cast<std::uint64_t>(std::numeric_limits<pid_t>::max()))
        {
            return false;
        }
        if (::kill(static_cast<pid_t>(*pid), 0) == 0)
        {
            return true;
        }
        return errno == EPERM;
#endif
    }

    bool AssumeAliveProcessProbe::is_alive(const std::string &) const
    {
        return true;
    }

    std::unique_ptr<ProcessProbe> make_default_process_probe()
    {
#ifdef _WIN32
        return std::make_unique<AssumeAliveProcessProbe>();
#else
        return std::make_unique<SignalProcessProbe>();
#endif
    }

    std::string current_process_owner()
    {
#ifdef _WIN32
        return std::to_string(::_getpid());
#else
        return std::to_string(::getpid());
#endif
    }

} // namespace tusc::client
