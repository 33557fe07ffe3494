#pragma once

#include <memory>
#include <string>

namespace tusc::client
{

    // Answers whether the process that owns a state record is still running.
    class ProcessProbe
    {
    public:
        virtual ~ProcessProbe() = default;

        virtual bool is_alive(const std::string &owner) const = 0;
    };

    // kill(pid, 0): alive when the signal could be delivered or was refused
    // for permission reasons.
    class SignalProcessProbe : public ProcessProbe
    {
    public:
        bool is_alive(const std::string &owner) const override;
    };

    // For platforms without process signals. Reports every owner as alive so
    // that nothing is purged on a guess.
    class AssumeAliveProcessProbe : public ProcessProbe
    {
    public:
        bool is_alive(const std::string &owner) const override;
    };

    std::unique_ptr<ProcessProbe> make_default_process_probe();

    std::string current_process_owner();

} // namespace tusc::client
