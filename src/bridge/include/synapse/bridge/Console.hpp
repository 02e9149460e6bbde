// /////////////////////////////////////////////////////////////////////////////
/// @file Console.hpp
/// @brief Text command interpreter for the operator surface.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/core/Expected.hpp>

#include <string>
#include <string_view>

namespace synapse::bridge {

class Bridge;

// /////////////////////////////////////////////////////////////////////////////
/// @class Console
/// @brief Maps one command line onto a Bridge operation.
///
/// Commands: connect [ws-url], disconnect, start [cadence-ms], stop, state, stats,
/// help, quit.  Blank lines yield an empty reply.
// /////////////////////////////////////////////////////////////////////////////
class Console
{
public:
    explicit Console(Bridge& bridge);

    /// @return The reply text, or the error of the failed operation
    ///         (kInvalidArgument for unknown commands or bad arguments).
    [[nodiscard]] core::Expected<std::string> execute(std::string_view line);

    [[nodiscard]] bool quitRequested() const noexcept { return quit_; }

    [[nodiscard]] static std::string_view help() noexcept;

private:
    Bridge& bridge_;
    bool    quit_{false};
};

} // namespace synapse::bridge
