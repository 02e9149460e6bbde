// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Bridge configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder or
/// parsed from the command line.  Centralises all tuneable bridge
/// parameters.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <synapse/capture/ProducerFactory.hpp>
#include <synapse/net/Endpoint.hpp>
#include <synapse/core/Constants.hpp>
#include <synapse/core/Expected.hpp>
#include <synapse/core/Log.hpp>
#include <synapse/core/Types.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace synapse::bridge {

/// @brief Immutable bridge configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& host(std::string value);
        Builder& port(core::u16 value) noexcept;
        Builder& path(std::string value);
        /// @brief Sets host, port and path at once.
        Builder& endpoint(const net::Endpoint& value);
        Builder& cadence(std::chrono::milliseconds value) noexcept;
        Builder& batchSize(core::usize value) noexcept;
        Builder& seed(core::u64 value) noexcept;
        Builder& producer(capture::ProducerMode mode) noexcept;
        Builder& replayFile(std::string value);
        Builder& loop(bool enabled) noexcept;
        Builder& checkpointDirectory(std::string value);
        Builder& imagesDirectory(std::string value);
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const;

    private:
        std::string               host_{core::kDefaultHost};
        core::u16                 port_{core::kDefaultPort};
        std::string               path_{core::kDefaultTarget};
        std::chrono::milliseconds cadence_{core::kDefaultCadenceMs};
        core::usize               batchSize_{core::kDefaultBatchSize};
        core::u64                 seed_{0};
        capture::ProducerMode     producer_{capture::ProducerMode::kNone};
        std::string               replayFile_;
        bool                      loop_{false};
        std::string               checkpointDirectory_;
        std::string               imagesDirectory_;
        core::LogLevel            logLevel_{core::LogLevel::kInfo};
    };

    /// @brief Parses command-line flags (see usage()).
    ///
    /// Unknown flags, missing values and out-of-range numbers are
    /// kInvalidArgument errors.  @c --help sets helpRequested().
    [[nodiscard]] static core::Expected<Config> fromArgs(int argc, const char* const* argv);

    [[nodiscard]] static std::string usage(std::string_view program);

    [[nodiscard]] const std::string&        host()       const noexcept { return host_; }
    [[nodiscard]] core::u16                 port()       const noexcept { return port_; }
    [[nodiscard]] const std::string&        path()       const noexcept { return path_; }
    [[nodiscard]] std::chrono::milliseconds cadence()    const noexcept { return cadence_; }
    [[nodiscard]] core::usize               batchSize()  const noexcept { return batchSize_; }
    [[nodiscard]] core::u64                 seed()       const noexcept { return seed_; }
    [[nodiscard]] capture::ProducerMode     producer()   const noexcept { return producer_; }
    [[nodiscard]] const std::string&        replayFile() const noexcept { return replayFile_; }
    [[nodiscard]] bool                      loop()       const noexcept { return loop_; }
    [[nodiscard]] core::LogLevel            logLevel()   const noexcept { return logLevel_; }
    [[nodiscard]] bool                      helpRequested() const noexcept { return helpRequested_; }

    [[nodiscard]] const capture::CaptureDirectories& directories() const noexcept { return directories_; }

    /// @brief ws://host:port/path
    [[nodiscard]] net::Endpoint endpoint() const;

    /// @brief Producer settings derived from this configuration.
    [[nodiscard]] capture::ProducerConfig producerConfig() const;

private:
    friend class Builder;

    std::string                 host_{core::kDefaultHost};
    core::u16                   port_{core::kDefaultPort};
    std::string                 path_{core::kDefaultTarget};
    std::chrono::milliseconds   cadence_{core::kDefaultCadenceMs};
    core::usize                 batchSize_{core::kDefaultBatchSize};
    core::u64                   seed_{0};
    capture::ProducerMode       producer_{capture::ProducerMode::kNone};
    std::string                 replayFile_;
    bool                        loop_{false};
    capture::CaptureDirectories directories_;
    core::LogLevel              logLevel_{core::LogLevel::kInfo};
    bool                        helpRequested_{false};
};

} // namespace synapse::bridge
