/**
 * @file ProducerFactory.hpp
 * @brief Factory for creating capture producers from a configuration.
 *
 * @copyright MIT License
 */

#pragma once

#include <synapse/capture/ICaptureProducer.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace boost::asio {
class io_context;
} // namespace boost::asio

namespace synapse::capture {

enum class ProducerMode : core::u8 {
    kNone,
    kSynthetic,
    kCsvReplay,
    kExternal
};

[[nodiscard]] core::Expected<ProducerMode> parseProducerMode(std::string_view text);
[[nodiscard]] std::string_view toString(ProducerMode mode) noexcept;

struct ProducerConfig {
    ProducerMode mode = ProducerMode::kNone;
    core::u64 seed = 0;
    core::usize batchSize = 256;
    std::chrono::milliseconds cadence{500};
    std::string replayFile;
    bool loop = false;
    std::string externalName = "external";
    CaptureDirectories directories;
};

class ProducerFactory final {
public:
    ProducerFactory() = delete;

    /**
     * @brief Creates a producer matching @p config.
     *
     * The producer is not started.
     *
     * @return the producer, or kInvalidArgument for kNone or a replay
     *         without a file
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<ICaptureProducer>>
    create(boost::asio::io_context &io, const ProducerConfig &config);
};

} // namespace synapse::capture
