/**
 * @file ProducerFactory.cpp
 * @brief Implementation of the ProducerFactory.
 */

#include "synapse/capture/ProducerFactory.hpp"
#include "synapse/capture/CsvReplayProducer.hpp"
#include "synapse/capture/ExternalProducer.hpp"
#include "synapse/capture/SyntheticProducer.hpp"

namespace synapse::capture {

core::Expected<ProducerMode> parseProducerMode(std::string_view text)
{
    if (text == "none")
        return ProducerMode::kNone;
    if (text == "synthetic")
        return ProducerMode::kSynthetic;
    if (text == "replay")
        return ProducerMode::kCsvReplay;
    if (text == "external")
        return ProducerMode::kExternal;
    return core::makeError(core::ErrorCode::kInvalidArgument,
        "unknown producer '" + std::string(text) + "' (expected none|synthetic|replay|external)");
}

std::string_view toString(ProducerMode mode) noexcept
{
    switch (mode) {
        case ProducerMode::kNone:      return "none";
        case ProducerMode::kSynthetic: return "synthetic";
        case ProducerMode::kCsvReplay: return "replay";
        case ProducerMode::kExternal:  return "external";
    }
    return "unknown";
}

core::Expected<std::unique_ptr<ICaptureProducer>>
ProducerFactory::create(boost::asio::io_context &io, const ProducerConfig &config)
{
    switch (config.mode) {
        case ProducerMode::kNone:
            return core::makeError(core::ErrorCode::kInvalidArgument,
                "no capture producer configured");

        case ProducerMode::kSynthetic:
            return std::make_unique<SyntheticProducer>(io, SyntheticProducerConfig{
                .seed = config.seed,
                .batchSize = config.batchSize,
                .cadence = config.cadence,
                .directories = config.directories
            });

        case ProducerMode::kCsvReplay:
            if (config.replayFile.empty()) {
                return core::makeError(core::ErrorCode::kInvalidArgument,
                    "replay producer requires a file path");
            }
            return std::make_unique<CsvReplayProducer>(io, CsvReplayConfig{
                .filePath = config.replayFile,
                .batchSize = config.batchSize,
                .cadence = config.cadence,
                .loop = config.loop,
                .directories = config.directories
            });

        case ProducerMode::kExternal:
            return std::make_unique<ExternalProducer>(io, config.externalName, config.directories);
    }

    return core::makeError(core::ErrorCode::kInvalidArgument, "unknown producer mode");
}

} // namespace synapse::capture
