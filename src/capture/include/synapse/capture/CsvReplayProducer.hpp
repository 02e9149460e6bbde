/**
 * @file CsvReplayProducer.hpp
 * @brief Capture producer replaying a recorded point cloud from a CSV file.
 *
 * File format: one point per line as @c x,y,z.  Blank lines and lines
 * starting with @c '#' are ignored.  A single non-numeric first row is
 * accepted as a column header.
 *
 * @copyright MIT License
 */

#pragma once

#include <synapse/capture/ICaptureProducer.hpp>
#include <synapse/concurrency/PeriodicTask.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace synapse::capture {

struct CsvReplayConfig {
    std::string filePath;
    core::usize batchSize = 256;
    std::chrono::milliseconds cadence{500};
    bool loop = false;
    CaptureDirectories directories;
};

/**
 * @brief Loads every point of a CSV file.
 *
 * @return the points in file order, or kFileNotFound / kFileParseError
 *         (the message names the offending line)
 */
[[nodiscard]] core::Expected<std::vector<stream::Sample>> loadPointCsv(const std::string &path);

class CsvReplayProducer final : public ICaptureProducer {
public:
    CsvReplayProducer(boost::asio::io_context &io, CsvReplayConfig config);
    ~CsvReplayProducer() override;

    [[nodiscard]] core::Expected<void> start() override;
    void stop() noexcept override;
    void setBatchHandler(BatchHandler handler) override;
    [[nodiscard]] bool running() const noexcept override;
    [[nodiscard]] ProducerInfo info() const override;

    [[nodiscard]] core::usize totalSamples() const noexcept { return _points.size(); }
    [[nodiscard]] core::usize cursor() const noexcept { return _cursor; }

private:
    void produce();

    boost::asio::io_context &_io;
    CsvReplayConfig _config;
    std::vector<stream::Sample> _points;
    core::usize _cursor = 0;
    BatchHandler _handler;
    std::unique_ptr<concurrency::PeriodicTask> _task;
};

} // namespace synapse::capture
