/**
 * @file CsvReplayProducer.cpp
 * @brief Implementation of the CSV replay capture producer.
 */

#include "synapse/capture/CsvReplayProducer.hpp"

#include <synapse/core/Log.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <optional>
#include <string_view>
#include <utility>

namespace synapse::capture {

namespace {

std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::optional<core::f64> parseNumber(std::string_view token)
{
    token = trim(token);
    if (token.empty())
        return std::nullopt;
    if (token.front() == '+')
        token.remove_prefix(1);

    core::f64 value = 0.0;
    const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || end != token.data() + token.size())
        return std::nullopt;
    return value;
}

std::optional<stream::Sample> parseRow(std::string_view line)
{
    core::f64 coords[3] = {};
    core::usize column = 0;

    while (true) {
        const auto comma = line.find(',');
        const auto token = line.substr(0, comma);
        if (column >= 3)
            return std::nullopt;
        const auto value = parseNumber(token);
        if (!value)
            return std::nullopt;
        coords[column++] = *value;
        if (comma == std::string_view::npos)
            break;
        line.remove_prefix(comma + 1);
    }

    if (column != 3)
        return std::nullopt;
    return stream::Sample{coords[0], coords[1], coords[2]};
}

} // namespace

core::Expected<std::vector<stream::Sample>> loadPointCsv(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return core::makeError(core::ErrorCode::kFileNotFound, path);

    std::vector<stream::Sample> points;
    std::string line;
    core::usize lineNo = 0;
    bool headerAllowed = true;

    while (std::getline(file, line)) {
        ++lineNo;
        const auto text = trim(line);
        if (text.empty() || text.front() == '#')
            continue;

        auto row = parseRow(text);
        if (!row) {
            if (headerAllowed) {
                headerAllowed = false;
                continue;
            }
            return core::makeError(core::ErrorCode::kFileParseError,
                path + ":" + std::to_string(lineNo) + ": expected 'x,y,z', got '"
                + std::string(text) + "'");
        }
        headerAllowed = false;
        points.push_back(*row);
    }

    if (points.empty()) {
        return core::makeError(core::ErrorCode::kFileParseError,
            "CSV file has no points: " + path);
    }
    return points;
}

CsvReplayProducer::CsvReplayProducer(boost::asio::io_context &io, CsvReplayConfig config)
    : _io(io)
    , _config(std::move(config))
{
}

CsvReplayProducer::~CsvReplayProducer()
{
    stop();
}

core::Expected<void> CsvReplayProducer::start()
{
    if (_task) {
        return core::makeError(core::ErrorCode::kAlreadyRunning,
            "CsvReplayProducer already running");
    }
    if (_config.batchSize == 0 || _config.cadence.count() <= 0) {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "CsvReplayProducer needs a positive batch size and cadence");
    }

    _points = SYNAPSE_TRY(loadPointCsv(_config.filePath));
    _cursor = 0;
    _task = std::make_unique<concurrency::PeriodicTask>(
        _io, _config.cadence, [this] { produce(); });

    core::Log::info("CAPTURE", "replaying " + std::to_string(_points.size())
        + " points from " + _config.filePath + (_config.loop ? " (looping)" : ""));
    return {};
}

void CsvReplayProducer::stop() noexcept
{
    if (!_task)
        return;
    _task->cancel();
    _task.reset();
}

void CsvReplayProducer::setBatchHandler(BatchHandler handler)
{
    _handler = std::move(handler);
}

bool CsvReplayProducer::running() const noexcept
{
    return _task != nullptr;
}

ProducerInfo CsvReplayProducer::info() const
{
    return ProducerInfo{
        .name = "CSV Replay (" + _config.filePath + ")",
        .directories = _config.directories
    };
}

void CsvReplayProducer::produce()
{
    const auto count = std::min(_config.batchSize, _points.size() - _cursor);
    std::vector<stream::Sample> batch(_points.begin() + static_cast<std::ptrdiff_t>(_cursor),
                                      _points.begin() + static_cast<std::ptrdiff_t>(_cursor + count));
    _cursor += count;

    if (_cursor >= _points.size()) {
        if (_config.loop) {
            _cursor = 0;
        } else {
            core::Log::info("CAPTURE", "replay finished: " + _config.filePath);
            stop();
        }
    }

    if (!_handler)
        return;
    const BatchHandler handler = _handler;
    handler(std::move(batch));
}

} // namespace synapse::capture
