// /////////////////////////////////////////////////////////////////////////////
/// @file Envelope.cpp
/// @brief nlohmann::json backed envelope codec.
// /////////////////////////////////////////////////////////////////////////////

#include <synapse/protocol/Envelope.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <utility>
#include <vector>

namespace synapse::protocol {

namespace {

using json = nlohmann::json;

core::Expected<core::f64> readCoordinate(const json& point, const char* key, core::usize index)
{
    const auto it = point.find(key);
    if (it == point.end() || !it->is_number())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               "data[" + std::to_string(index) + "]." + key + " missing or not a number");
    }
    return it->get<core::f64>();
}

} // namespace

core::Expected<std::string> serialize(const stream::Message& message)
{
    json data = json::array();
    data.get_ref<json::array_t&>().reserve(message.size());

    core::usize index = 0;
    for (const auto& s : message.data())
    {
        if (!std::isfinite(s.x) || !std::isfinite(s.y) || !std::isfinite(s.z))
        {
            return core::makeError(core::ErrorCode::kSerializationFailed,
                                   "sample " + std::to_string(index) + " has a non-finite coordinate");
        }
        data.push_back(json{{"x", s.x}, {"y", s.y}, {"z", s.z}});
        ++index;
    }

    json envelope = {
        {"type", message.type()},
        {"timestamp", message.timestamp()},
        {"data", std::move(data)},
    };

    try
    {
        return envelope.dump();
    }
    catch (const json::exception& e)
    {
        return core::makeError(core::ErrorCode::kSerializationFailed, e.what());
    }
}

core::Expected<stream::Message> parse(std::string_view text)
{
    const json envelope = json::parse(text, nullptr, false);
    if (envelope.is_discarded())
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed, "envelope is not valid JSON");
    }
    if (!envelope.is_object())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "envelope must be a JSON object");
    }

    const auto type = envelope.find("type");
    if (type == envelope.end() || !type->is_string())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "'type' missing or not a string");
    }

    const auto timestamp = envelope.find("timestamp");
    if (timestamp == envelope.end() || !timestamp->is_number_integer())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "'timestamp' missing or not an integer");
    }

    const auto data = envelope.find("data");
    if (data == envelope.end() || !data->is_array())
    {
        return core::makeError(core::ErrorCode::kProtocolViolation, "'data' missing or not an array");
    }

    std::vector<stream::Sample> samples;
    samples.reserve(data->size());
    for (core::usize i = 0; i < data->size(); ++i)
    {
        const json& point = (*data)[i];
        if (!point.is_object())
        {
            return core::makeError(core::ErrorCode::kProtocolViolation,
                                   "data[" + std::to_string(i) + "] is not an object");
        }

        stream::Sample s;
        s.x = SYNAPSE_TRY(readCoordinate(point, "x", i));
        s.y = SYNAPSE_TRY(readCoordinate(point, "y", i));
        s.z = SYNAPSE_TRY(readCoordinate(point, "z", i));
        samples.push_back(s);
    }

    return stream::Message{type->get<std::string>(), timestamp->get<core::i64>(), std::move(samples)};
}

} // namespace synapse::protocol
