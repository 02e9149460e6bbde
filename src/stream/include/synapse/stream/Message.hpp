// /////////////////////////////////////////////////////////////////////////////
/// @file Message.hpp
/// @brief Timestamped batch of samples with a type discriminator.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <synapse/stream/Sample.hpp>
#include <synapse/core/Types.hpp>

#include <span>
#include <string>
#include <vector>

namespace synapse::stream {

/// @brief Milliseconds since the Unix epoch (system clock).
[[nodiscard]] core::i64 nowMillis() noexcept;

// /////////////////////////////////////////////////////////////////////////////
/// @class Message
/// @brief Immutable envelope payload: {type, timestamp, data}.
// /////////////////////////////////////////////////////////////////////////////
class Message
{
public:
    Message(std::string type, core::i64 timestampMs, std::vector<Sample> data);

    /// @brief Builds a "pointcloud" message stamped with the current time.
    [[nodiscard]] static Message pointCloud(std::vector<Sample> data);

    [[nodiscard]] const std::string&   type()      const noexcept { return type_; }
    [[nodiscard]] core::i64            timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] std::span<const Sample> data()   const noexcept { return data_; }
    [[nodiscard]] core::usize          size()      const noexcept { return data_.size(); }

private:
    std::string         type_;
    core::i64           timestamp_;
    std::vector<Sample> data_;
};

} // namespace synapse::stream
