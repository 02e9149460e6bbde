/**
 * @file Constants.hpp
 * @brief Bridge-wide compile-time defaults.
 *
 * Wire constants and the default cadence/batch parameters of the
 * simulated stream live here so that a single header controls the
 * bridge's fundamental operating parameters.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef SYNAPSE_CORE_CONSTANTS_HPP
    #define SYNAPSE_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <string_view>

namespace synapse::core {

inline constexpr std::string_view kPointCloudType   = "pointcloud";

inline constexpr std::string_view kDefaultHost      = "localhost";
inline constexpr std::string_view kDefaultListen    = "0.0.0.0";
inline constexpr std::string_view kDefaultTarget    = "/";
inline constexpr u16              kDefaultPort      = 8081;

inline constexpr u32              kDefaultCadenceMs = 500;
inline constexpr usize            kDefaultBatchSize = 256;

inline constexpr u32              kConnectTimeoutMs = 5'000;
inline constexpr usize            kMaxFrameBytes    = 16 * 1024 * 1024;

inline constexpr std::string_view kAckReply         = "ACK";

} // namespace synapse::core

#endif // SYNAPSE_CORE_CONSTANTS_HPP
