/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every module of the bridge.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef SYNAPSE_CORE_TYPES_HPP
    #define SYNAPSE_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace synapse::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;

} // namespace synapse::core

#endif // SYNAPSE_CORE_TYPES_HPP
