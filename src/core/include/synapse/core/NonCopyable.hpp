/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef SYNAPSE_CORE_NON_COPYABLE_HPP
    #define SYNAPSE_CORE_NON_COPYABLE_HPP

namespace synapse::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace synapse::core

#endif // SYNAPSE_CORE_NON_COPYABLE_HPP
