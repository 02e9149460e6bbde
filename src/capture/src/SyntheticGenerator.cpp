/**
 * @file SyntheticGenerator.cpp
 * @brief Implementation of the uniform point generator.
 */

#include "synapse/capture/SyntheticGenerator.hpp"

namespace synapse::capture {

namespace {

core::u64 resolveSeed(core::u64 seed)
{
    if (seed != 0)
        return seed;
    std::random_device rd;
    return (static_cast<core::u64>(rd()) << 32) ^ static_cast<core::u64>(rd());
}

} // namespace

SyntheticGenerator::SyntheticGenerator(core::u64 seed)
    : _seed(resolveSeed(seed))
    , _rng(_seed)
{
}

std::vector<stream::Sample> SyntheticGenerator::generate(core::usize count)
{
    std::vector<stream::Sample> samples;
    samples.reserve(count);
    for (core::usize i = 0; i < count; ++i) {
        stream::Sample s;
        s.x = _unit(_rng);
        s.y = _unit(_rng);
        s.z = _unit(_rng);
        samples.push_back(s);
    }
    return samples;
}

} // namespace synapse::capture
