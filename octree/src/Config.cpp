// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <svo/octree/Config.hpp>

namespace svo::octree {

Config::Builder& Config::Builder::reserveNodes(core::usize n) noexcept
{
    reserveNodes_ = n;
    return *this;
}

Config::Builder& Config::Builder::reserveLeaves(core::usize n) noexcept
{
    reserveLeaves_ = n;
    return *this;
}

Config::Builder& Config::Builder::traceOperations(bool enabled) noexcept
{
    traceOperations_ = enabled;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg.reserveNodes_    = reserveNodes_;
    cfg.reserveLeaves_   = reserveLeaves_;
    cfg.traceOperations_ = traceOperations_;
    return cfg;
}

} // namespace svo::octree
