#pragma once
/// @file overloaded.hpp
/// @brief Lambda-set visitor helper for std::visit over the model variants.

namespace loadcurve {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

} // namespace loadcurve
