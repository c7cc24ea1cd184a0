#pragma once

#include <ankerl/unordered_dense.h>

#include <functional>
#include <string>
#include <string_view>

namespace evalflow {

// Lets string-keyed maps be probed with a string_view without a copy.
struct StringHash {
  using is_transparent = void;
  using is_avalanching = void;

  [[nodiscard]] auto operator()(std::string_view sv) const noexcept
      -> std::size_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(sv);
  }
};

// Iterates in insertion order.
template <typename V>
using StringMap =
    ankerl::unordered_dense::map<std::string, V, StringHash, std::equal_to<>>;

} // namespace evalflow
