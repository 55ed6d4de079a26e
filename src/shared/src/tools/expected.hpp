#pragma once
#include "tl/expected.hpp"
namespace vbt { // veilbatch tools namespace
template <typename T, typename E>
using expected = tl::expected<T, E>;
}
