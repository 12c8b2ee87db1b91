#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace vault {

// Opaque display/lookup ids such as "local_3fa9c01e" (session fallback) or
// "hover_07b1d2e4" (observer handles). Each thread draws from its own
// generator, so any thread may call it.
std::string makeHexId(std::string_view prefix, std::size_t digits = 8);

} // namespace vault
