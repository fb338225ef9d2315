#pragma once

#include "gembridge/gemini/types.hpp"

namespace gembridge::gemini {

/// Final gate on an aggregated result: a session id must have been seen and
/// some output must exist. Violations are appended to the error text and
/// force failure; extracted fields are left untouched.
[[nodiscard]] GeminiResult finalize(GeminiResult result);

} // namespace gembridge::gemini
