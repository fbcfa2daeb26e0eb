#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <tagflow/core/types.h>

namespace tagflow::tags {

inline constexpr std::size_t kDefaultMaxTagLength = 40;

/**
 * @brief Reject empty or over-long tags before any mutation.
 *
 * Tags are checked in order; the first offending tag is reported as
 * InvalidArgument. Length is counted in characters (UTF-8 code points), not
 * bytes. An empty list passes: callers that require at least one
 * tag check that themselves.
 */
Result<void> checkEntityTagsLength(const std::vector<std::string>& tags,
                                   std::size_t maxLength = kDefaultMaxTagLength);

} // namespace tagflow::tags
