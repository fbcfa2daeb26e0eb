#include <spdlog/fmt/fmt.h>
#include <tagflow/tags/tag_validation.h>

#include <algorithm>

namespace tagflow::tags {

namespace {

// Code points in a UTF-8 string: every byte that is not a continuation byte
std::size_t characterCount(const std::string& tag) {
    return static_cast<std::size_t>(std::count_if(tag.begin(), tag.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

} // namespace

Result<void> checkEntityTagsLength(const std::vector<std::string>& tags, std::size_t maxLength) {
    for (const auto& tag : tags) {
        if (tag.empty()) {
            return Error{ErrorCode::InvalidArgument, "Invalid tag found, Tag shouldn't be empty"};
        }
        if (characterCount(tag) > maxLength) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Tag name can not be more than {} characters. Limit "
                                     "exceeded tag is: {}",
                                     maxLength, tag)};
        }
    }
    return {};
}

} // namespace tagflow::tags
