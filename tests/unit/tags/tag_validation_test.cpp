#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <tagflow/tags/tag_validation.h>

using namespace tagflow;
using namespace tagflow::tags;

TEST(TagValidationTest, AcceptsTagsUpToMaximum) {
    EXPECT_TRUE(checkEntityTagsLength({"a", std::string(40, 'b')}).has_value());
    EXPECT_TRUE(checkEntityTagsLength({}).has_value());
}

TEST(TagValidationTest, RejectsEmptyTag) {
    auto result = checkEntityTagsLength({"ok", ""});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message, "Invalid tag found, Tag shouldn't be empty");
}

TEST(TagValidationTest, ReportsFirstOverLongTag) {
    const std::string first(41, 'x');
    const std::string second(50, 'y');

    auto result = checkEntityTagsLength({"ok", first, second});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(result.error().message.find("more than 40 characters"), std::string::npos);
    EXPECT_NE(result.error().message.find(first), std::string::npos);
    EXPECT_EQ(result.error().message.find(second), std::string::npos);
}

TEST(TagValidationTest, HonoursConfiguredMaximum) {
    EXPECT_FALSE(checkEntityTagsLength({"abcdef"}, 5).has_value());
    EXPECT_TRUE(checkEntityTagsLength({"abcde"}, 5).has_value());
}

TEST(TagValidationTest, CountsCharactersNotBytes) {
    std::string accented;
    for (int i = 0; i < 40; ++i) {
        accented += "\xC3\xA9"; // é
    }
    ASSERT_EQ(accented.size(), 80u);
    EXPECT_TRUE(checkEntityTagsLength({accented}).has_value());

    accented += "\xC3\xA9";
    auto result = checkEntityTagsLength({accented});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

    // Four-byte sequences count once as well
    EXPECT_TRUE(checkEntityTagsLength({"\xF0\x9F\x8F\xB7" "abc"}, 4).has_value());
    EXPECT_FALSE(checkEntityTagsLength({"\xF0\x9F\x8F\xB7" "abcd"}, 4).has_value());
}
