#include <coderun/concat_tostr.hh>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <string_view>

using std::string;

// NOLINTNEXTLINE
TEST(concat_tostr, concat_tostr) {
    EXPECT_EQ("", concat_tostr());
    EXPECT_EQ("", concat_tostr(""));
    EXPECT_EQ("", concat_tostr("", "", "", ""));
    EXPECT_EQ("ab c de", concat_tostr("a", 'b', ' ', "c ", "de"));
    EXPECT_EQ("ab c de", concat_tostr("a", 'b', ' ', std::string_view{"c "}, string("de")));
    EXPECT_EQ(string("a\0\0abc", 6), concat_tostr('a', '\0', '\0', std::string_view{"abc"}));

    EXPECT_EQ(
        "abc true 0 1 -1 2 3 -3 false",
        concat_tostr("abc ", true, " ", 0, ' ', 1, ' ', -1, " ", 2, ' ', 3, ' ', -3, ' ', false)
    );
    EXPECT_EQ(" bac-1234567890123456789\t", concat_tostr(" bac", -1234567890123456789, '\t'));
    EXPECT_EQ("18446744073709551615", concat_tostr(UINT64_MAX));
    EXPECT_EQ("255", concat_tostr(uint8_t{255}));
}

// NOLINTNEXTLINE
TEST(concat_tostr, back_insert) {
    string str = "abc";
    back_insert(str);
    EXPECT_EQ(str, "abc");
    back_insert(str, ' ', 42, "x", string{"yz"}, std::string_view{"w"}, false);
    EXPECT_EQ(str, "abc 42xyzwfalse");
    EXPECT_EQ(&back_insert(str, ""), &str);
}
