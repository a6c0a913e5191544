#include "usb_device.hpp"

#include <gtest/gtest.h>

TEST(UgenSelector, ParsesBusAndAddress) {
    auto where = parse_ugen("ugen0.3");
    ASSERT_TRUE(where.has_value());
    EXPECT_EQ(where->bus, 0);
    EXPECT_EQ(where->address, 3);

    where = parse_ugen("ugen12.104");
    ASSERT_TRUE(where.has_value());
    EXPECT_EQ(*where, (BusAddress{12, 104}));
}

TEST(UgenSelector, RejectsMalformedNames) {
    for (const char* bad : {"", "ugen", "ugen0", "ugen.3", "ugen0.", "ugen0.3.1", "usb0.3",
                            "ugen-1.3", "ugen0.3a", " ugen0.3", "UGEN0.3"}) {
        EXPECT_FALSE(parse_ugen(bad).has_value()) << bad;
    }
}

TEST(UgenSelector, FormatsBack) {
    EXPECT_EQ(format_ugen({5, 12}), "ugen5.12");
    EXPECT_EQ(parse_ugen(format_ugen({5, 12})), (BusAddress{5, 12}));
}
