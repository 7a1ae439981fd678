#include <gmpxx.h>
#include <gtest/gtest.h>

#include "core/types.h"
#include "core/atoms/integer.h"

namespace {

// 41^53 overflows a 64 bit integer for sure.
mpz_class big_value() {
    mpz_class value;
    mpz_ui_pow_ui(value.get_mpz_t(), 41, 53);
    return value;
}

const char *hex_value = "f752d912b1bd0ed02b0632469e0bf641ca52f36d0b4cbda9c1051ff2975b515fce7b0c9";

} // namespace

TEST(MachineInteger, MachineInteger_init) {
    MachineInteger p(0);
    EXPECT_EQ(p.type(), MachineIntegerType);
    EXPECT_EQ(p.value, 0);
}

TEST(MachineInteger, MachineInteger_set) {
    MachineInteger p(2);
    EXPECT_EQ(p.value, 2);
    EXPECT_EQ(p.debugform(), "2");
}

TEST(BigInteger, BigInteger_new) {
    BigInteger p(mpz_class(0));
    EXPECT_EQ(p.type(), BigIntegerType);
    EXPECT_EQ(cmp(p.value, 0), 0);
}

TEST(BigInteger, BigInteger_set__small) {
    mpz_class value(5);

    BigInteger p(value);
    EXPECT_EQ(cmp(p.value, 5), 0);

    // ensure independent of original value
    value = 6;
    EXPECT_EQ(cmp(p.value, 5), 0);
}

TEST(BigInteger, BigInteger_set__big) {
    mpz_class value = big_value();
    ASSERT_EQ(value.get_str(16), hex_value);

    BigInteger p(value);
    EXPECT_EQ(cmp(p.value, value), 0);

    value = 0;
    EXPECT_EQ(p.value.get_str(16), hex_value);
    EXPECT_EQ(p.debugform(), big_value().get_str());
}

TEST(Integer_from_mpz, MachineInteger) {
    auto result = Integer_from_mpz(mpz_class(5));
    ASSERT_EQ(result->type(), MachineIntegerType);
    EXPECT_EQ(std::static_pointer_cast<const MachineInteger>(result)->value, 5);

    auto negative = Integer_from_mpz(mpz_class(-7));
    ASSERT_EQ(negative->type(), MachineIntegerType);
    EXPECT_EQ(std::static_pointer_cast<const MachineInteger>(negative)->value, -7);
}

TEST(Integer_from_mpz, BigInteger) {
    auto result = Integer_from_mpz(big_value());
    ASSERT_EQ(result->type(), BigIntegerType);
    EXPECT_EQ(std::static_pointer_cast<const BigInteger>(result)->value.get_str(16), hex_value);
    EXPECT_EQ(cmp(to_mpz(result.get()), big_value()), 0);
}

TEST(Integer_from_mpz, same) {
    EXPECT_TRUE(Integer_from_mpz(big_value())->same(*Integer_from_mpz(big_value())));
    EXPECT_EQ(Integer_from_mpz(big_value())->hash(), Integer_from_mpz(big_value())->hash());
    EXPECT_FALSE(Integer_from_mpz(big_value())->same(*from_primitive(5)));
    EXPECT_TRUE(Integer_from_mpz(mpz_class(5))->same(*from_primitive(5)));
}
