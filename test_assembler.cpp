#include <gtest/gtest.h>

#include "assembler.hpp"

namespace {

TEST(Assembler, FindOpcode) {
    uint8_t opcode = 0;
    bool extended = true;
    ASSERT_TRUE(find_opcode(LD, REG_BC, IMM16, ALWAYS, 0, &opcode, &extended));
    ASSERT_EQ(opcode, 0x01);
    ASSERT_FALSE(extended);

    ASSERT_TRUE(find_opcode(SET, IND_HL, NO_OPERAND, ALWAYS, 2, &opcode, &extended));
    ASSERT_EQ(opcode, 0xd6);
    ASSERT_TRUE(extended);

    // There is no LD (BC),B.
    ASSERT_FALSE(find_opcode(LD, IND_BC, REG_B, ALWAYS, 0, &opcode, &extended));
}

TEST(Assembler, Immediates) {
    std::vector<uint8_t> image;
    Assembler a(image);
    a
    .org(0x100)
    (LD, REG_BC, IMM16, 0x1234)
    (LD, REG_A, IMM8, 0x56)
    (LD, IND_A8, REG_A, 0x80);

    ASSERT_EQ(a.here(), 0x107);
    ASSERT_GE(image.size(), 0x107u);
    ASSERT_EQ(image[0x100], 0x01);
    ASSERT_EQ(image[0x101], 0x34);
    ASSERT_EQ(image[0x102], 0x12);
    ASSERT_EQ(image[0x103], 0x3e);
    ASSERT_EQ(image[0x104], 0x56);
    ASSERT_EQ(image[0x105], 0xe0);
    ASSERT_EQ(image[0x106], 0x80);
}

TEST(Assembler, ExtendedPrefix) {
    uint8_t bytes[4] = {};
    ASSERT_EQ(assemble_instr(BIT, REG_H, NO_OPERAND, ALWAYS, 7, 0, bytes), 2u);
    ASSERT_EQ(bytes[0], EXTENDED_PREFIX);
    ASSERT_EQ(bytes[1], 0x7c);

    ASSERT_EQ(assemble_instr(SWAP, REG_A, NO_OPERAND, ALWAYS, 0, 0, bytes), 2u);
    ASSERT_EQ(bytes[1], 0x37);
}

TEST(Assembler, StopPadding) {
    uint8_t bytes[4] = { 0xaa, 0xaa, 0xaa, 0xaa };
    ASSERT_EQ(assemble_instr(STOP, NO_OPERAND, NO_OPERAND, ALWAYS, 0, 0, bytes), 2u);
    ASSERT_EQ(bytes[0], 0x10);
    ASSERT_EQ(bytes[1], 0x00);
    ASSERT_EQ(bytes[2], 0xaa);
}

TEST(Assembler, ConditionalForms) {
    std::vector<uint8_t> image(0x200, 0);
    Assembler a(image);
    a
    .org(0x100)
    (JP, IF_C, IMM16, 0x1234)
    (RET, IF_NC)
    (CALL, IF_Z, IMM16, 0x4000)
    .rst(0x08);

    ASSERT_EQ(image[0x100], 0xda);
    ASSERT_EQ(image[0x101], 0x34);
    ASSERT_EQ(image[0x102], 0x12);
    ASSERT_EQ(image[0x103], 0xd0);
    ASSERT_EQ(image[0x104], 0xcc);
    ASSERT_EQ(image[0x107], 0xcf);
}

TEST(Assembler, BackwardLabel) {
    std::vector<uint8_t> image(0x200, 0);
    Assembler a(image);
    a
    .org(0x100)
    .label("loop")
    (DEC, REG_B)
    (JR, IF_NZ, REL8, "loop")
    (JP, IMM16, "loop");

    ASSERT_EQ(image[0x101], 0x20);
    ASSERT_EQ(image[0x102], 0xfd);
    ASSERT_EQ(image[0x103], 0xc3);
    ASSERT_EQ(image[0x104], 0x00);
    ASSERT_EQ(image[0x105], 0x01);
    ASSERT_FALSE(a.unresolved());
}

TEST(Assembler, ForwardLabel) {
    std::vector<uint8_t> image(0x200, 0);
    Assembler a(image);
    a
    .org(0x100)
    (JR, REL8, "done")
    (CALL, IMM16, "done");
    ASSERT_TRUE(a.unresolved());

    a
    (NOP)
    .label("done");
    ASSERT_FALSE(a.unresolved());

    ASSERT_EQ(image[0x100], 0x18);
    ASSERT_EQ(image[0x101], 0x04);
    ASSERT_EQ(image[0x102], 0xcd);
    ASSERT_EQ(image[0x103], 0x06);
    ASSERT_EQ(image[0x104], 0x01);
}

}
