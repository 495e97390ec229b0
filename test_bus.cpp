#include <gtest/gtest.h>

#include "lr35902.hpp"
#include "assembler.hpp"

namespace {

struct TestDevice : Device {
    uint8_t last_write_addr_lo = 0;
    uint8_t last_write_val = 0;
    uint8_t read_val = 0x42;
    int read_count = 0;
    int write_count = 0;

    uint8_t read(uint16_t addr) override {
        ++read_count;
        return peek(addr);
    }

    void write(uint16_t addr, uint8_t val) override {
        ++write_count;
        last_write_addr_lo = addr & 0xff;
        last_write_val = val;
    }

    uint8_t peek(uint16_t) const override {
        return read_val;
    }
};

std::vector<uint8_t>
blank_image() {
    return std::vector<uint8_t>(0x8000, 0);
}

TEST(Bus, DeviceReadDispatch) {
    Cartridge cart(blank_image());
    Memory mem(cart);
    TestDevice dev;
    dev.read_val = 0xAB;

    mem.attach_io(&dev);

    ASSERT_EQ(mem.resolve(0xff00).access, DEVICE);
    ASSERT_EQ(mem.read8(0xff00), 0xAB);
    ASSERT_EQ(dev.read_count, 1);
    ASSERT_EQ(mem.read8(0xff7f), 0xAB);
    ASSERT_EQ(dev.read_count, 2);
    ASSERT_FALSE(mem.has_fault());
}

TEST(Bus, DeviceWriteDispatch) {
    Cartridge cart(blank_image());
    Memory mem(cart);
    TestDevice dev;

    mem.attach_io(&dev);

    mem.write8(0xff10, 0x77);
    ASSERT_EQ(dev.write_count, 1);
    ASSERT_EQ(dev.last_write_addr_lo, 0x10);
    ASSERT_EQ(dev.last_write_val, 0x77);
}

TEST(Bus, DeviceOnlyCoversPorts) {
    Cartridge cart(blank_image());
    Memory mem(cart);
    TestDevice dev;
    mem.attach_io(&dev);

    // High RAM and IE stay with the bus.
    mem.write8(0xff80, 0xEE);
    mem.write8(0xffff, 0x1f);
    ASSERT_EQ(mem.read8(0xff80), 0xEE);
    ASSERT_EQ(mem.read8(0xffff), 0x1f);
    ASSERT_EQ(dev.write_count, 0);
    ASSERT_EQ(dev.read_count, 0);

    // The unusable region still faults.
    mem.read8(0xfeff);
    ASSERT_TRUE(mem.has_fault());
    ASSERT_EQ(mem.fault().region, NOT_USABLE);
}

TEST(Bus, WordAccessSplitsAtDevice) {
    Cartridge cart(blank_image());
    Memory mem(cart);
    TestDevice dev;
    dev.read_val = 0x34;
    mem.attach_io(&dev);

    mem.write8(0xff80, 0x12);
    ASSERT_EQ(mem.read16(0xff7f), 0x1234);
    ASSERT_EQ(dev.read_count, 1);

    mem.write16(0xff7f, 0xabcd);
    ASSERT_EQ(dev.write_count, 1);
    ASSERT_EQ(dev.last_write_val, 0xcd);
    ASSERT_EQ(mem.read8(0xff80), 0xab);
}

TEST(Bus, PeekBypassesDeviceSideEffects) {
    Cartridge cart(blank_image());
    Memory mem(cart);
    TestDevice dev;
    dev.read_val = 0x5a;
    mem.attach_io(&dev);

    ASSERT_EQ(mem.peek8(0xff44), 0x5a);
    ASSERT_EQ(mem.peek16(0xff44), 0x5a5a);
    ASSERT_EQ(dev.read_count, 0);
}

TEST(Bus, DetachedPortsFollowPolicy) {
    Cartridge cart(blank_image());
    Memory mem(cart);
    TestDevice dev;
    mem.attach_io(&dev);
    mem.attach_io(nullptr);

    ASSERT_EQ(mem.resolve(0xff00).access, UNMAPPED);
    ASSERT_EQ(mem.read8(0xff00), 0xff);
    ASSERT_TRUE(mem.has_fault());
    ASSERT_EQ(mem.fault().region, IO_PORTS);
    ASSERT_EQ(dev.read_count, 0);
}

TEST(Bus, CPUReadsFromDevice) {
    auto image = blank_image();
    Assembler a(image);
    a.org(0x100)
     (LD, REG_A, IND_A8, 0x44)
     (LD, REG_C, IMM8, 0x47)
     (LD, REG_A, IND_C);
    Cartridge cart(image);
    Memory mem(cart);
    TestDevice dev;
    dev.read_val = 0x90;
    mem.attach_io(&dev);
    Cpu cpu(mem);
    cpu.regs.PC = 0x100;

    ASSERT_TRUE(cpu.step().ok());
    ASSERT_EQ(cpu.regs.A(), 0x90);
    ASSERT_TRUE(cpu.step().ok());
    cpu.regs.set_A(0x00);
    ASSERT_TRUE(cpu.step().ok());
    ASSERT_EQ(cpu.regs.A(), 0x90);
    ASSERT_EQ(cpu.regs.PC, 0x105);
    ASSERT_EQ(dev.read_count, 2);
}

TEST(Bus, CPUWritesToDevice) {
    auto image = blank_image();
    Assembler a(image);
    a.org(0x100)
     (LD, REG_A, IMM8, 0x91)
     (LD, IND_A8, REG_A, 0x40)
     (LD, REG_C, IMM8, 0x42)
     (LD, IND_C, REG_A)
     (LD, IND_A16, REG_A, 0xff43);
    Cartridge cart(image);
    Memory mem(cart);
    TestDevice dev;
    mem.attach_io(&dev);
    Cpu cpu(mem);
    cpu.regs.PC = 0x100;

    ASSERT_TRUE(cpu.step().ok());
    ASSERT_TRUE(cpu.step().ok());
    ASSERT_EQ(dev.write_count, 1);
    ASSERT_EQ(dev.last_write_addr_lo, 0x40);
    ASSERT_EQ(dev.last_write_val, 0x91);

    ASSERT_TRUE(cpu.step().ok());
    ASSERT_TRUE(cpu.step().ok());
    ASSERT_EQ(dev.write_count, 2);
    ASSERT_EQ(dev.last_write_addr_lo, 0x42);

    ASSERT_TRUE(cpu.step().ok());
    ASSERT_EQ(dev.write_count, 3);
    ASSERT_EQ(dev.last_write_addr_lo, 0x43);
}

}
