#include <gtest/gtest.h>

#include <type_traits>

#include "memory.hpp"

namespace {

// ROM bytes are (address * 7) & 0xff, so dropped writes are visible. The last
// ROM byte is zero.
std::vector<uint8_t>
patterned_image(size_t size = 0x8000) {
    std::vector<uint8_t> image(size);
    for (size_t i = 0; i < size; i++) {
        image[i] = uint8_t(i * 7);
    }
    image[0x7fff] = 0x00;
    return image;
}

TEST(Mem, readWrite) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    ASSERT_EQ(mem.read8(0xc000), 0);
    mem.write8(0xc000, 0xff);
    ASSERT_EQ(mem.read8(0xc000), 0xff);

    mem.write16(0xc000, 0xaaff);
    ASSERT_EQ(mem.read16(0xc000), 0xaaff);
    ASSERT_EQ(mem.read8(0xc000), 0xff);
    ASSERT_EQ(mem.read8(0xc001), 0xaa);
}

TEST(Mem, WritableRegionsHoldEveryValue) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    for (auto region : { TILES_0, TILES_1, TILE_MAP_0, TILE_MAP_1, EXTERNAL_RAM,
                         WORK_RAM_0, WORK_RAM_1, OAM, HIGH_RAM, INTERRUPT_ENABLE }) {
        const auto& info = region_info(region);
        for (uint16_t addr : { info.first, uint16_t((info.first + info.last) / 2), info.last }) {
            for (int v = 0; v < 256; v++) {
                mem.write8(addr, v);
                ASSERT_EQ(mem.read8(addr), v) << info.name << " " << addr;
            }
        }
    }
    ASSERT_FALSE(mem.has_fault());
}

TEST(Mem, RomIgnoresWrites) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    for (uint16_t addr : { 0x0000, 0x0150, 0x3fff, 0x4000, 0x7ffe }) {
        auto before = mem.read8(addr);
        for (int v = 0; v < 256; v++) {
            mem.write8(addr, v);
            ASSERT_EQ(mem.read8(addr), before);
        }
    }
    ASSERT_FALSE(mem.has_fault());
}

TEST(Mem, RomReadsComeFromCartridge) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    ASSERT_EQ(mem.read8(0x0001), 7);
    ASSERT_EQ(mem.read8(0x4001), uint8_t(0x4001 * 7));
    ASSERT_EQ(mem.read16(0x0001), 7 | (14 << 8));
}

TEST(Mem, EchoMirrorsWorkRam) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    for (uint32_t addr = 0xe000; addr <= 0xfdff; addr++) {
        uint16_t mirror = addr - 0x2000;
        mem.write8(addr, uint8_t(addr));
        ASSERT_EQ(mem.read8(mirror), uint8_t(addr));
        mem.write8(mirror, uint8_t(~addr));
        ASSERT_EQ(mem.read8(addr), uint8_t(~addr));
    }
}

TEST(Mem, ResolveCoversEveryAddress) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    for (uint32_t addr = 0; addr <= 0xffff; addr++) {
        auto m = mem.resolve(addr);
        ASSERT_NE(m.region, ECHO_RAM);
        const auto& info = region_info(m.region);
        auto target = (addr >= 0xe000 && addr <= 0xfdff) ? addr - 0x2000 : addr;
        ASSERT_EQ(info.first + m.offset, target);
        ASSERT_LE(target, info.last);
    }
}

TEST(Mem, ResolveReportsPermissions) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    ASSERT_EQ(mem.resolve(0x0000).access, READ_ONLY);
    ASSERT_EQ(mem.resolve(0x7fff).access, READ_ONLY);
    ASSERT_EQ(mem.resolve(0x8000).access, WRITABLE);
    ASSERT_EQ(mem.resolve(0xe123).access, WRITABLE);
    ASSERT_EQ(mem.resolve(0xe123).region, WORK_RAM_0);
    ASSERT_EQ(mem.resolve(0xe123).offset, 0x123);
    ASSERT_EQ(mem.resolve(0xfea0).access, UNMAPPED);
    ASSERT_EQ(mem.resolve(0xff00).access, UNMAPPED);
    ASSERT_EQ(mem.resolve(0xff80).access, WRITABLE);
    ASSERT_EQ(mem.resolve(0xffff).region, INTERRUPT_ENABLE);
}

TEST(Mem, WordRoundTrip) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    for (uint32_t w = 0; w <= 0xffff; w += 0x0101) {
        mem.write16(0xc100, w);
        ASSERT_EQ(mem.read16(0xc100), w);
        mem.write16(0xff90, w);
        ASSERT_EQ(mem.read16(0xff90), w);
    }
}

TEST(Mem, RomWordWriteIgnored) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    auto before = mem.read16(0x7ffe);
    mem.write16(0x7ffe, 0xbeef);
    ASSERT_EQ(mem.read16(0x7ffe), before);
    ASSERT_NE(mem.read16(0x7ffe), 0xbeef);

    mem.write16(0x0000, 0xbeef);
    ASSERT_NE(mem.read16(0x0000), 0xbeef);
}

TEST(Mem, WordWriteAcrossRomBoundaryKeepsWritableHalf) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    ASSERT_NE(mem.read16(0x7fff), 0xbeef);
    mem.write16(0x7fff, 0xbeef);
    ASSERT_EQ(mem.read8(0x7fff), 0x00);
    ASSERT_EQ(mem.read8(0x8000), 0xbe);
    ASSERT_EQ(mem.read16(0x7fff), 0xbe00);
}

TEST(Mem, WordAccessAcrossRegions) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    mem.write16(0x9fff, 0x1234);
    ASSERT_EQ(mem.read8(0x9fff), 0x34);
    ASSERT_EQ(mem.read8(0xa000), 0x12);
    ASSERT_EQ(mem.read16(0x9fff), 0x1234);

    // Work RAM bank 1 into the echo of bank 0.
    mem.write16(0xdfff, 0xcafe);
    ASSERT_EQ(mem.read8(0xc000), 0xca);
    ASSERT_EQ(mem.read16(0xdfff), 0xcafe);
}

TEST(Mem, WordReadWrapsAround) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    mem.write8(0xffff, 0x1f);
    ASSERT_EQ(mem.read16(0xffff), 0x1f | (mem.read8(0x0000) << 8));
}

TEST(Mem, UnmappedReadFaults) {
    Cartridge cart(patterned_image());
    Memory mem(cart);
    ASSERT_EQ(mem.config().unmapped, UnmappedPolicy::FAULT);
    ASSERT_EQ(mem.config().open_bus_value, 0xff);

    ASSERT_EQ(mem.read8(0xfea0), 0xff);
    ASSERT_TRUE(mem.has_fault());
    ASSERT_EQ(mem.fault().region, NOT_USABLE);
    ASSERT_EQ(mem.fault().address, 0xfea0);
    ASSERT_FALSE(mem.fault().write);

    // The first fault is kept until cleared.
    mem.write8(0xff40, 0x91);
    ASSERT_EQ(mem.fault().region, NOT_USABLE);

    mem.clear_fault();
    mem.write8(0xff40, 0x91);
    ASSERT_TRUE(mem.has_fault());
    ASSERT_EQ(mem.fault().region, IO_PORTS);
    ASSERT_TRUE(mem.fault().write);
}

TEST(Mem, OpenBusPolicy) {
    Cartridge cart(patterned_image());
    BusConfig config;
    config.unmapped = UnmappedPolicy::OPEN_BUS;
    config.open_bus_value = 0x00;
    Memory mem(cart, config);

    ASSERT_EQ(mem.config().unmapped, UnmappedPolicy::OPEN_BUS);
    ASSERT_EQ(mem.config().open_bus_value, 0x00);
    ASSERT_EQ(mem.read8(0xfeff), 0x00);
    ASSERT_EQ(mem.read8(0xff44), 0x00);
    mem.write8(0xff44, 0x12);
    ASSERT_FALSE(mem.has_fault());
}

TEST(Mem, PeekDoesNotFault) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    ASSERT_EQ(mem.peek8(0xfea0), 0xff);
    ASSERT_EQ(mem.peek16(0xff00), 0xffff);
    ASSERT_FALSE(mem.has_fault());
    ASSERT_EQ(mem.peek8(0x0001), 7);
}

TEST(Mem, WorkRamBankSelect) {
    Cartridge cart(patterned_image());
    Memory mem(cart);

    ASSERT_EQ(mem.work_ram_bank(), 1);
    mem.write8(0xd000, 0x11);

    mem.select_work_ram_bank(3);
    ASSERT_EQ(mem.work_ram_bank(), 3);
    ASSERT_EQ(mem.resolve(0xd000).bank, 3);
    ASSERT_EQ(mem.read8(0xd000), 0x00);
    mem.write8(0xd000, 0x33);
    ASSERT_EQ(mem.read8(0xf000), 0x33);

    // Bank 0 cannot be selected into the switchable slot.
    mem.select_work_ram_bank(0);
    ASSERT_EQ(mem.work_ram_bank(), 1);
    ASSERT_EQ(mem.read8(0xd000), 0x11);

    mem.select_work_ram_bank(3);
    ASSERT_EQ(mem.read8(0xd000), 0x33);
    // Bank 0 stays fixed at 0xc000.
    ASSERT_EQ(mem.read8(0xc000), 0x00);
}

TEST(Mem, RomBankSelect) {
    std::vector<uint8_t> image(4 * ROM_BANK_SIZE);
    for (size_t bank = 0; bank < 4; bank++) {
        image[bank * ROM_BANK_SIZE] = uint8_t(bank);
    }
    Cartridge cart(image);
    Memory mem(cart);

    ASSERT_EQ(mem.read8(0x4000), 1);
    mem.select_rom_bank(3);
    ASSERT_EQ(mem.read8(0x4000), 3);
    ASSERT_EQ(mem.read8(0x0000), 0);
    mem.select_rom_bank(6);
    ASSERT_EQ(mem.rom_bank(), 2);
    ASSERT_EQ(mem.read8(0x4000), 2);
}

TEST(Mem, ExternalRamBankSelect) {
    auto image = patterned_image();
    image[0x149] = 3;   // 32 KiB, four banks
    Cartridge cart(image);
    Memory mem(cart);

    mem.write8(0xa000, 0x10);
    mem.select_external_ram_bank(2);
    ASSERT_EQ(mem.read8(0xa000), 0x00);
    mem.write8(0xa000, 0x12);
    mem.select_external_ram_bank(0);
    ASSERT_EQ(mem.read8(0xa000), 0x10);
    mem.select_external_ram_bank(6);
    ASSERT_EQ(mem.external_ram_bank(), 2);
    ASSERT_EQ(mem.read8(0xa000), 0x12);
}

TEST(Mem, CartridgeMustOutliveBus) {
    static_assert(std::is_constructible<Memory, const Cartridge&>::value,
                  "bus binds to a cartridge lvalue");
    static_assert(!std::is_constructible<Memory, Cartridge>::value,
                  "bus must not bind to a temporary cartridge");
    static_assert(!std::is_constructible<Memory, Cartridge, BusConfig>::value,
                  "bus must not bind to a temporary cartridge");
}

}
