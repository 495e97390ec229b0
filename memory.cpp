#include "memory.hpp"
#include "logger.hpp"


static const RegionInfo regions[] = {
#define REGION(name, first, last, access) {#name, first, last, access},
    MEMORY_REGIONS()
#undef REGION
};

const RegionInfo&
region_info(Region region) {
    return regions[region];
}

Memory::Memory(const Cartridge& cart, const BusConfig& config)
: cart_(cart)
, config_(config)
, work_ram_(WORK_RAM_BANKS * WORK_RAM_BANK_SIZE, 0) {
    auto ram_size = cart.header().ram_size();
    if (ram_size < EXTERNAL_RAM_BANK_SIZE) ram_size = EXTERNAL_RAM_BANK_SIZE;
    external_ram_.assign(ram_size, 0);

    for (auto region : { TILES_0, TILES_1, TILE_MAP_0, TILE_MAP_1,
                         OAM, HIGH_RAM, INTERRUPT_ENABLE }) {
        fixed_[region].assign(region_info(region).length(), 0);
    }
}

Mapping
Memory::resolve(uint16_t addr) const {
    for (const auto& info : regions) {
        if (addr < info.first || addr > info.last) continue;

        auto region = Region(&info - regions);
        uint16_t offset = addr - info.first;
        switch (region) {
            case ECHO_RAM:
                return resolve(addr - ECHO_OFFSET);
            case ROM_BANK_N:
                return {region, rom_bank_, offset, info.access};
            case WORK_RAM_1:
                return {region, work_ram_bank_, offset, info.access};
            case EXTERNAL_RAM:
                return {region, external_ram_bank_, offset, info.access};
            case IO_PORTS:
                return {region, 0, offset, io_ ? DEVICE : UNMAPPED};
            default:
                return {region, 0, offset, info.access};
        }
    }
    // The table covers 0x0000 - 0xffff.
    NOT_REACHED();
    return {};
}

const uint8_t*
Memory::storage(const Mapping& m) const {
    switch (m.region) {
        case ROM_BANK_0:
            return cart_.data() + m.offset;
        case ROM_BANK_N:
            return cart_.data() + size_t(m.bank) * ROM_BANK_SIZE + m.offset;
        case EXTERNAL_RAM:
            return external_ram_.data() + size_t(m.bank) * EXTERNAL_RAM_BANK_SIZE + m.offset;
        case WORK_RAM_0:
        case WORK_RAM_1:
            return work_ram_.data() + size_t(m.bank) * WORK_RAM_BANK_SIZE + m.offset;
        case TILES_0:
        case TILES_1:
        case TILE_MAP_0:
        case TILE_MAP_1:
        case OAM:
        case HIGH_RAM:
        case INTERRUPT_ENABLE:
            return fixed_[m.region].data() + m.offset;
        default:
            NOT_REACHED();
            return nullptr;
    }
}

// Bus-owned regions only; the ROM slots are never written through the bus.
uint8_t*
Memory::ram_storage(const Mapping& m) {
    switch (m.region) {
        case EXTERNAL_RAM:
            return &external_ram_[size_t(m.bank) * EXTERNAL_RAM_BANK_SIZE + m.offset];
        case WORK_RAM_0:
        case WORK_RAM_1:
            return &work_ram_[size_t(m.bank) * WORK_RAM_BANK_SIZE + m.offset];
        case TILES_0:
        case TILES_1:
        case TILE_MAP_0:
        case TILE_MAP_1:
        case OAM:
        case HIGH_RAM:
        case INTERRUPT_ENABLE:
            return &fixed_[m.region][m.offset];
        default:
            NOT_REACHED();
            return nullptr;
    }
}

bool
Memory::same_storage(const Mapping& lo, const Mapping& hi) {
    auto backed = [](Access a) { return a == READ_ONLY || a == WRITABLE; };
    return backed(lo.access) && backed(hi.access) &&
           lo.region == hi.region && lo.bank == hi.bank &&
           hi.offset == lo.offset + 1;
}

uint8_t
Memory::unmapped_read(const Mapping& m, uint16_t addr) {
    if (config_.unmapped == UnmappedPolicy::FAULT && !faulted_) {
        faulted_ = true;
        fault_ = {m.region, addr, false};
        LOG_WARNINGF("read from unmapped %s address %04x",
                     region_info(m.region).name, addr);
    }
    return config_.open_bus_value;
}

void
Memory::unmapped_write(const Mapping& m, uint16_t addr) {
    if (config_.unmapped == UnmappedPolicy::FAULT && !faulted_) {
        faulted_ = true;
        fault_ = {m.region, addr, true};
        LOG_WARNINGF("write to unmapped %s address %04x",
                     region_info(m.region).name, addr);
    }
}

uint8_t
Memory::read8(uint16_t addr) {
    auto m = resolve(addr);
    switch (m.access) {
        case READ_ONLY:
        case WRITABLE:
            return *storage(m);
        case DEVICE:
            return io_->read(addr);
        case UNMAPPED:
            return unmapped_read(m, addr);
    }
    NOT_REACHED();
    return 0;
}

void
Memory::write8(uint16_t addr, uint8_t val) {
    auto m = resolve(addr);
    switch (m.access) {
        case READ_ONLY:
            // Writes to ROM are ignored by the hardware.
            return;
        case WRITABLE:
            *ram_storage(m) = val;
            return;
        case DEVICE:
            io_->write(addr, val);
            return;
        case UNMAPPED:
            unmapped_write(m, addr);
            return;
    }
    NOT_REACHED();
}

uint16_t
Memory::read16(uint16_t addr) {
    uint16_t next = addr + 1;
    auto lo = resolve(addr);
    auto hi = resolve(next);
    if (same_storage(lo, hi)) {
        auto bytes = storage(lo);
        return bytes[0] | (bytes[1] << 8);
    }
    auto ll = read8(addr);
    auto hh = read8(next);
    return ll | (hh << 8);
}

void
Memory::write16(uint16_t addr, uint16_t val) {
    write8(addr, val & 0xff);
    write8(uint16_t(addr + 1), (val & 0xff00) >> 8);
}

uint8_t
Memory::peek8(uint16_t addr) const {
    auto m = resolve(addr);
    switch (m.access) {
        case READ_ONLY:
        case WRITABLE:
            return *storage(m);
        case DEVICE:
            return io_->peek(addr);
        case UNMAPPED:
            return config_.open_bus_value;
    }
    NOT_REACHED();
    return 0;
}

uint16_t
Memory::peek16(uint16_t addr) const {
    auto ll = peek8(addr);
    auto hh = peek8(uint16_t(addr + 1));
    return ll | (hh << 8);
}

void
Memory::select_rom_bank(uint16_t bank) {
    rom_bank_ = bank % cart_.bank_count();
    LOG_DEBUGF("ROM bank %u selected", rom_bank_);
}

void
Memory::select_work_ram_bank(uint8_t bank) {
    bank &= WORK_RAM_BANKS - 1;
    work_ram_bank_ = bank == 0 ? 1 : bank;
    LOG_DEBUGF("work RAM bank %u selected", work_ram_bank_);
}

void
Memory::select_external_ram_bank(uint8_t bank) {
    external_ram_bank_ = bank % (external_ram_.size() / EXTERNAL_RAM_BANK_SIZE);
    LOG_DEBUGF("external RAM bank %u selected", external_ram_bank_);
}
