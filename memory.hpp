#pragma once
#include <cstdint>
#include <cstdlib>
#include <vector>

#include "cartridge.hpp"

#define NOT_REACHED() abort()

#define WORK_RAM_BANK_SIZE 0x1000
#define WORK_RAM_BANKS 8
#define EXTERNAL_RAM_BANK_SIZE 0x2000
#define ECHO_OFFSET 0x2000

// REGION(name, first, last, access)
//
// ECHO_RAM never appears in a resolved mapping: it is translated to the work RAM
// address 0x2000 below before resolution.
#define MEMORY_REGIONS() \
    REGION(ROM_BANK_0,       0x0000, 0x3fff, READ_ONLY) \
    REGION(ROM_BANK_N,       0x4000, 0x7fff, READ_ONLY) \
    REGION(TILES_0,          0x8000, 0x8fff, WRITABLE)  \
    REGION(TILES_1,          0x9000, 0x97ff, WRITABLE)  \
    REGION(TILE_MAP_0,       0x9800, 0x9bff, WRITABLE)  \
    REGION(TILE_MAP_1,       0x9c00, 0x9fff, WRITABLE)  \
    REGION(EXTERNAL_RAM,     0xa000, 0xbfff, WRITABLE)  \
    REGION(WORK_RAM_0,       0xc000, 0xcfff, WRITABLE)  \
    REGION(WORK_RAM_1,       0xd000, 0xdfff, WRITABLE)  \
    REGION(ECHO_RAM,         0xe000, 0xfdff, WRITABLE)  \
    REGION(OAM,              0xfe00, 0xfe9f, WRITABLE)  \
    REGION(NOT_USABLE,       0xfea0, 0xfeff, UNMAPPED)  \
    REGION(IO_PORTS,         0xff00, 0xff7f, DEVICE)    \
    REGION(HIGH_RAM,         0xff80, 0xfffe, WRITABLE)  \
    REGION(INTERRUPT_ENABLE, 0xffff, 0xffff, WRITABLE)

enum Access {
    READ_ONLY,
    WRITABLE,
    DEVICE,
    UNMAPPED
};

enum Region {
#define REGION(name, first, last, access) name,
    MEMORY_REGIONS()
#undef REGION
    REGION_COUNT
};

struct RegionInfo {
    const char* name;
    uint16_t first;
    uint16_t last;
    Access access;

    uint32_t length() const { return uint32_t(last) - first + 1; }
};

extern const RegionInfo& region_info(Region region);

struct Mapping {
    Region region;
    uint16_t bank;      // physical bank behind a switchable slot, 0 otherwise
    uint16_t offset;    // offset within the region
    Access access;
};

struct BusFault {
    Region region;
    uint16_t address;
    bool write;
};

enum class UnmappedPolicy {
    FAULT,      // latch a BusFault and return the open bus value
    OPEN_BUS    // reads return the open bus value, writes are dropped
};

struct BusConfig {
    UnmappedPolicy unmapped = UnmappedPolicy::FAULT;
    uint8_t open_bus_value = 0xff;
};

// Handler for the I/O port region (0xff00 - 0xff7f). Receives full addresses.
struct Device {
    virtual ~Device() = default;
    virtual uint8_t read(uint16_t addr) = 0;
    virtual void write(uint16_t addr, uint8_t val) = 0;
    // Same as read() without side effects, for debuggers.
    virtual uint8_t peek(uint16_t addr) const = 0;
};

class Memory {
  public:
    explicit Memory(const Cartridge& cart, const BusConfig& config = BusConfig());
    // The bus keeps a reference to the cartridge.
    Memory(Cartridge&&, const BusConfig& = BusConfig()) = delete;

    Memory(const Memory&) = delete;
    Memory& operator=(const Memory&) = delete;

    Mapping resolve(uint16_t addr) const;

    uint8_t read8(uint16_t addr);
    void write8(uint16_t addr, uint8_t val);
    uint16_t read16(uint16_t addr);
    void write16(uint16_t addr, uint16_t val);

    uint8_t peek8(uint16_t addr) const;
    uint16_t peek16(uint16_t addr) const;

    void attach_io(Device* device) { io_ = device; }

    void select_rom_bank(uint16_t bank);
    void select_work_ram_bank(uint8_t bank);
    void select_external_ram_bank(uint8_t bank);
    uint16_t rom_bank() const { return rom_bank_; }
    uint8_t work_ram_bank() const { return work_ram_bank_; }
    uint8_t external_ram_bank() const { return external_ram_bank_; }

    bool has_fault() const { return faulted_; }
    const BusFault& fault() const { return fault_; }
    void clear_fault() { faulted_ = false; }

    const BusConfig& config() const { return config_; }

  private:
    const uint8_t* storage(const Mapping& m) const;
    uint8_t* ram_storage(const Mapping& m);
    static bool same_storage(const Mapping& lo, const Mapping& hi);
    uint8_t unmapped_read(const Mapping& m, uint16_t addr);
    void unmapped_write(const Mapping& m, uint16_t addr);

    const Cartridge& cart_;
    BusConfig config_;
    Device* io_ = nullptr;

    // Physical banks behind the switchable slots.
    uint16_t rom_bank_ = 1;
    uint8_t work_ram_bank_ = 1;
    uint8_t external_ram_bank_ = 0;

    std::vector<uint8_t> work_ram_;
    std::vector<uint8_t> external_ram_;
    // Fixed regions (video RAM, OAM, high RAM, interrupt enable), by Region.
    std::vector<uint8_t> fixed_[REGION_COUNT];

    bool faulted_ = false;
    BusFault fault_ = {};
};
