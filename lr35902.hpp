#pragma once
#include <cstdint>
#include <string>

#include "memory.hpp"
#include "opcodes.hpp"

// Flags register (low byte of AF). Bits 3-0 always read as zero.
#define FLAG_ZERO       0x80
#define FLAG_SUBTRACT   0x40
#define FLAG_HALF_CARRY 0x20
#define FLAG_CARRY      0x10

#define INTERRUPT_FLAG_ADDR   0xff0f
#define INTERRUPT_ENABLE_ADDR 0xffff
#define INTERRUPT_VECTOR_BASE 0x40
#define INTERRUPT_MASK        0x1f

inline uint8_t high_byte(uint16_t pair) { return pair >> 8; }
inline uint8_t low_byte(uint16_t pair) { return pair & 0xff; }
inline uint16_t with_high(uint16_t pair, uint8_t val) { return (val << 8) | (pair & 0x00ff); }
inline uint16_t with_low(uint16_t pair, uint8_t val) { return (pair & 0xff00) | val; }

// The 8-bit registers have no storage of their own: each is computed from,
// and written into, its 16-bit pair.
struct RegisterFile {
    uint16_t SP = 0;
    uint16_t PC = 0;

    uint16_t AF() const { return af_; }
    uint16_t BC() const { return bc_; }
    uint16_t DE() const { return de_; }
    uint16_t HL() const { return hl_; }
    void set_AF(uint16_t val) { af_ = val & 0xfff0; }
    void set_BC(uint16_t val) { bc_ = val; }
    void set_DE(uint16_t val) { de_ = val; }
    void set_HL(uint16_t val) { hl_ = val; }

    uint8_t A() const { return high_byte(af_); }
    uint8_t F() const { return low_byte(af_); }
    uint8_t B() const { return high_byte(bc_); }
    uint8_t C() const { return low_byte(bc_); }
    uint8_t D() const { return high_byte(de_); }
    uint8_t E() const { return low_byte(de_); }
    uint8_t H() const { return high_byte(hl_); }
    uint8_t L() const { return low_byte(hl_); }
    void set_A(uint8_t val) { af_ = with_high(af_, val); }
    void set_F(uint8_t val) { af_ = with_low(af_, val & 0xf0); }
    void set_B(uint8_t val) { bc_ = with_high(bc_, val); }
    void set_C(uint8_t val) { bc_ = with_low(bc_, val); }
    void set_D(uint8_t val) { de_ = with_high(de_, val); }
    void set_E(uint8_t val) { de_ = with_low(de_, val); }
    void set_H(uint8_t val) { hl_ = with_high(hl_, val); }
    void set_L(uint8_t val) { hl_ = with_low(hl_, val); }

    bool zero() const { return F() & FLAG_ZERO; }
    bool subtract() const { return F() & FLAG_SUBTRACT; }
    bool half_carry() const { return F() & FLAG_HALF_CARRY; }
    bool carry() const { return F() & FLAG_CARRY; }
    void set_zero(bool on) { set_flag(FLAG_ZERO, on); }
    void set_subtract(bool on) { set_flag(FLAG_SUBTRACT, on); }
    void set_half_carry(bool on) { set_flag(FLAG_HALF_CARRY, on); }
    void set_carry(bool on) { set_flag(FLAG_CARRY, on); }

    void set_flag(uint8_t mask, bool on) {
        set_F(on ? (F() | mask) : (F() & ~mask));
    }

    void reset() {
        af_ = bc_ = de_ = hl_ = 0;
        SP = PC = 0;
    }

    // State left behind by the DMG boot ROM.
    void reset_post_boot() {
        set_AF(0x01b0);
        set_BC(0x0013);
        set_DE(0x00d8);
        set_HL(0x014d);
        SP = 0xfffe;
        PC = 0x0100;
    }

  private:
    uint16_t af_ = 0;
    uint16_t bc_ = 0;
    uint16_t de_ = 0;
    uint16_t hl_ = 0;
};

enum class Fault {
    NONE,
    UNMAPPED_ACCESS,    // see StepResult::bus
    INVALID_OPCODE
};

struct StepResult {
    uint8_t cycles;     // M-cycles
    Fault fault;
    uint16_t address;   // address of the instruction
    uint8_t opcode;     // extended opcode when `extended` is set
    bool extended;
    BusFault bus;

    bool ok() const { return fault == Fault::NONE; }
};

enum class CpuState {
    RUNNING,
    HALTED      // waiting for an interrupt request
};

class Cpu {
  public:
    explicit Cpu(Memory& mem) : mem_(mem) {}

    RegisterFile regs;

    // Executes the instruction at addr and leaves PC at the next instruction
    // or the transfer target. On a fault PC is not changed.
    StepResult step(uint16_t addr);

    // Services a pending interrupt, idles while halted, otherwise step(PC).
    StepResult step();

    // Disassembles the instruction at addr. Reads memory without side effects.
    std::string mnemonic(uint16_t addr) const;

    bool ime() const { return ime_; }
    void set_ime(bool enabled) { ime_ = enabled; ime_pending_ = false; }
    CpuState state() const { return state_; }
    void set_trace(bool enabled) { trace_ = enabled; }

  private:
    StepResult service_interrupts();
    StepResult bus_fault(StepResult result) const;

    Memory& mem_;
    bool ime_ = false;
    bool ime_pending_ = false;   // EI takes effect after the next instruction
    CpuState state_ = CpuState::RUNNING;
    bool trace_ = false;
};

extern std::string disassemble(const Memory& mem, uint16_t addr);
