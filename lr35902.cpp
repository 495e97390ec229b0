#include "lr35902.hpp"
#include "logger.hpp"


namespace {

struct Context {
    RegisterFile& regs;
    Memory& mem;
    const Instruction& in;
    uint16_t addr;
    uint16_t imm;
    uint16_t next_pc;
    bool taken;
};

}

static void
push16(RegisterFile& regs, Memory& mem, uint16_t val) {
    mem.write8(--regs.SP, high_byte(val));
    mem.write8(--regs.SP, low_byte(val));
}

static uint16_t
pop16(RegisterFile& regs, Memory& mem) {
    uint8_t ll = mem.read8(regs.SP++);
    uint8_t hh = mem.read8(regs.SP++);
    return ll | (hh << 8);
}

static void
set_znhc(RegisterFile& regs, bool z, bool n, bool h, bool c) {
    regs.set_F((z ? FLAG_ZERO : 0) |
               (n ? FLAG_SUBTRACT : 0) |
               (h ? FLAG_HALF_CARRY : 0) |
               (c ? FLAG_CARRY : 0));
}

static bool
condition_holds(const RegisterFile& regs, Condition cond) {
    switch (cond) {
        case ALWAYS: return true;
        case IF_NZ: return !regs.zero();
        case IF_Z: return regs.zero();
        case IF_NC: return !regs.carry();
        case IF_C: return regs.carry();
    }
    NOT_REACHED();
    return false;
}

// Address of an indirect operand. (HL+) and (HL-) adjust HL as a side effect,
// so this is called once per access.
static uint16_t
operand_address(Context& ctx, Operand mode) {
    auto& regs = ctx.regs;
    switch (mode) {
        case IND_BC: return regs.BC();
        case IND_DE: return regs.DE();
        case IND_HL: return regs.HL();
        case IND_HLI: {
            auto hl = regs.HL();
            regs.set_HL(hl + 1);
            return hl;
        }
        case IND_HLD: {
            auto hl = regs.HL();
            regs.set_HL(hl - 1);
            return hl;
        }
        case IND_C: return 0xff00 | regs.C();
        case IND_A8: return 0xff00 | (ctx.imm & 0xff);
        case IND_A16: return ctx.imm;
        default:
            NOT_REACHED();
            return 0;
    }
}

static uint8_t
read_operand8(Context& ctx, Operand mode) {
    auto& regs = ctx.regs;
    switch (mode) {
        case REG_A: return regs.A();
        case REG_B: return regs.B();
        case REG_C: return regs.C();
        case REG_D: return regs.D();
        case REG_E: return regs.E();
        case REG_H: return regs.H();
        case REG_L: return regs.L();
        case IMM8: return ctx.imm & 0xff;
        default: return ctx.mem.read8(operand_address(ctx, mode));
    }
}

static void
write_operand8(Context& ctx, Operand mode, uint8_t val) {
    auto& regs = ctx.regs;
    switch (mode) {
        case REG_A: regs.set_A(val); break;
        case REG_B: regs.set_B(val); break;
        case REG_C: regs.set_C(val); break;
        case REG_D: regs.set_D(val); break;
        case REG_E: regs.set_E(val); break;
        case REG_H: regs.set_H(val); break;
        case REG_L: regs.set_L(val); break;
        default: ctx.mem.write8(operand_address(ctx, mode), val); break;
    }
}

static uint16_t
read_operand16(Context& ctx, Operand mode) {
    auto& regs = ctx.regs;
    switch (mode) {
        case REG_AF: return regs.AF();
        case REG_BC: return regs.BC();
        case REG_DE: return regs.DE();
        case REG_HL: return regs.HL();
        case REG_SP: return regs.SP;
        case IMM16: return ctx.imm;
        default:
            NOT_REACHED();
            return 0;
    }
}

static void
write_operand16(Context& ctx, Operand mode, uint16_t val) {
    auto& regs = ctx.regs;
    switch (mode) {
        case REG_AF: regs.set_AF(val); break;
        case REG_BC: regs.set_BC(val); break;
        case REG_DE: regs.set_DE(val); break;
        case REG_HL: regs.set_HL(val); break;
        case REG_SP: regs.SP = val; break;
        case IND_A16: ctx.mem.write16(ctx.imm, val); break;
        default: NOT_REACHED();
    }
}

// Operations

static void
op_LD(Context& ctx) {
    auto& in = ctx.in;
    if (in.src == SP_REL8) {
        auto& regs = ctx.regs;
        uint8_t e = ctx.imm & 0xff;
        set_znhc(regs, false, false,
                 (regs.SP & 0xf) + (e & 0xf) > 0xf,
                 (regs.SP & 0xff) + e > 0xff);
        regs.set_HL(regs.SP + int8_t(e));
    } else if (is_wide(in.dst) || is_wide(in.src)) {
        write_operand16(ctx, in.dst, read_operand16(ctx, in.src));
    } else {
        write_operand8(ctx, in.dst, read_operand8(ctx, in.src));
    }
}

static void
op_ADD(Context& ctx) {
    auto& regs = ctx.regs;
    if (ctx.in.dst == REG_HL) {
        uint32_t hl = regs.HL();
        uint32_t val = read_operand16(ctx, ctx.in.src);
        uint32_t sum = hl + val;
        regs.set_subtract(false);
        regs.set_half_carry((hl & 0xfff) + (val & 0xfff) > 0xfff);
        regs.set_carry(sum > 0xffff);
        regs.set_HL(sum);
    } else if (ctx.in.dst == REG_SP) {
        uint8_t e = ctx.imm & 0xff;
        set_znhc(regs, false, false,
                 (regs.SP & 0xf) + (e & 0xf) > 0xf,
                 (regs.SP & 0xff) + e > 0xff);
        regs.SP += int8_t(e);
    } else {
        unsigned a = regs.A();
        unsigned val = read_operand8(ctx, ctx.in.src);
        unsigned carry = (ctx.in.op == ADC && regs.carry()) ? 1 : 0;
        unsigned sum = a + val + carry;
        set_znhc(regs, (sum & 0xff) == 0, false,
                 (a & 0xf) + (val & 0xf) + carry > 0xf,
                 sum > 0xff);
        regs.set_A(sum);
    }
}

// SUB, SBC and CP. Returns the difference.
static uint8_t
op_subtract(Context& ctx) {
    auto& regs = ctx.regs;
    int a = regs.A();
    int val = read_operand8(ctx, ctx.in.src);
    int carry = (ctx.in.op == SBC && regs.carry()) ? 1 : 0;
    int diff = a - val - carry;
    set_znhc(regs, (diff & 0xff) == 0, true,
             (a & 0xf) - (val & 0xf) - carry < 0,
             diff < 0);
    return diff & 0xff;
}

static void
op_logic(Context& ctx) {
    auto& regs = ctx.regs;
    auto val = read_operand8(ctx, ctx.in.src);
    uint8_t result = 0;
    switch (ctx.in.op) {
        case AND: result = regs.A() & val; break;
        case XOR: result = regs.A() ^ val; break;
        case OR: result = regs.A() | val; break;
        default: NOT_REACHED();
    }
    regs.set_A(result);
    set_znhc(regs, result == 0, false, ctx.in.op == AND, false);
}

static void
op_INC_DEC(Context& ctx) {
    auto& regs = ctx.regs;
    auto mode = ctx.in.dst;
    auto inc = ctx.in.op == INC;
    if (is_wide(mode)) {
        uint16_t val = read_operand16(ctx, mode);
        write_operand16(ctx, mode, inc ? val + 1 : val - 1);
        return;
    }

    // (HL) is read and written at the same address.
    uint8_t val = read_operand8(ctx, mode);
    uint8_t result = inc ? val + 1 : val - 1;
    write_operand8(ctx, mode, result);
    regs.set_zero(result == 0);
    regs.set_subtract(!inc);
    regs.set_half_carry(inc ? (val & 0xf) == 0xf : (val & 0xf) == 0);
}

static void
op_DAA(Context& ctx) {
    auto& regs = ctx.regs;
    unsigned a = regs.A();
    bool carry = regs.carry();
    if (!regs.subtract()) {
        if (carry || a > 0x99) {
            a += 0x60;
            carry = true;
        }
        if (regs.half_carry() || (a & 0xf) > 0x9) {
            a += 0x06;
        }
    } else {
        if (carry) a -= 0x60;
        if (regs.half_carry()) a -= 0x06;
    }
    a &= 0xff;
    set_znhc(regs, a == 0, regs.subtract(), false, carry);
    regs.set_A(a);
}

// Accumulator rotates always clear Z; the CB forms set it from the result.
static uint8_t
rotate(RegisterFile& regs, Operation op, uint8_t val) {
    uint8_t carry_in = regs.carry() ? 1 : 0;
    uint8_t carry_out = 0;
    uint8_t result = 0;
    switch (op) {
        case RLCA:
        case RLC:
            carry_out = val >> 7;
            result = (val << 1) | carry_out;
            break;
        case RLA:
        case RL:
            carry_out = val >> 7;
            result = (val << 1) | carry_in;
            break;
        case RRCA:
        case RRC:
            carry_out = val & 1;
            result = (val >> 1) | (carry_out << 7);
            break;
        case RRA:
        case RR:
            carry_out = val & 1;
            result = (val >> 1) | (carry_in << 7);
            break;
        case SLA:
            carry_out = val >> 7;
            result = val << 1;
            break;
        case SRA:
            carry_out = val & 1;
            result = (val >> 1) | (val & 0x80);
            break;
        case SRL:
            carry_out = val & 1;
            result = val >> 1;
            break;
        case SWAP:
            result = (val << 4) | (val >> 4);
            break;
        default:
            NOT_REACHED();
    }
    set_znhc(regs, result == 0, false, false, carry_out);
    return result;
}

static void
op_shift(Context& ctx) {
    auto val = read_operand8(ctx, ctx.in.dst);
    write_operand8(ctx, ctx.in.dst, rotate(ctx.regs, ctx.in.op, val));
}

static void
op_rotate_accumulator(Context& ctx) {
    auto& regs = ctx.regs;
    regs.set_A(rotate(regs, ctx.in.op, regs.A()));
    regs.set_zero(false);
}

static void
op_bit(Context& ctx) {
    auto& regs = ctx.regs;
    auto mask = uint8_t(1 << ctx.in.arg);
    auto val = read_operand8(ctx, ctx.in.dst);
    switch (ctx.in.op) {
        case BIT:
            regs.set_zero(!(val & mask));
            regs.set_subtract(false);
            regs.set_half_carry(true);
            break;
        case RES:
            write_operand8(ctx, ctx.in.dst, val & ~mask);
            break;
        case SET:
            write_operand8(ctx, ctx.in.dst, val | mask);
            break;
        default:
            NOT_REACHED();
    }
}

static void
op_jump(Context& ctx) {
    auto& in = ctx.in;
    if (!condition_holds(ctx.regs, in.cond)) return;

    ctx.taken = true;
    switch (in.op) {
        case JP:
            ctx.next_pc = in.dst == REG_HL ? ctx.regs.HL() : ctx.imm;
            break;
        case JR:
            ctx.next_pc = ctx.addr + in.length + int8_t(ctx.imm & 0xff);
            break;
        case CALL:
            push16(ctx.regs, ctx.mem, ctx.next_pc);
            ctx.next_pc = ctx.imm;
            break;
        case RET:
        case RETI:
            ctx.next_pc = pop16(ctx.regs, ctx.mem);
            break;
        case RST:
            push16(ctx.regs, ctx.mem, ctx.next_pc);
            ctx.next_pc = in.arg;
            break;
        default:
            NOT_REACHED();
    }
}

static void
execute(Context& ctx) {
    auto& regs = ctx.regs;
    switch (ctx.in.op) {
        case NOP:
        case HALT:
        case STOP:
        case DI:
        case EI:
            break;
        case LD: op_LD(ctx); break;
        case PUSH:
            push16(regs, ctx.mem, read_operand16(ctx, ctx.in.dst));
            break;
        case POP:
            write_operand16(ctx, ctx.in.dst, pop16(regs, ctx.mem));
            break;
        case ADD:
        case ADC:
            op_ADD(ctx);
            break;
        case SUB:
        case SBC:
            regs.set_A(op_subtract(ctx));
            break;
        case CP:
            op_subtract(ctx);
            break;
        case AND:
        case XOR:
        case OR:
            op_logic(ctx);
            break;
        case INC:
        case DEC:
            op_INC_DEC(ctx);
            break;
        case DAA: op_DAA(ctx); break;
        case CPL:
            regs.set_A(~regs.A());
            regs.set_subtract(true);
            regs.set_half_carry(true);
            break;
        case CCF:
            regs.set_subtract(false);
            regs.set_half_carry(false);
            regs.set_carry(!regs.carry());
            break;
        case SCF:
            regs.set_subtract(false);
            regs.set_half_carry(false);
            regs.set_carry(true);
            break;
        case JP:
        case JR:
        case CALL:
        case RET:
        case RETI:
        case RST:
            op_jump(ctx);
            break;
        case RLCA:
        case RLA:
        case RRCA:
        case RRA:
            op_rotate_accumulator(ctx);
            break;
        case RLC:
        case RRC:
        case RL:
        case RR:
        case SLA:
        case SRA:
        case SWAP:
        case SRL:
            op_shift(ctx);
            break;
        case BIT:
        case RES:
        case SET:
            op_bit(ctx);
            break;
        case PREFIX:
        case ILLEGAL:
            // Decoded before execution.
            NOT_REACHED();
    }
}

StepResult
Cpu::bus_fault(StepResult result) const {
    result.cycles = 0;
    result.fault = Fault::UNMAPPED_ACCESS;
    result.bus = mem_.fault();
    return result;
}

StepResult
Cpu::step(uint16_t addr) {
    StepResult result = {0, Fault::NONE, addr, 0, false, {}};
    mem_.clear_fault();

    uint8_t opcode = mem_.read8(addr);
    const Instruction* in = &decode(opcode);
    if (in->op == PREFIX) {
        opcode = mem_.read8(addr + 1);
        in = &decode_extended(opcode);
        result.extended = true;
    }
    result.opcode = opcode;
    if (mem_.has_fault()) return bus_fault(result);

    if (in->op == ILLEGAL) {
        LOG_ERRORF("invalid opcode %02x at %04x", opcode, addr);
        result.fault = Fault::INVALID_OPCODE;
        return result;
    }

    uint16_t imm = 0;
    if (auto len = immediate_length(in->src) + immediate_length(in->dst)) {
        imm = len == 1 ? mem_.read8(addr + 1) : mem_.read16(addr + 1);
    }
    if (mem_.has_fault()) return bus_fault(result);

    if (trace_) {
        LOG_DEBUGF("%04x  %s", addr, disassemble(mem_, addr).c_str());
    }

    Context ctx = {regs, mem_, *in, addr, imm, uint16_t(addr + in->length), false};
    execute(ctx);
    if (mem_.has_fault()) return bus_fault(result);

    regs.PC = ctx.next_pc;

    auto enable_interrupts = ime_pending_;
    ime_pending_ = false;
    switch (in->op) {
        case DI:
            ime_ = false;
            enable_interrupts = false;
            break;
        case EI:
            ime_pending_ = true;
            break;
        case RETI:
            ime_ = true;
            break;
        case HALT:
        case STOP:
            state_ = CpuState::HALTED;
            break;
        default:
            break;
    }
    if (enable_interrupts) ime_ = true;

    result.cycles = ctx.taken ? in->cycles_taken : in->cycles;
    return result;
}

StepResult
Cpu::service_interrupts() {
    StepResult result = {0, Fault::NONE, regs.PC, 0, false, {}};
    if (!ime_ && state_ != CpuState::HALTED) return result;

    mem_.clear_fault();
    uint8_t requested = mem_.read8(INTERRUPT_FLAG_ADDR);
    uint8_t pending = mem_.read8(INTERRUPT_ENABLE_ADDR) & requested & INTERRUPT_MASK;
    if (mem_.has_fault()) return bus_fault(result);
    if (!pending) return result;

    // Any request ends HALT, even with IME clear.
    state_ = CpuState::RUNNING;
    if (!ime_) return result;

    int bit = 0;
    while (!(pending & (1 << bit))) bit++;

    ime_ = false;
    ime_pending_ = false;
    mem_.write8(INTERRUPT_FLAG_ADDR, requested & ~(1 << bit));
    push16(regs, mem_, regs.PC);
    regs.PC = INTERRUPT_VECTOR_BASE + 8 * bit;
    if (mem_.has_fault()) return bus_fault(result);

    LOG_DEBUGF("interrupt %d dispatched to %04x", bit, regs.PC);
    result.cycles = 5;
    return result;
}

StepResult
Cpu::step() {
    auto serviced = service_interrupts();
    if (!serviced.ok() || serviced.cycles > 0) return serviced;

    if (state_ == CpuState::HALTED) {
        StepResult idle = {1, Fault::NONE, regs.PC, 0, false, {}};
        return idle;
    }
    return step(regs.PC);
}

std::string
Cpu::mnemonic(uint16_t addr) const {
    return disassemble(mem_, addr);
}
