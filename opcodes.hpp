#pragma once
#include <cstdint>

#define EXTENDED_PREFIX 0xcb

#define OPERATIONS() \
    OPERATION(NOP)     \
    OPERATION(LD)      \
    OPERATION(PUSH)    \
    OPERATION(POP)     \
    OPERATION(ADD)     \
    OPERATION(ADC)     \
    OPERATION(SUB)     \
    OPERATION(SBC)     \
    OPERATION(AND)     \
    OPERATION(XOR)     \
    OPERATION(OR)      \
    OPERATION(CP)      \
    OPERATION(INC)     \
    OPERATION(DEC)     \
    OPERATION(DAA)     \
    OPERATION(CPL)     \
    OPERATION(CCF)     \
    OPERATION(SCF)     \
    OPERATION(HALT)    \
    OPERATION(STOP)    \
    OPERATION(DI)      \
    OPERATION(EI)      \
    OPERATION(JP)      \
    OPERATION(JR)      \
    OPERATION(CALL)    \
    OPERATION(RET)     \
    OPERATION(RETI)    \
    OPERATION(RST)     \
    OPERATION(RLCA)    \
    OPERATION(RLA)     \
    OPERATION(RRCA)    \
    OPERATION(RRA)     \
    OPERATION(PREFIX)  \
    OPERATION(ILLEGAL) \
    OPERATION(RLC)     \
    OPERATION(RRC)     \
    OPERATION(RL)      \
    OPERATION(RR)      \
    OPERATION(SLA)     \
    OPERATION(SRA)     \
    OPERATION(SWAP)    \
    OPERATION(SRL)     \
    OPERATION(BIT)     \
    OPERATION(RES)     \
    OPERATION(SET)

enum Operation {
#define OPERATION(name) name,
    OPERATIONS()
#undef OPERATION
};

enum Operand {
    NO_OPERAND,
    REG_A,
    REG_B,
    REG_C,
    REG_D,
    REG_E,
    REG_H,
    REG_L,
    REG_AF,
    REG_BC,
    REG_DE,
    REG_HL,
    REG_SP,
    IND_BC,
    IND_DE,
    IND_HL,
    IND_HLI,    // (HL), then HL is incremented
    IND_HLD,    // (HL), then HL is decremented
    IND_C,      // (0xff00 + C)
    IND_A8,     // (0xff00 + n)
    IND_A16,
    IMM8,
    IMM16,
    REL8,       // signed displacement
    SP_REL8     // SP + signed displacement
};

enum Condition {
    ALWAYS,
    IF_NZ,
    IF_Z,
    IF_NC,
    IF_C
};

struct Instruction {
    const char* text;
    Operation op;
    Operand dst;
    Operand src;
    Condition cond;
    uint8_t arg;            // bit number for BIT/RES/SET, vector for RST
    uint8_t length;         // bytes, including the prefix
    uint8_t cycles;         // M-cycles
    uint8_t cycles_taken;   // M-cycles when a conditional transfer is taken
};

// Both tables are total: every byte value has an entry.
extern const Instruction& decode(uint8_t opcode);
extern const Instruction& decode_extended(uint8_t opcode);

extern const char* operation_name(Operation op);
extern bool is_wide(Operand operand);
extern uint8_t immediate_length(Operand operand);
