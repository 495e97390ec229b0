#include "opcodes.hpp"
#include <string>

// OPCODE(byte, text, op, dst, src, cond, arg, length, cycles, cycles_taken)
#define PRIMARY_OPCODES() \
    OPCODE(0x00, "NOP",         NOP,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x01, "LD BC,d16",   LD,      REG_BC,     IMM16,      ALWAYS, 0x00, 3, 3, 3) \
    OPCODE(0x02, "LD (BC),A",   LD,      IND_BC,     REG_A,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x03, "INC BC",      INC,     REG_BC,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x04, "INC B",       INC,     REG_B,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x05, "DEC B",       DEC,     REG_B,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x06, "LD B,d8",     LD,      REG_B,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0x07, "RLCA",        RLCA,    NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x08, "LD (a16),SP", LD,      IND_A16,    REG_SP,     ALWAYS, 0x00, 3, 5, 5) \
    OPCODE(0x09, "ADD HL,BC",   ADD,     REG_HL,     REG_BC,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x0a, "LD A,(BC)",   LD,      REG_A,      IND_BC,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x0b, "DEC BC",      DEC,     REG_BC,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x0c, "INC C",       INC,     REG_C,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x0d, "DEC C",       DEC,     REG_C,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x0e, "LD C,d8",     LD,      REG_C,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0x0f, "RRCA",        RRCA,    NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x10, "STOP",        STOP,    NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 2, 1, 1) \
    OPCODE(0x11, "LD DE,d16",   LD,      REG_DE,     IMM16,      ALWAYS, 0x00, 3, 3, 3) \
    OPCODE(0x12, "LD (DE),A",   LD,      IND_DE,     REG_A,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x13, "INC DE",      INC,     REG_DE,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x14, "INC D",       INC,     REG_D,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x15, "DEC D",       DEC,     REG_D,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x16, "LD D,d8",     LD,      REG_D,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0x17, "RLA",         RLA,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x18, "JR r8",       JR,      REL8,       NO_OPERAND, ALWAYS, 0x00, 2, 3, 3) \
    OPCODE(0x19, "ADD HL,DE",   ADD,     REG_HL,     REG_DE,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x1a, "LD A,(DE)",   LD,      REG_A,      IND_DE,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x1b, "DEC DE",      DEC,     REG_DE,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x1c, "INC E",       INC,     REG_E,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x1d, "DEC E",       DEC,     REG_E,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x1e, "LD E,d8",     LD,      REG_E,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0x1f, "RRA",         RRA,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x20, "JR NZ,r8",    JR,      REL8,       NO_OPERAND, IF_NZ,  0x00, 2, 2, 3) \
    OPCODE(0x21, "LD HL,d16",   LD,      REG_HL,     IMM16,      ALWAYS, 0x00, 3, 3, 3) \
    OPCODE(0x22, "LD (HL+),A",  LD,      IND_HLI,    REG_A,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x23, "INC HL",      INC,     REG_HL,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x24, "INC H",       INC,     REG_H,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x25, "DEC H",       DEC,     REG_H,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x26, "LD H,d8",     LD,      REG_H,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0x27, "DAA",         DAA,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x28, "JR Z,r8",     JR,      REL8,       NO_OPERAND, IF_Z,   0x00, 2, 2, 3) \
    OPCODE(0x29, "ADD HL,HL",   ADD,     REG_HL,     REG_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x2a, "LD A,(HL+)",  LD,      REG_A,      IND_HLI,    ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x2b, "DEC HL",      DEC,     REG_HL,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x2c, "INC L",       INC,     REG_L,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x2d, "DEC L",       DEC,     REG_L,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x2e, "LD L,d8",     LD,      REG_L,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0x2f, "CPL",         CPL,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x30, "JR NC,r8",    JR,      REL8,       NO_OPERAND, IF_NC,  0x00, 2, 2, 3) \
    OPCODE(0x31, "LD SP,d16",   LD,      REG_SP,     IMM16,      ALWAYS, 0x00, 3, 3, 3) \
    OPCODE(0x32, "LD (HL-),A",  LD,      IND_HLD,    REG_A,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x33, "INC SP",      INC,     REG_SP,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x34, "INC (HL)",    INC,     IND_HL,     NO_OPERAND, ALWAYS, 0x00, 1, 3, 3) \
    OPCODE(0x35, "DEC (HL)",    DEC,     IND_HL,     NO_OPERAND, ALWAYS, 0x00, 1, 3, 3) \
    OPCODE(0x36, "LD (HL),d8",  LD,      IND_HL,     IMM8,       ALWAYS, 0x00, 2, 3, 3) \
    OPCODE(0x37, "SCF",         SCF,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x38, "JR C,r8",     JR,      REL8,       NO_OPERAND, IF_C,   0x00, 2, 2, 3) \
    OPCODE(0x39, "ADD HL,SP",   ADD,     REG_HL,     REG_SP,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x3a, "LD A,(HL-)",  LD,      REG_A,      IND_HLD,    ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x3b, "DEC SP",      DEC,     REG_SP,     NO_OPERAND, ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x3c, "INC A",       INC,     REG_A,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x3d, "DEC A",       DEC,     REG_A,      NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x3e, "LD A,d8",     LD,      REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0x3f, "CCF",         CCF,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x40, "LD B,B",      LD,      REG_B,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x41, "LD B,C",      LD,      REG_B,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x42, "LD B,D",      LD,      REG_B,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x43, "LD B,E",      LD,      REG_B,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x44, "LD B,H",      LD,      REG_B,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x45, "LD B,L",      LD,      REG_B,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x46, "LD B,(HL)",   LD,      REG_B,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x47, "LD B,A",      LD,      REG_B,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x48, "LD C,B",      LD,      REG_C,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x49, "LD C,C",      LD,      REG_C,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x4a, "LD C,D",      LD,      REG_C,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x4b, "LD C,E",      LD,      REG_C,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x4c, "LD C,H",      LD,      REG_C,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x4d, "LD C,L",      LD,      REG_C,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x4e, "LD C,(HL)",   LD,      REG_C,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x4f, "LD C,A",      LD,      REG_C,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x50, "LD D,B",      LD,      REG_D,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x51, "LD D,C",      LD,      REG_D,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x52, "LD D,D",      LD,      REG_D,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x53, "LD D,E",      LD,      REG_D,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x54, "LD D,H",      LD,      REG_D,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x55, "LD D,L",      LD,      REG_D,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x56, "LD D,(HL)",   LD,      REG_D,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x57, "LD D,A",      LD,      REG_D,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x58, "LD E,B",      LD,      REG_E,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x59, "LD E,C",      LD,      REG_E,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x5a, "LD E,D",      LD,      REG_E,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x5b, "LD E,E",      LD,      REG_E,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x5c, "LD E,H",      LD,      REG_E,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x5d, "LD E,L",      LD,      REG_E,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x5e, "LD E,(HL)",   LD,      REG_E,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x5f, "LD E,A",      LD,      REG_E,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x60, "LD H,B",      LD,      REG_H,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x61, "LD H,C",      LD,      REG_H,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x62, "LD H,D",      LD,      REG_H,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x63, "LD H,E",      LD,      REG_H,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x64, "LD H,H",      LD,      REG_H,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x65, "LD H,L",      LD,      REG_H,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x66, "LD H,(HL)",   LD,      REG_H,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x67, "LD H,A",      LD,      REG_H,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x68, "LD L,B",      LD,      REG_L,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x69, "LD L,C",      LD,      REG_L,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x6a, "LD L,D",      LD,      REG_L,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x6b, "LD L,E",      LD,      REG_L,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x6c, "LD L,H",      LD,      REG_L,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x6d, "LD L,L",      LD,      REG_L,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x6e, "LD L,(HL)",   LD,      REG_L,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x6f, "LD L,A",      LD,      REG_L,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x70, "LD (HL),B",   LD,      IND_HL,     REG_B,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x71, "LD (HL),C",   LD,      IND_HL,     REG_C,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x72, "LD (HL),D",   LD,      IND_HL,     REG_D,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x73, "LD (HL),E",   LD,      IND_HL,     REG_E,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x74, "LD (HL),H",   LD,      IND_HL,     REG_H,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x75, "LD (HL),L",   LD,      IND_HL,     REG_L,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x76, "HALT",        HALT,    NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x77, "LD (HL),A",   LD,      IND_HL,     REG_A,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x78, "LD A,B",      LD,      REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x79, "LD A,C",      LD,      REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x7a, "LD A,D",      LD,      REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x7b, "LD A,E",      LD,      REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x7c, "LD A,H",      LD,      REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x7d, "LD A,L",      LD,      REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x7e, "LD A,(HL)",   LD,      REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x7f, "LD A,A",      LD,      REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x80, "ADD A,B",     ADD,     REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x81, "ADD A,C",     ADD,     REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x82, "ADD A,D",     ADD,     REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x83, "ADD A,E",     ADD,     REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x84, "ADD A,H",     ADD,     REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x85, "ADD A,L",     ADD,     REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x86, "ADD A,(HL)",  ADD,     REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x87, "ADD A,A",     ADD,     REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x88, "ADC A,B",     ADC,     REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x89, "ADC A,C",     ADC,     REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x8a, "ADC A,D",     ADC,     REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x8b, "ADC A,E",     ADC,     REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x8c, "ADC A,H",     ADC,     REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x8d, "ADC A,L",     ADC,     REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x8e, "ADC A,(HL)",  ADC,     REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x8f, "ADC A,A",     ADC,     REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x90, "SUB B",       SUB,     REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x91, "SUB C",       SUB,     REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x92, "SUB D",       SUB,     REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x93, "SUB E",       SUB,     REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x94, "SUB H",       SUB,     REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x95, "SUB L",       SUB,     REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x96, "SUB (HL)",    SUB,     REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x97, "SUB A",       SUB,     REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x98, "SBC A,B",     SBC,     REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x99, "SBC A,C",     SBC,     REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x9a, "SBC A,D",     SBC,     REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x9b, "SBC A,E",     SBC,     REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x9c, "SBC A,H",     SBC,     REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x9d, "SBC A,L",     SBC,     REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0x9e, "SBC A,(HL)",  SBC,     REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0x9f, "SBC A,A",     SBC,     REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa0, "AND B",       AND,     REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa1, "AND C",       AND,     REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa2, "AND D",       AND,     REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa3, "AND E",       AND,     REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa4, "AND H",       AND,     REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa5, "AND L",       AND,     REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa6, "AND (HL)",    AND,     REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0xa7, "AND A",       AND,     REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa8, "XOR B",       XOR,     REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xa9, "XOR C",       XOR,     REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xaa, "XOR D",       XOR,     REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xab, "XOR E",       XOR,     REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xac, "XOR H",       XOR,     REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xad, "XOR L",       XOR,     REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xae, "XOR (HL)",    XOR,     REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0xaf, "XOR A",       XOR,     REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb0, "OR B",        OR,      REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb1, "OR C",        OR,      REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb2, "OR D",        OR,      REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb3, "OR E",        OR,      REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb4, "OR H",        OR,      REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb5, "OR L",        OR,      REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb6, "OR (HL)",     OR,      REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0xb7, "OR A",        OR,      REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb8, "CP B",        CP,      REG_A,      REG_B,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xb9, "CP C",        CP,      REG_A,      REG_C,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xba, "CP D",        CP,      REG_A,      REG_D,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xbb, "CP E",        CP,      REG_A,      REG_E,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xbc, "CP H",        CP,      REG_A,      REG_H,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xbd, "CP L",        CP,      REG_A,      REG_L,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xbe, "CP (HL)",     CP,      REG_A,      IND_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0xbf, "CP A",        CP,      REG_A,      REG_A,      ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xc0, "RET NZ",      RET,     NO_OPERAND, NO_OPERAND, IF_NZ,  0x00, 1, 2, 5) \
    OPCODE(0xc1, "POP BC",      POP,     REG_BC,     NO_OPERAND, ALWAYS, 0x00, 1, 3, 3) \
    OPCODE(0xc2, "JP NZ,a16",   JP,      IMM16,      NO_OPERAND, IF_NZ,  0x00, 3, 3, 4) \
    OPCODE(0xc3, "JP a16",      JP,      IMM16,      NO_OPERAND, ALWAYS, 0x00, 3, 4, 4) \
    OPCODE(0xc4, "CALL NZ,a16", CALL,    IMM16,      NO_OPERAND, IF_NZ,  0x00, 3, 3, 6) \
    OPCODE(0xc5, "PUSH BC",     PUSH,    REG_BC,     NO_OPERAND, ALWAYS, 0x00, 1, 4, 4) \
    OPCODE(0xc6, "ADD A,d8",    ADD,     REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xc7, "RST 00H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 4, 4) \
    OPCODE(0xc8, "RET Z",       RET,     NO_OPERAND, NO_OPERAND, IF_Z,   0x00, 1, 2, 5) \
    OPCODE(0xc9, "RET",         RET,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 4, 4) \
    OPCODE(0xca, "JP Z,a16",    JP,      IMM16,      NO_OPERAND, IF_Z,   0x00, 3, 3, 4) \
    OPCODE(0xcb, "PREFIX CB",   PREFIX,  NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xcc, "CALL Z,a16",  CALL,    IMM16,      NO_OPERAND, IF_Z,   0x00, 3, 3, 6) \
    OPCODE(0xcd, "CALL a16",    CALL,    IMM16,      NO_OPERAND, ALWAYS, 0x00, 3, 6, 6) \
    OPCODE(0xce, "ADC A,d8",    ADC,     REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xcf, "RST 08H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x08, 1, 4, 4) \
    OPCODE(0xd0, "RET NC",      RET,     NO_OPERAND, NO_OPERAND, IF_NC,  0x00, 1, 2, 5) \
    OPCODE(0xd1, "POP DE",      POP,     REG_DE,     NO_OPERAND, ALWAYS, 0x00, 1, 3, 3) \
    OPCODE(0xd2, "JP NC,a16",   JP,      IMM16,      NO_OPERAND, IF_NC,  0x00, 3, 3, 4) \
    OPCODE(0xd3, "DB $D3",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xd4, "CALL NC,a16", CALL,    IMM16,      NO_OPERAND, IF_NC,  0x00, 3, 3, 6) \
    OPCODE(0xd5, "PUSH DE",     PUSH,    REG_DE,     NO_OPERAND, ALWAYS, 0x00, 1, 4, 4) \
    OPCODE(0xd6, "SUB d8",      SUB,     REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xd7, "RST 10H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x10, 1, 4, 4) \
    OPCODE(0xd8, "RET C",       RET,     NO_OPERAND, NO_OPERAND, IF_C,   0x00, 1, 2, 5) \
    OPCODE(0xd9, "RETI",        RETI,    NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 4, 4) \
    OPCODE(0xda, "JP C,a16",    JP,      IMM16,      NO_OPERAND, IF_C,   0x00, 3, 3, 4) \
    OPCODE(0xdb, "DB $DB",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xdc, "CALL C,a16",  CALL,    IMM16,      NO_OPERAND, IF_C,   0x00, 3, 3, 6) \
    OPCODE(0xdd, "DB $DD",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xde, "SBC A,d8",    SBC,     REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xdf, "RST 18H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x18, 1, 4, 4) \
    OPCODE(0xe0, "LDH (a8),A",  LD,      IND_A8,     REG_A,      ALWAYS, 0x00, 2, 3, 3) \
    OPCODE(0xe1, "POP HL",      POP,     REG_HL,     NO_OPERAND, ALWAYS, 0x00, 1, 3, 3) \
    OPCODE(0xe2, "LD (C),A",    LD,      IND_C,      REG_A,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0xe3, "DB $E3",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xe4, "DB $E4",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xe5, "PUSH HL",     PUSH,    REG_HL,     NO_OPERAND, ALWAYS, 0x00, 1, 4, 4) \
    OPCODE(0xe6, "AND d8",      AND,     REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xe7, "RST 20H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x20, 1, 4, 4) \
    OPCODE(0xe8, "ADD SP,r8",   ADD,     REG_SP,     REL8,       ALWAYS, 0x00, 2, 4, 4) \
    OPCODE(0xe9, "JP HL",       JP,      REG_HL,     NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xea, "LD (a16),A",  LD,      IND_A16,    REG_A,      ALWAYS, 0x00, 3, 4, 4) \
    OPCODE(0xeb, "DB $EB",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xec, "DB $EC",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xed, "DB $ED",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xee, "XOR d8",      XOR,     REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xef, "RST 28H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x28, 1, 4, 4) \
    OPCODE(0xf0, "LDH A,(a8)",  LD,      REG_A,      IND_A8,     ALWAYS, 0x00, 2, 3, 3) \
    OPCODE(0xf1, "POP AF",      POP,     REG_AF,     NO_OPERAND, ALWAYS, 0x00, 1, 3, 3) \
    OPCODE(0xf2, "LD A,(C)",    LD,      REG_A,      IND_C,      ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0xf3, "DI",          DI,      NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xf4, "DB $F4",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xf5, "PUSH AF",     PUSH,    REG_AF,     NO_OPERAND, ALWAYS, 0x00, 1, 4, 4) \
    OPCODE(0xf6, "OR d8",       OR,      REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xf7, "RST 30H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x30, 1, 4, 4) \
    OPCODE(0xf8, "LD HL,SP+r8", LD,      REG_HL,     SP_REL8,    ALWAYS, 0x00, 2, 3, 3) \
    OPCODE(0xf9, "LD SP,HL",    LD,      REG_SP,     REG_HL,     ALWAYS, 0x00, 1, 2, 2) \
    OPCODE(0xfa, "LD A,(a16)",  LD,      REG_A,      IND_A16,    ALWAYS, 0x00, 3, 4, 4) \
    OPCODE(0xfb, "EI",          EI,      NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xfc, "DB $FC",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xfd, "DB $FD",      ILLEGAL, NO_OPERAND, NO_OPERAND, ALWAYS, 0x00, 1, 1, 1) \
    OPCODE(0xfe, "CP d8",       CP,      REG_A,      IMM8,       ALWAYS, 0x00, 2, 2, 2) \
    OPCODE(0xff, "RST 38H",     RST,     NO_OPERAND, NO_OPERAND, ALWAYS, 0x38, 1, 4, 4)

static const Instruction primary_table[256] = {
#define OPCODE(byte, text, op, dst, src, cond, arg, len, cycles, taken) \
    {text, op, dst, src, cond, arg, len, cycles, taken},
    PRIMARY_OPCODES()
#undef OPCODE
};

static const char* operation_names[] = {
#define OPERATION(name) #name,
    OPERATIONS()
#undef OPERATION
};

// The extended space is orthogonal: bits 7-6 pick the group, bits 5-3 the
// operation or bit number, bits 2-0 the register.
struct ExtendedTable {
    Instruction entries[256];
    std::string text[256];

    ExtendedTable() {
        static const Operand registers[] = {
            REG_B, REG_C, REG_D, REG_E, REG_H, REG_L, IND_HL, REG_A
        };
        static const char* register_names[] = {
            "B", "C", "D", "E", "H", "L", "(HL)", "A"
        };
        static const Operation shifts[] = {
            RLC, RRC, RL, RR, SLA, SRA, SWAP, SRL
        };
        static const Operation bit_ops[] = { BIT, RES, SET };

        for (int opcode = 0; opcode < 256; opcode++) {
            auto group = opcode >> 6;
            auto y = (opcode >> 3) & 7;
            auto reg = registers[opcode & 7];
            auto memory = reg == IND_HL;

            auto& in = entries[opcode];
            in.dst = reg;
            in.src = NO_OPERAND;
            in.cond = ALWAYS;
            in.length = 2;

            if (group == 0) {
                in.op = shifts[y];
                in.arg = 0;
                in.cycles = memory ? 4 : 2;
                text[opcode] = std::string(operation_names[in.op]) + " " +
                               register_names[opcode & 7];
            } else {
                in.op = bit_ops[group - 1];
                in.arg = y;
                in.cycles = memory ? (in.op == BIT ? 3 : 4) : 2;
                text[opcode] = std::string(operation_names[in.op]) + " " +
                               std::to_string(y) + "," + register_names[opcode & 7];
            }
            in.cycles_taken = in.cycles;
            in.text = text[opcode].c_str();
        }
    }
};

static const ExtendedTable&
extended_table() {
    static const ExtendedTable table;
    return table;
}

const Instruction&
decode(uint8_t opcode) {
    return primary_table[opcode];
}

const Instruction&
decode_extended(uint8_t opcode) {
    return extended_table().entries[opcode];
}

const char*
operation_name(Operation op) {
    return operation_names[op];
}

bool
is_wide(Operand operand) {
    switch (operand) {
        case REG_AF:
        case REG_BC:
        case REG_DE:
        case REG_HL:
        case REG_SP:
        case IMM16:
            return true;
        default:
            return false;
    }
}

uint8_t
immediate_length(Operand operand) {
    switch (operand) {
        case IND_A8:
        case IMM8:
        case REL8:
        case SP_REL8:
            return 1;
        case IND_A16:
        case IMM16:
            return 2;
        default:
            return 0;
    }
}
