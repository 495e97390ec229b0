#pragma once

#include "opcodes.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

typedef uint16_t MemLoc;

// Finds the opcode encoding an instruction form. Returns false if there is none.
extern bool find_opcode(Operation op, Operand dst, Operand src, Condition cond,
                        uint8_t arg, uint8_t* opcode, bool* extended);

// Returns bytes written
extern size_t assemble_instr(Operation op, Operand dst, Operand src, Condition cond,
                             uint8_t arg, uint16_t imm, uint8_t* destination);

// Writes instructions into a cartridge image. Labels may be referenced before
// they are defined; the operand is patched when the label is placed.
struct Assembler {
    struct Reference {
        MemLoc location;    // operand bytes
        MemLoc origin;      // end of the instruction, for relative operands
        bool relative;
    };

    class Label {
      public:
        MemLoc location = 0;
        bool resolved = false;
        std::vector<Reference> references;

        void resolve(MemLoc loc, std::vector<uint8_t>& image);
    };

    explicit Assembler(std::vector<uint8_t>& image) :
    image_(image), org_(0) { }

    Assembler&
    org(MemLoc location) {
        org_ = location;
        return *this;
    }

    MemLoc here() const { return org_; }

    Assembler& label(const std::string& name);
    Assembler& db(uint8_t byte);

    Assembler&
    operator()(Operation op, Operand dst = NO_OPERAND, Operand src = NO_OPERAND,
               uint16_t imm = 0) {
        return emit(op, dst, src, ALWAYS, 0, imm);
    }

    Assembler&
    operator()(Operation op, Condition cond, Operand dst = NO_OPERAND, uint16_t imm = 0) {
        return emit(op, dst, NO_OPERAND, cond, 0, imm);
    }

    // JP, JR and CALL to a label.
    Assembler& operator()(Operation op, Operand dst, const std::string& target);
    Assembler& operator()(Operation op, Condition cond, Operand dst, const std::string& target);

    // BIT, RES and SET.
    Assembler&
    bit(Operation op, uint8_t bit, Operand dst) {
        return emit(op, dst, NO_OPERAND, ALWAYS, bit, 0);
    }

    Assembler&
    rst(uint8_t vector) {
        return emit(RST, NO_OPERAND, NO_OPERAND, ALWAYS, vector, 0);
    }

    bool unresolved() const;

protected:
    Assembler& emit(Operation op, Operand dst, Operand src, Condition cond,
                    uint8_t arg, uint16_t imm);
    Assembler& emit_branch(Operation op, Condition cond, Operand dst,
                           const std::string& target);
    uint8_t* reserve(size_t len);

    std::vector<uint8_t>& image_;
    MemLoc org_;
    std::map<std::string, Label> labels_;
};
