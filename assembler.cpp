#include <cstring>

#include "assembler.hpp"
#include "memory.hpp"


extern bool
find_opcode(Operation op, Operand dst, Operand src, Condition cond,
            uint8_t arg, uint8_t* opcode, bool* extended) {
    auto matches = [&](const Instruction& in) {
        return in.op == op && in.dst == dst && in.src == src &&
               in.cond == cond && in.arg == arg;
    };
    // XXX linear scan
    for (int byte = 0; byte < 256; byte++) {
        if (matches(decode(byte))) {
            *opcode = byte;
            *extended = false;
            return true;
        }
        if (matches(decode_extended(byte))) {
            *opcode = byte;
            *extended = true;
            return true;
        }
    }
    return false;
}

extern size_t
assemble_instr(Operation op, Operand dst, Operand src, Condition cond,
               uint8_t arg, uint16_t imm, uint8_t* destination) {
    uint8_t opcode;
    bool extended;
    if (!find_opcode(op, dst, src, cond, arg, &opcode, &extended)) {
        NOT_REACHED();
    }

    const Instruction& in = extended ? decode_extended(opcode) : decode(opcode);
    if (extended) *destination++ = EXTENDED_PREFIX;
    *destination++ = opcode;

    auto len = immediate_length(dst) + immediate_length(src);
    if (len > 0) *destination++ = imm & 0xff;
    if (len > 1) *destination++ = (imm & 0xff00) >> 8;
    // STOP carries a padding byte.
    if (op == STOP) *destination++ = 0x00;
    return in.length;
}

static void
patch(std::vector<uint8_t>& image, const Assembler::Reference& ref, MemLoc target) {
    if (ref.relative) {
        image[ref.location] = uint8_t(target - ref.origin);
    } else {
        image[ref.location] = target & 0xff;
        image[ref.location + 1] = (target & 0xff00) >> 8;
    }
}

void
Assembler::Label::resolve(MemLoc loc, std::vector<uint8_t>& image) {
    location = loc;
    resolved = true;
    for (const auto& ref : references) {
        patch(image, ref, location);
    }
    references.clear();
}

uint8_t*
Assembler::reserve(size_t len) {
    if (image_.size() < size_t(org_) + len) {
        image_.resize(size_t(org_) + len, 0);
    }
    return &image_[org_];
}

Assembler&
Assembler::emit(Operation op, Operand dst, Operand src, Condition cond,
                uint8_t arg, uint16_t imm) {
    uint8_t bytes[4];
    auto len = assemble_instr(op, dst, src, cond, arg, imm, bytes);
    memcpy(reserve(len), bytes, len);
    org_ += len;
    return *this;
}

Assembler&
Assembler::emit_branch(Operation op, Condition cond, Operand dst,
                       const std::string& target) {
    auto& lbl = labels_[target];
    auto relative = op == JR;
    auto start = org_;
    emit(op, dst, NO_OPERAND, cond, 0, 0);

    Reference ref = {MemLoc(start + 1), org_, relative};
    if (lbl.resolved) {
        patch(image_, ref, lbl.location);
    } else {
        lbl.references.push_back(ref);
    }
    return *this;
}

Assembler&
Assembler::operator()(Operation op, Operand dst, const std::string& target) {
    return emit_branch(op, ALWAYS, dst, target);
}

Assembler&
Assembler::operator()(Operation op, Condition cond, Operand dst,
                      const std::string& target) {
    return emit_branch(op, cond, dst, target);
}

Assembler&
Assembler::label(const std::string& name) {
    labels_[name].resolve(org_, image_);
    return *this;
}

Assembler&
Assembler::db(uint8_t byte) {
    *reserve(1) = byte;
    org_ += 1;
    return *this;
}

bool
Assembler::unresolved() const {
    for (const auto& entry : labels_) {
        if (!entry.second.resolved) return true;
    }
    return false;
}
