#include "lr35902.hpp"
#include <cstdio>
#include <cstring>


static void
replace(std::string& text, const char* placeholder, const char* val) {
    auto pos = text.find(placeholder);
    if (pos != std::string::npos) {
        text.replace(pos, strlen(placeholder), val);
    }
}

std::string
disassemble(const Memory& mem, uint16_t addr) {
    const Instruction* in = &decode(mem.peek8(addr));
    if (in->op == PREFIX) {
        in = &decode_extended(mem.peek8(addr + 1));
    }

    std::string text = in->text;
    auto len = immediate_length(in->dst) + immediate_length(in->src);
    if (len == 0) return text;

    uint16_t imm = len == 1 ? mem.peek8(addr + 1) : mem.peek16(addr + 1);
    char buf[16];
    if (len == 2) {
        snprintf(buf, sizeof(buf), "$%04X", imm);
        replace(text, "d16", buf);
        replace(text, "a16", buf);
    } else if (in->op == JR) {
        snprintf(buf, sizeof(buf), "$%04X",
                 uint16_t(addr + in->length + int8_t(imm)));
        replace(text, "r8", buf);
    } else if (in->src == SP_REL8 || in->src == REL8) {
        snprintf(buf, sizeof(buf), "%+d", int8_t(imm));
        // "SP+r8" becomes "SP+5" or "SP-3".
        if (text.find("+r8") != std::string::npos) {
            replace(text, "+r8", buf);
        } else {
            replace(text, "r8", buf);
        }
    } else if (in->src == IND_A8 || in->dst == IND_A8) {
        snprintf(buf, sizeof(buf), "$FF%02X", imm);
        replace(text, "a8", buf);
    } else {
        snprintf(buf, sizeof(buf), "$%02X", imm);
        replace(text, "d8", buf);
    }
    return text;
}
