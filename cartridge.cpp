#include "cartridge.hpp"
#include "logger.hpp"
#include <cstring>
#include <fstream>
#include <utility>


static uint16_t
read16_le(const std::vector<uint8_t>& bytes, size_t offset) {
    return bytes[offset] | (bytes[offset + 1] << 8);
}

static CartridgeHeader
parse_header(const std::vector<uint8_t>& bytes) {
    CartridgeHeader header;
    memcpy(header.entry_point, &bytes[0x100], sizeof(header.entry_point));
    memcpy(header.logo, &bytes[0x104], sizeof(header.logo));

    for (size_t i = 0x134; i <= 0x142; i++) {
        if (bytes[i] != 0) header.title.push_back(char(bytes[i]));
    }

    header.color_flag = bytes[0x143];
    header.manufacturer_code = read16_le(bytes, 0x144);
    header.legacy_console_flag = bytes[0x146];
    header.cartridge_type = bytes[0x147];
    header.rom_size_code = bytes[0x148];
    header.ram_size_code = bytes[0x149];
    header.destination_code = bytes[0x14a];
    header.licensee_code = bytes[0x14b];
    header.version = bytes[0x14c];
    header.header_checksum = bytes[0x14d];
    header.global_checksum = read16_le(bytes, 0x14e);
    return header;
}

Cartridge::Cartridge(std::vector<uint8_t> image)
: image_(std::move(image)) {
    auto banks = (image_.size() + ROM_BANK_SIZE - 1) / ROM_BANK_SIZE;
    if (banks < 2) banks = 2;
    image_.resize(banks * ROM_BANK_SIZE, 0);

    header_ = parse_header(image_);
    LOG_INFOF("cartridge '%s': %zu bytes, type %02x, header ROM %u, RAM %u",
              header_.title.c_str(), image_.size(), header_.cartridge_type,
              header_.rom_size(), header_.ram_size());
}

LoadStatus
Cartridge::load(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path.c_str(), std::ios::binary);
    if (!file.good()) {
        LOG_ERRORF("cannot open cartridge image %s", path.c_str());
        return LoadStatus::OPEN_FAILED;
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size <= 0) {
        LOG_ERRORF("cartridge image %s is empty", path.c_str());
        return LoadStatus::EMPTY;
    }
    if (size > MAX_ROM_SIZE) {
        LOG_ERRORF("cartridge image %s exceeds %d bytes", path.c_str(), MAX_ROM_SIZE);
        return LoadStatus::TOO_LARGE;
    }

    out.resize(size_t(size));
    file.read(reinterpret_cast<char*>(out.data()), size);
    if (!file) {
        LOG_ERRORF("short read on cartridge image %s", path.c_str());
        return LoadStatus::OPEN_FAILED;
    }
    return LoadStatus::OK;
}

const char*
load_status_to_string(LoadStatus status) {
    switch (status) {
        case LoadStatus::OK: return "ok";
        case LoadStatus::OPEN_FAILED: return "open failed";
        case LoadStatus::EMPTY: return "empty image";
        case LoadStatus::TOO_LARGE: return "image too large";
    }
    return "unknown";
}
