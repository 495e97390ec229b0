#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#define ROM_BANK_SIZE 0x4000
#define MAX_ROM_SIZE 0x800000

enum class LoadStatus {
    OK,
    OPEN_FAILED,
    EMPTY,
    TOO_LARGE
};

// Cartridge header, 0x0100 - 0x014F.
struct CartridgeHeader {
    uint8_t entry_point[4];
    uint8_t logo[48];
    std::string title;
    uint8_t color_flag;
    uint16_t manufacturer_code;
    uint8_t legacy_console_flag;
    uint8_t cartridge_type;
    uint8_t rom_size_code;
    uint8_t ram_size_code;
    uint8_t destination_code;
    uint8_t licensee_code;
    uint8_t version;
    uint8_t header_checksum;
    uint16_t global_checksum;

    uint32_t rom_size() const {
        return (uint32_t(rom_size_code) + 1) * 32768;
    }

    uint32_t ram_size() const {
        switch (ram_size_code) {
            case 1: return 2048;
            case 2: return 8192;
            case 3: return 32768;
            default: return 0;
        }
    }
};

class Cartridge {
  public:
    // Pads the image with zeroes to a whole number of ROM banks (at least two).
    explicit Cartridge(std::vector<uint8_t> image);

    static LoadStatus load(const std::string& path, std::vector<uint8_t>& out);

    const CartridgeHeader& header() const { return header_; }
    const uint8_t* data() const { return image_.data(); }
    size_t size() const { return image_.size(); }
    size_t bank_count() const { return image_.size() / ROM_BANK_SIZE; }

  private:
    std::vector<uint8_t> image_;
    CartridgeHeader header_;
};

extern const char* load_status_to_string(LoadStatus status);
