#pragma once

// On-disk layouts of the supported pack revisions. All integers are
// little-endian.
//
// Classic (revision 0x102)
// +----------------------------------------------+
// | Header (0x220 bytes)                         |
// |   0x000 magic "PACK"       : u32             |
// |   0x004 revision = 0x102   : u32             |
// |   0x008 version key        : u32             |
// |   0x00C entry count        : u32             |
// |   0x010 created            : 2 x FILETIME    |
// |   0x020 root name "data\"  : zero padded     |
// |   0x200 entry count        : u32 (repeated)  |
// |   0x204 table size         : u32             |
// |   0x208 reserved           : u32             |
// |   0x20C data size          : u32             |
// |   0x210 reserved           : 16 bytes        |
// +----------------------------------------------+
// | Table, per entry:                            |
// |   path block (class byte + padded string)    |
// |   version key, crc32, offset, stored size,   |
// |   uncompressed size, flag : u32 each         |
// |   times : 5 x FILETIME                       |
// +----------------------------------------------+
// | Data: obfuscated payloads, back to back      |
// +----------------------------------------------+
//
// Extended (revision 0x103)
// +----------------------------------------------+
// | Header (0x40 bytes)                          |
// |   magic, revision, version key, entry count  |
// |   : u32 each                                 |
// |   table offset, table size, data offset,     |
// |   data size : u64 each                       |
// |   reserved : 16 bytes                        |
// +----------------------------------------------+
// | Table, per entry:                            |
// |   path_len : u16, path : char[path_len]      |
// |   version key : u32, flags : u8, pad[3]      |
// |   offset, stored size, uncompressed : u64    |
// |   sha256 : 32 bytes                          |
// +----------------------------------------------+
// | Data: payloads, back to back                 |
// +----------------------------------------------+

#include <cstddef>
#include <cstdint>

namespace mabi_pack::detail {

// "PACK" read as a little-endian u32.
constexpr std::uint32_t pack_magic = 0x4B434150;

// Magic plus revision: enough bytes to pick a layout.
constexpr std::size_t signature_size = 8;

namespace classic {
constexpr std::uint32_t revision = 0x102;
constexpr std::size_t header_size = 0x220;
constexpr std::size_t created_offset = 0x010;
constexpr std::size_t root_name_offset = 0x020;
constexpr std::size_t footer_offset = 0x200;
constexpr char root_name[] = "data\\";
constexpr std::size_t fixed_record_size = 0x40;
constexpr std::size_t time_count = 5;
constexpr std::uint32_t compressed_flag = 1;
constexpr std::uint32_t max_version_key = 0x01FFFFFF;
constexpr std::uint8_t long_path_class = 5;
} // namespace classic

namespace extended {
constexpr std::uint32_t revision = 0x103;
constexpr std::size_t header_size = 0x40;
constexpr std::size_t fixed_record_size = 2 + 4 + 4 + 8 * 3 + 32;
constexpr std::uint8_t compressed_bit = 0x01;
constexpr std::size_t max_path_length = 0xFFFF;
} // namespace extended

} // namespace mabi_pack::detail
