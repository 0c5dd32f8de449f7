#include "jpi/zip.hpp"
#include "jpi/platform.hpp"

#include <algorithm>
#include <cstring>
#include <set>

#include <zlib.h>

namespace jpi {

// ============================================================================
// ZIP Format Constants
// ============================================================================

static constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
static constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
static constexpr uint32_t END_OF_CENTRAL_DIR_SIG = 0x06054b50;

static constexpr size_t LOCAL_HEADER_SIZE = 30;
static constexpr size_t CENTRAL_HEADER_SIZE = 46;
static constexpr size_t END_OF_CENTRAL_DIR_SIZE = 22;

static constexpr uint16_t METHOD_STORED = 0;
static constexpr uint16_t METHOD_DEFLATED = 8;

static constexpr uint16_t VERSION_NEEDED = 20;
static constexpr uint16_t VERSION_MADE_BY = (3 << 8) | 20;  // UNIX, 2.0
static constexpr uint16_t FLAG_UTF8 = 0x0800;

// 1980-01-01 00:00:00 in MS-DOS format
static constexpr uint16_t DOS_TIME = 0;
static constexpr uint16_t DOS_DATE = (0 << 9) | (1 << 5) | 1;

static constexpr uint32_t FILE_ATTRIBUTES = (0100644u << 16);
static constexpr uint32_t DIR_ATTRIBUTES = (040755u << 16) | 0x10;

static constexpr char MANIFEST_DIR[] = "META-INF/";
static constexpr char MANIFEST_PATH[] = "META-INF/MANIFEST.MF";

// ============================================================================
// Helper Functions
// ============================================================================

static void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

static void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

static uint16_t get_u16(const std::vector<uint8_t>& in, size_t offset) {
    return static_cast<uint16_t>(in[offset] | (in[offset + 1] << 8));
}

static uint32_t get_u32(const std::vector<uint8_t>& in, size_t offset) {
    return static_cast<uint32_t>(in[offset]) | (static_cast<uint32_t>(in[offset + 1]) << 8) |
           (static_cast<uint32_t>(in[offset + 2]) << 16) |
           (static_cast<uint32_t>(in[offset + 3]) << 24);
}

static uint32_t crc_of(const std::vector<uint8_t>& data) {
    return static_cast<uint32_t>(
        crc32(0, data.empty() ? Z_NULL : data.data(), static_cast<uInt>(data.size())));
}

// Raw deflate (negative window bits), as used inside ZIP entries
static bool raw_deflate(const std::vector<uint8_t>& data, std::vector<uint8_t>& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    out.resize(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        out.clear();
        return false;
    }
    out.resize(strm.total_out);
    return true;
}

static bool raw_inflate(const uint8_t* data, size_t size, size_t expected_size,
                        std::vector<uint8_t>& out) {
    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -15) != Z_OK) {
        return false;
    }

    out.resize(expected_size);
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);

    return ret == Z_STREAM_END && strm.total_out == expected_size;
}

static int entry_rank(const std::string& name) {
    if (name == MANIFEST_DIR) return 0;
    if (name == MANIFEST_PATH) return 1;
    return 2;
}

static bool valid_entry_path(const std::string& path) {
    if (path.empty() || path[0] == '/' || path.back() == '/') return false;
    if (path.find('\\') != std::string::npos) return false;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        std::string part = path.substr(start, slash == std::string::npos ? std::string::npos
                                                                         : slash - start);
        if (part.empty() || part == "." || part == "..") return false;
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return true;
}

namespace {

struct PreparedEntry {
    std::string name;  // directories carry a trailing slash
    bool directory = false;
    const std::vector<uint8_t>* data = nullptr;
};

} // namespace

// ============================================================================
// Public API Implementation
// ============================================================================

ZipResult create_deterministic_zip(const std::vector<ZipEntry>& entries) {
    ZipResult result;

    std::set<std::string> files;
    std::set<std::string> directories;
    for (const auto& entry : entries) {
        if (!valid_entry_path(entry.path)) {
            result.error = "invalid archive entry path: '" + entry.path + "'";
            return result;
        }
        if (entry.type == ZipEntryType::Directory) {
            directories.insert(entry.path + "/");
        } else if (!files.insert(entry.path).second) {
            result.error = "duplicate archive entry: " + entry.path;
            return result;
        }
    }

    // Parent directories of every entry
    for (const auto& entry : entries) {
        size_t slash = entry.path.find('/');
        while (slash != std::string::npos) {
            directories.insert(entry.path.substr(0, slash + 1));
            slash = entry.path.find('/', slash + 1);
        }
    }
    for (const auto& dir : directories) {
        if (files.count(dir.substr(0, dir.size() - 1)) > 0) {
            result.error = "archive entry is both file and directory: " + dir;
            return result;
        }
    }

    std::vector<PreparedEntry> prepared;
    for (const auto& dir : directories) {
        prepared.push_back(PreparedEntry{dir, true, nullptr});
    }
    for (const auto& entry : entries) {
        if (entry.type == ZipEntryType::File) {
            prepared.push_back(PreparedEntry{entry.path, false, &entry.data});
        }
    }
    std::sort(prepared.begin(), prepared.end(), [](const PreparedEntry& a, const PreparedEntry& b) {
        int ra = entry_rank(a.name);
        int rb = entry_rank(b.name);
        if (ra != rb) return ra < rb;
        return a.name < b.name;
    });

    if (prepared.size() > 0xFFFF) {
        result.error = "too many archive entries: " + std::to_string(prepared.size());
        return result;
    }

    std::vector<uint8_t>& out = result.archive_data;
    std::vector<uint8_t> central;
    static const std::vector<uint8_t> empty;

    for (const auto& entry : prepared) {
        const std::vector<uint8_t>& data = entry.directory ? empty : *entry.data;
        if (data.size() > 0xFFFFFFFEu || out.size() > 0xFFFFFFFEu) {
            result.error = "archive too large for ZIP32: " + entry.name;
            return result;
        }

        uint32_t crc = crc_of(data);
        uint16_t method = METHOD_STORED;
        std::vector<uint8_t> deflated;
        if (!data.empty()) {
            if (!raw_deflate(data, deflated)) {
                result.error = "deflate failed for " + entry.name;
                return result;
            }
            if (deflated.size() < data.size()) method = METHOD_DEFLATED;
        }
        const std::vector<uint8_t>& payload = method == METHOD_DEFLATED ? deflated : data;

        uint32_t local_offset = static_cast<uint32_t>(out.size());
        uint16_t name_len = static_cast<uint16_t>(entry.name.size());

        put_u32(out, LOCAL_HEADER_SIG);
        put_u16(out, VERSION_NEEDED);
        put_u16(out, FLAG_UTF8);
        put_u16(out, method);
        put_u16(out, DOS_TIME);
        put_u16(out, DOS_DATE);
        put_u32(out, crc);
        put_u32(out, static_cast<uint32_t>(payload.size()));
        put_u32(out, static_cast<uint32_t>(data.size()));
        put_u16(out, name_len);
        put_u16(out, 0);  // extra
        out.insert(out.end(), entry.name.begin(), entry.name.end());
        out.insert(out.end(), payload.begin(), payload.end());

        put_u32(central, CENTRAL_HEADER_SIG);
        put_u16(central, VERSION_MADE_BY);
        put_u16(central, VERSION_NEEDED);
        put_u16(central, FLAG_UTF8);
        put_u16(central, method);
        put_u16(central, DOS_TIME);
        put_u16(central, DOS_DATE);
        put_u32(central, crc);
        put_u32(central, static_cast<uint32_t>(payload.size()));
        put_u32(central, static_cast<uint32_t>(data.size()));
        put_u16(central, name_len);
        put_u16(central, 0);  // extra
        put_u16(central, 0);  // comment
        put_u16(central, 0);  // disk number
        put_u16(central, 0);  // internal attributes
        put_u32(central, entry.directory ? DIR_ATTRIBUTES : FILE_ATTRIBUTES);
        put_u32(central, local_offset);
        central.insert(central.end(), entry.name.begin(), entry.name.end());
    }

    uint32_t central_offset = static_cast<uint32_t>(out.size());
    out.insert(out.end(), central.begin(), central.end());

    put_u32(out, END_OF_CENTRAL_DIR_SIG);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<uint16_t>(prepared.size()));
    put_u16(out, static_cast<uint16_t>(prepared.size()));
    put_u32(out, static_cast<uint32_t>(central.size()));
    put_u32(out, central_offset);
    put_u16(out, 0);  // comment

    result.ok = true;
    return result;
}

ZipReadResult read_zip(const std::vector<uint8_t>& archive_data) {
    ZipReadResult result;
    const auto& in = archive_data;

    if (in.size() < END_OF_CENTRAL_DIR_SIZE) {
        result.error = "not a ZIP archive: too small";
        return result;
    }

    // The end record sits at the tail, followed by at most a 64 KiB comment
    size_t eocd = std::string::npos;
    size_t lowest = in.size() > END_OF_CENTRAL_DIR_SIZE + 0xFFFF
                        ? in.size() - END_OF_CENTRAL_DIR_SIZE - 0xFFFF
                        : 0;
    for (size_t pos = in.size() - END_OF_CENTRAL_DIR_SIZE + 1; pos-- > lowest;) {
        if (get_u32(in, pos) == END_OF_CENTRAL_DIR_SIG) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) {
        result.error = "not a ZIP archive: end of central directory not found";
        return result;
    }

    uint16_t count = get_u16(in, eocd + 10);
    size_t offset = get_u32(in, eocd + 16);

    for (uint16_t i = 0; i < count; ++i) {
        if (offset + CENTRAL_HEADER_SIZE > in.size() || get_u32(in, offset) != CENTRAL_HEADER_SIG) {
            result.error = "corrupt central directory at entry " + std::to_string(i);
            return result;
        }

        uint16_t method = get_u16(in, offset + 10);
        uint32_t crc = get_u32(in, offset + 16);
        uint32_t compressed_size = get_u32(in, offset + 20);
        uint32_t size = get_u32(in, offset + 24);
        uint16_t name_len = get_u16(in, offset + 28);
        uint16_t extra_len = get_u16(in, offset + 30);
        uint16_t comment_len = get_u16(in, offset + 32);
        uint32_t local_offset = get_u32(in, offset + 42);

        if (offset + CENTRAL_HEADER_SIZE + name_len > in.size()) {
            result.error = "corrupt central directory at entry " + std::to_string(i);
            return result;
        }
        std::string name(reinterpret_cast<const char*>(&in[offset + CENTRAL_HEADER_SIZE]), name_len);
        offset += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;

        if (local_offset + LOCAL_HEADER_SIZE > in.size() ||
            get_u32(in, local_offset) != LOCAL_HEADER_SIG) {
            result.error = "corrupt local header: " + name;
            return result;
        }
        size_t data_start = local_offset + LOCAL_HEADER_SIZE + get_u16(in, local_offset + 26) +
                            get_u16(in, local_offset + 28);
        if (data_start + compressed_size > in.size()) {
            result.error = "truncated entry: " + name;
            return result;
        }

        ZipEntry entry;
        if (!name.empty() && name.back() == '/') {
            entry.type = ZipEntryType::Directory;
            entry.path = name.substr(0, name.size() - 1);
            result.entries.push_back(std::move(entry));
            continue;
        }
        entry.path = name;

        if (method == METHOD_STORED) {
            entry.data.assign(in.begin() + static_cast<std::ptrdiff_t>(data_start),
                              in.begin() + static_cast<std::ptrdiff_t>(data_start + compressed_size));
        } else if (method == METHOD_DEFLATED) {
            if (!raw_inflate(&in[data_start], compressed_size, size, entry.data)) {
                result.error = "inflate failed: " + name;
                return result;
            }
        } else {
            result.error = "unsupported compression method " + std::to_string(method) + ": " + name;
            return result;
        }

        if (crc_of(entry.data) != crc) {
            result.error = "CRC mismatch: " + name;
            return result;
        }
        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

ZipReadResult read_zip_file(const std::string& path) {
    auto bytes = read_file_bytes(path);
    if (!bytes.ok) {
        ZipReadResult result;
        result.error = bytes.error;
        return result;
    }
    return read_zip(bytes.data);
}

const ZipEntry* find_zip_entry(const std::vector<ZipEntry>& entries, const std::string& path) {
    for (const auto& entry : entries) {
        if (entry.path == path) return &entry;
    }
    return nullptr;
}

} // namespace jpi
