#include "ExifReader.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <string_view>
#include <vector>

namespace {

constexpr std::size_t kScanBytes = 1024 * 1024; // metadata lives near the start of the file
constexpr std::size_t kMaxIfdEntries = 1024;

constexpr std::uint16_t kTagDateTime = 0x0132;
constexpr std::uint16_t kTagExifIfdPointer = 0x8769;
constexpr std::uint16_t kTagDateTimeOriginal = 0x9003;
constexpr std::uint16_t kTagDateTimeDigitized = 0x9004;
constexpr std::uint16_t kTypeAscii = 2;
constexpr std::uint16_t kTypeLong = 4;

constexpr std::array<std::string_view, 8> kImageExtensions = {
    ".jpg", ".jpeg", ".tiff", ".tif", ".raw", ".cr2", ".nef", ".arw"
};

bool read_file_prefix(std::ifstream& file, std::vector<char>& buffer, std::size_t& bytes_read)
{
    const auto request = static_cast<std::streamsize>(
        std::min<std::size_t>(buffer.size(), static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max())));
    file.read(buffer.data(), request);
    if (!file && !file.eof()) {
        return false;
    }
    const std::streamsize read_count = file.gcount();
    if (read_count <= 0) {
        return false;
    }
    bytes_read = static_cast<std::size_t>(read_count);
    return true;
}

// View over a TIFF structure (the payload of an Exif APP1 segment or a
// whole TIFF-based raw file). Offsets are relative to the TIFF header.
class TiffView {
public:
    TiffView(const unsigned char* data, std::size_t size)
        : data(data), size(size) {}

    bool init()
    {
        if (size < 8) {
            return false;
        }
        if (data[0] == 'I' && data[1] == 'I') {
            little_endian = true;
        } else if (data[0] == 'M' && data[1] == 'M') {
            little_endian = false;
        } else {
            return false;
        }
        std::uint16_t magic = 0;
        return read_u16(2, magic) && magic == 42;
    }

    std::optional<std::uint32_t> first_ifd_offset() const
    {
        std::uint32_t offset = 0;
        if (!read_u32(4, offset)) {
            return std::nullopt;
        }
        return offset;
    }

    // Visits each 12-byte entry of the IFD at @p offset.
    template <typename Visitor>
    bool for_each_entry(std::uint32_t offset, Visitor&& visit) const
    {
        std::uint16_t count = 0;
        if (!read_u16(offset, count) || count > kMaxIfdEntries) {
            return false;
        }
        for (std::uint16_t i = 0; i < count; ++i) {
            const std::size_t entry = static_cast<std::size_t>(offset) + 2 + static_cast<std::size_t>(i) * 12;
            std::uint16_t tag = 0;
            std::uint16_t type = 0;
            std::uint32_t value_count = 0;
            if (!read_u16(entry, tag) || !read_u16(entry + 2, type) || !read_u32(entry + 4, value_count)) {
                return false;
            }
            if (visit(tag, type, value_count, entry + 8)) {
                return true;
            }
        }
        return true;
    }

    std::optional<std::string> read_ascii(std::uint16_t type, std::uint32_t count, std::size_t value_field) const
    {
        if (type != kTypeAscii || count == 0) {
            return std::nullopt;
        }
        std::size_t start = value_field;
        if (count > 4) {
            std::uint32_t offset = 0;
            if (!read_u32(value_field, offset)) {
                return std::nullopt;
            }
            start = offset;
        }
        if (start > size || count > size - start) {
            return std::nullopt;
        }
        std::string value(reinterpret_cast<const char*>(data + start), count);
        const auto nul = value.find('\0');
        if (nul != std::string::npos) {
            value.resize(nul);
        }
        return value;
    }

    bool read_u16(std::size_t offset, std::uint16_t& out) const
    {
        if (offset > size || size - offset < 2) {
            return false;
        }
        const unsigned char* p = data + offset;
        out = little_endian
            ? static_cast<std::uint16_t>(p[0] | (p[1] << 8))
            : static_cast<std::uint16_t>((p[0] << 8) | p[1]);
        return true;
    }

    bool read_u32(std::size_t offset, std::uint32_t& out) const
    {
        if (offset > size || size - offset < 4) {
            return false;
        }
        const unsigned char* p = data + offset;
        if (little_endian) {
            out = static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8)
                | (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
        } else {
            out = (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16)
                | (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
        }
        return true;
    }

private:
    const unsigned char* data;
    std::size_t size;
    bool little_endian{true};
};

std::optional<TimePoint> date_from_tiff(const unsigned char* data, std::size_t size)
{
    TiffView tiff(data, size);
    if (!tiff.init()) {
        return std::nullopt;
    }
    const auto ifd0 = tiff.first_ifd_offset();
    if (!ifd0) {
        return std::nullopt;
    }

    std::optional<TimePoint> found;
    std::optional<std::uint32_t> exif_ifd;
    tiff.for_each_entry(*ifd0, [&](std::uint16_t tag, std::uint16_t type, std::uint32_t count, std::size_t value) {
        if (tag == kTagDateTime) {
            if (const auto text = tiff.read_ascii(type, count, value)) {
                found = ExifReader::parse_exif_datetime(*text);
            }
        } else if (tag == kTagExifIfdPointer && type == kTypeLong) {
            std::uint32_t offset = 0;
            if (tiff.read_u32(value, offset)) {
                exif_ifd = offset;
            }
        }
        return found.has_value();
    });
    if (found || !exif_ifd) {
        return found;
    }

    tiff.for_each_entry(*exif_ifd, [&](std::uint16_t tag, std::uint16_t type, std::uint32_t count, std::size_t value) {
        if (tag == kTagDateTimeOriginal || tag == kTagDateTimeDigitized) {
            if (const auto text = tiff.read_ascii(type, count, value)) {
                found = ExifReader::parse_exif_datetime(*text);
            }
        }
        return found.has_value();
    });
    return found;
}

std::optional<TimePoint> date_from_jpeg(const unsigned char* data, std::size_t size)
{
    static constexpr unsigned char kExifHeader[] = {'E', 'x', 'i', 'f', 0, 0};

    std::size_t pos = 2;
    while (pos + 4 <= size) {
        if (data[pos] != 0xFF) {
            return std::nullopt;
        }
        const unsigned char marker = data[pos + 1];
        if (marker == 0xFF) {
            ++pos; // fill byte
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA) {
            return std::nullopt; // end of image or start of scan: no more metadata
        }
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }
        const std::size_t segment_length = (static_cast<std::size_t>(data[pos + 2]) << 8) | data[pos + 3];
        if (segment_length < 2 || pos + 2 + segment_length > size) {
            return std::nullopt;
        }
        const unsigned char* payload = data + pos + 4;
        const std::size_t payload_size = segment_length - 2;
        if (marker == 0xE1 && payload_size > sizeof(kExifHeader)
            && std::memcmp(payload, kExifHeader, sizeof(kExifHeader)) == 0) {
            if (auto date = date_from_tiff(payload + sizeof(kExifHeader), payload_size - sizeof(kExifHeader))) {
                return date;
            }
        }
        pos += 2 + segment_length;
    }
    return std::nullopt;
}

int parse_digits(std::string_view text)
{
    int value = 0;
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return -1;
        }
        value = value * 10 + (ch - '0');
    }
    return value;
}

} // namespace

namespace ExifReader {

bool is_supported_image(const std::filesystem::path& path)
{
    const std::string extension = Utils::to_lower_copy(Utils::path_to_utf8(path.extension()));
    return std::find(kImageExtensions.begin(), kImageExtensions.end(), extension) != kImageExtensions.end();
}

std::optional<TimePoint> parse_exif_datetime(const std::string& value)
{
    // "YYYY:MM:DD HH:MM:SS"
    const std::string_view text(value);
    if (text.size() != 19 || text[4] != ':' || text[7] != ':' || text[10] != ' '
        || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    const int year = parse_digits(text.substr(0, 4));
    const int month = parse_digits(text.substr(5, 2));
    const int day = parse_digits(text.substr(8, 2));
    const int hour = parse_digits(text.substr(11, 2));
    const int minute = parse_digits(text.substr(14, 2));
    const int second = parse_digits(text.substr(17, 2));
    if (year < 0 || month < 0 || day < 0 || hour < 0 || minute < 0 || second < 0) {
        return std::nullopt;
    }
    return Utils::make_local_time(year, month, day, hour, minute, second);
}

std::optional<TimePoint> read_capture_date(const std::filesystem::path& path)
{
    if (!is_supported_image(path)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::vector<char> buffer(kScanBytes);
    std::size_t bytes_read = 0;
    if (!read_file_prefix(file, buffer, bytes_read) || bytes_read < 8) {
        return std::nullopt;
    }
    const auto* data = reinterpret_cast<const unsigned char*>(buffer.data());

    if (data[0] == 0xFF && data[1] == 0xD8) {
        return date_from_jpeg(data, bytes_read);
    }
    return date_from_tiff(data, bytes_read);
}

} // namespace ExifReader
