#include "MimeTypes.hpp"
#include "Utils.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace {

struct ExtensionMime {
    std::string_view extension;
    std::string_view mime;
};

// Subset of the system mime.types database covering every type the
// category table below knows about.
constexpr std::array<ExtensionMime, 40> kExtensionMimes = {{
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".dot", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".odt", "application/vnd.oasis.opendocument.text"},
    {".txt", "text/plain"},
    {".text", "text/plain"},
    {".conf", "text/plain"},
    {".def", "text/plain"},
    {".list", "text/plain"},
    {".log", "text/plain"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".jpe", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".svg", "image/svg+xml"},
    {".svgz", "image/svg+xml"},
    {".webp", "image/webp"},
    {".mp4", "video/mp4"},
    {".mp4v", "video/mp4"},
    {".mpg4", "video/mp4"},
    {".mov", "video/quicktime"},
    {".qt", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".webm", "video/webm"},
    {".flv", "video/x-flv"},
    {".mp3", "audio/mpeg"},
    {".mp2", "audio/mpeg"},
    {".mpga", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".flac", "audio/flac"},
    {".aac", "audio/aac"},
    {".oga", "audio/ogg"},
    {".ogg", "audio/ogg"},
    {".spx", "audio/ogg"},
    {".wma", "audio/x-ms-wma"},
}};

struct CategoryMimes {
    std::string_view category;
    std::array<std::string_view, 7> mimes;
};

constexpr std::array<CategoryMimes, 4> kCategoryMimes = {{
    {"Documents", {"application/pdf", "application/msword", "text/plain",
                   "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
                   "application/vnd.oasis.opendocument.text"}},
    {"Images", {"image/jpeg", "image/png", "image/gif", "image/bmp",
                "image/tiff", "image/svg+xml", "image/webp"}},
    {"Videos", {"video/mp4", "video/avi", "video/quicktime", "video/x-msvideo",
                "video/webm", "video/x-flv"}},
    {"Audio", {"audio/mpeg", "audio/wav", "audio/flac", "audio/aac",
               "audio/ogg", "audio/x-ms-wma"}},
}};

struct Signature {
    std::string_view bytes;
    std::string_view category;
};

using namespace std::string_view_literals;

const std::array<Signature, 9> kSignatures = {{
    {"\x89PNG\r\n\x1a\n"sv, "Images"},
    {"\xff\xd8\xff"sv, "Images"},
    {"GIF87a"sv, "Images"},
    {"GIF89a"sv, "Images"},
    {"%PDF"sv, "Documents"},
    {"PK\x03\x04"sv, "Archives"},
    {"Rar!\x1a\x07\x00"sv, "Archives"},
    {"7z\xbc\xaf\x27\x1c"sv, "Archives"},
    {"\x00\x00\x01\x00"sv, "Images"},
}};

constexpr std::size_t kFtypOffset = 4;
constexpr std::string_view kFtypMarker = "ftyp";

} // namespace

namespace MimeTypes {

std::optional<std::string> guess_from_filename(const std::string& file_name)
{
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return std::nullopt;
    }
    const std::string extension = Utils::to_lower_copy(file_name.substr(dot));
    for (const auto& entry : kExtensionMimes) {
        if (entry.extension == extension) {
            return std::string(entry.mime);
        }
    }
    return std::nullopt;
}

std::optional<std::string> category_for_mime(const std::string& mime_type)
{
    for (const auto& entry : kCategoryMimes) {
        for (const auto mime : entry.mimes) {
            if (!mime.empty() && mime == mime_type) {
                return std::string(entry.category);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> category_for_signature(const std::string& header)
{
    const std::string_view view(header);
    for (const auto& signature : kSignatures) {
        if (view.substr(0, signature.bytes.size()) == signature.bytes) {
            return std::string(signature.category);
        }
    }
    if (view.size() >= kFtypOffset + kFtypMarker.size()
        && view.substr(kFtypOffset, kFtypMarker.size()) == kFtypMarker) {
        return std::string("Videos");
    }
    return std::nullopt;
}

} // namespace MimeTypes
