//
// Created by Giuseppe Francione on 04/02/26.
//

#include "../../include/exif_reader.hpp"
#include "../../include/errors.hpp"
#include <cstdint>
#include <cstdio>
#include <set>
#include <string>
#include <unordered_map>

namespace unmeta::exif {

namespace {

    constexpr uint16_t kExifIfdPointer = 0x8769;
    constexpr uint16_t kGpsIfdPointer  = 0x8825;
    constexpr uint16_t kMaxEntries     = 1024;
    constexpr const char* kInvalid     = "invalid";

    enum Type : uint16_t {
        Byte = 1, Ascii = 2, Short = 3, Long = 4, Rational = 5,
        SByte = 6, Undefined = 7, SShort = 8, SLong = 9, SRational = 10
    };

    const std::unordered_map<uint16_t, const char*> kMainTags = {
        {0x010E, "ImageDescription"}, {0x010F, "Make"}, {0x0110, "Model"},
        {0x0112, "Orientation"}, {0x011A, "XResolution"}, {0x011B, "YResolution"},
        {0x0128, "ResolutionUnit"}, {0x0131, "Software"}, {0x0132, "DateTime"},
        {0x013B, "Artist"}, {0x013C, "HostComputer"}, {0x0213, "YCbCrPositioning"},
        {0x8298, "Copyright"},
    };

    const std::unordered_map<uint16_t, const char*> kExifTags = {
        {0x829A, "ExposureTime"}, {0x829D, "FNumber"}, {0x8822, "ExposureProgram"},
        {0x8827, "ISOSpeedRatings"}, {0x9000, "ExifVersion"}, {0x9003, "DateTimeOriginal"},
        {0x9004, "DateTimeDigitized"}, {0x9010, "OffsetTime"}, {0x9201, "ShutterSpeedValue"},
        {0x9202, "ApertureValue"}, {0x9209, "Flash"}, {0x920A, "FocalLength"},
        {0x927C, "MakerNote"}, {0x9286, "UserComment"}, {0xA001, "ColorSpace"},
        {0xA002, "PixelXDimension"}, {0xA003, "PixelYDimension"}, {0xA420, "ImageUniqueID"},
        {0xA430, "CameraOwnerName"}, {0xA431, "BodySerialNumber"}, {0xA433, "LensMake"},
        {0xA434, "LensModel"}, {0xA435, "LensSerialNumber"},
    };

    const std::unordered_map<uint16_t, const char*> kGpsTags = {
        {0x0000, "GPSVersionID"}, {0x0001, "GPSLatitudeRef"}, {0x0002, "GPSLatitude"},
        {0x0003, "GPSLongitudeRef"}, {0x0004, "GPSLongitude"}, {0x0005, "GPSAltitudeRef"},
        {0x0006, "GPSAltitude"}, {0x0007, "GPSTimeStamp"}, {0x0012, "GPSMapDatum"},
        {0x001D, "GPSDateStamp"},
    };

    size_t type_size(const uint16_t type) {
        switch (type) {
            case Byte: case Ascii: case SByte: case Undefined: return 1;
            case Short: case SShort: return 2;
            case Long: case SLong: return 4;
            case Rational: case SRational: return 8;
            default: return 0;
        }
    }

    class TiffReader {
    public:
        explicit TiffReader(const std::span<const unsigned char> data) : data_(data) {
            if (data_.size() < 8) {
                throw CleaningError("EXIF block too short");
            }
            if (data_[0] == 'I' && data_[1] == 'I') {
                little_endian_ = true;
            } else if (data_[0] == 'M' && data_[1] == 'M') {
                little_endian_ = false;
            } else {
                throw CleaningError("Invalid TIFF byte order mark");
            }
            if (u16(2) != 42) {
                throw CleaningError("Invalid TIFF magic number");
            }
        }

        [[nodiscard]] uint32_t first_ifd() const { return u32(4); }

        MetaMap read_ifd(const uint32_t offset,
                         const std::unordered_map<uint16_t, const char*>& names,
                         const bool follow_pointers) {
            if (!visited_.insert(offset).second) {
                throw CleaningError("EXIF IFD loop at offset " + std::to_string(offset));
            }
            check(offset, 2);
            const uint16_t count = u16(offset);
            if (count > kMaxEntries) {
                throw CleaningError("Implausible EXIF entry count: " + std::to_string(count));
            }
            check(offset + 2, static_cast<size_t>(count) * 12);

            MetaMap meta;
            for (uint16_t i = 0; i < count; ++i) {
                const uint32_t entry = offset + 2 + i * 12u;
                const uint16_t tag = u16(entry);
                const uint16_t type = u16(entry + 2);
                const uint32_t n = u32(entry + 4);

                if (follow_pointers && (tag == kExifIfdPointer || tag == kGpsIfdPointer)) {
                    const bool is_exif = tag == kExifIfdPointer;
                    const uint32_t sub = u32(entry + 8);
                    if (!in_bounds(sub, 2) || !in_bounds(sub + 2, static_cast<size_t>(u16(sub)) * 12)) {
                        add_meta(meta, is_exif ? "Exif" : "GPS", kInvalid);
                        continue;
                    }
                    add_meta(meta, is_exif ? "Exif" : "GPS",
                             read_ifd(sub, is_exif ? kExifTags : kGpsTags, false));
                    continue;
                }

                const size_t unit = type_size(type);
                if (unit == 0) {
                    continue; // unknown type, cannot be sized
                }
                // a broken value (often a MakerNote offset) costs one tag, not the block
                const size_t total = unit * n;
                const uint32_t value_offset = total <= 4 ? entry + 8 : u32(entry + 8);
                if (n > data_.size() || !in_bounds(value_offset, total)) {
                    add_meta(meta, tag_name(tag, names), kInvalid);
                    continue;
                }

                add_meta(meta, tag_name(tag, names), format_value(type, n, value_offset));
            }
            return meta;
        }

    private:
        [[nodiscard]] std::string tag_name(const uint16_t tag,
                                           const std::unordered_map<uint16_t, const char*>& names) const {
            if (const auto it = names.find(tag); it != names.end()) {
                return it->second;
            }
            char buf[16];
            std::snprintf(buf, sizeof(buf), "Tag 0x%04X", tag);
            return buf;
        }

        [[nodiscard]] std::string format_value(const uint16_t type, const uint32_t n, const uint32_t offset) const {
            if (type == Ascii) {
                std::string s(reinterpret_cast<const char*>(&data_[offset]), n);
                while (!s.empty() && s.back() == '\0') s.pop_back();
                return s;
            }
            if (type == Byte || type == Undefined || type == SByte) {
                const auto* p = &data_[offset];
                bool printable = true;
                for (uint32_t i = 0; i < n; ++i) {
                    if (p[i] != 0 && (p[i] < 0x20 || p[i] > 0x7E)) { printable = false; break; }
                }
                if (printable && n > 0 && n <= 64) {
                    std::string s(reinterpret_cast<const char*>(p), n);
                    while (!s.empty() && s.back() == '\0') s.pop_back();
                    if (!s.empty() && s.find('\0') == std::string::npos) return s;
                }
                return std::to_string(n) + " bytes";
            }

            std::string out;
            const uint32_t shown = n > 32 ? 32 : n;
            for (uint32_t i = 0; i < shown; ++i) {
                if (!out.empty()) out += ' ';
                switch (type) {
                    case Short:     out += std::to_string(u16(offset + i * 2)); break;
                    case SShort:    out += std::to_string(static_cast<int16_t>(u16(offset + i * 2))); break;
                    case Long:      out += std::to_string(u32(offset + i * 4)); break;
                    case SLong:     out += std::to_string(static_cast<int32_t>(u32(offset + i * 4))); break;
                    case Rational:
                        out += std::to_string(u32(offset + i * 8)) + "/" + std::to_string(u32(offset + i * 8 + 4));
                        break;
                    case SRational:
                        out += std::to_string(static_cast<int32_t>(u32(offset + i * 8))) + "/" +
                               std::to_string(static_cast<int32_t>(u32(offset + i * 8 + 4)));
                        break;
                    default: break;
                }
            }
            if (shown < n) out += " ...";
            return out;
        }

        [[nodiscard]] bool in_bounds(const size_t offset, const size_t len) const {
            return offset <= data_.size() && len <= data_.size() - offset;
        }

        void check(const size_t offset, const size_t len) const {
            if (offset > data_.size() || len > data_.size() - offset) {
                throw CleaningError("EXIF offset " + std::to_string(offset) + " is out of bounds");
            }
        }

        [[nodiscard]] uint16_t u16(const size_t offset) const {
            check(offset, 2);
            const auto* p = &data_[offset];
            return little_endian_ ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                                  : static_cast<uint16_t>((p[0] << 8) | p[1]);
        }

        [[nodiscard]] uint32_t u32(const size_t offset) const {
            check(offset, 4);
            const auto* p = &data_[offset];
            if (little_endian_) {
                return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                       (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
            }
            return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                   (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
        }

        std::span<const unsigned char> data_;
        bool little_endian_ = true;
        std::set<uint32_t> visited_;
    };

} // namespace

MetaMap read_tiff(const std::span<const unsigned char> tiff) {
    TiffReader reader(tiff);
    return reader.read_ifd(reader.first_ifd(), kMainTags, true);
}

bool has_exif_prefix(const std::span<const unsigned char> payload) noexcept {
    static constexpr unsigned char kPrefix[] = {'E', 'x', 'i', 'f', 0, 0};
    if (payload.size() < sizeof(kPrefix)) return false;
    for (size_t i = 0; i < sizeof(kPrefix); ++i) {
        if (payload[i] != kPrefix[i]) return false;
    }
    return true;
}

} // namespace unmeta::exif
