/**
 * @file zip_writer.hpp
 * @brief Minimal ZIP writer for building test archives
 */

#pragma once

#include <zlib.h>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace YangKeys::test_support {

class ZipWriter {
public:
    enum class Method : uint16_t { Stored = 0, Deflate = 8 };

    struct Options {
        Method method = Method::Deflate;
        bool corrupt_crc = false;   // Store a wrong CRC-32
        bool encrypted = false;     // Set the encryption flag
        uint16_t raw_method = 0;    // Non-zero: write this method id and store the data as-is
        std::string compressed;     // With raw_method: member data produced by another compressor
        uint16_t extra_flags = 0;   // OR-ed into the general purpose flags
    };

    ZipWriter& add(const std::string& name, const std::string& content) {
        return add(name, content, Options());
    }

    ZipWriter& add(const std::string& name, const std::string& content, const Options& options) {
        Member m;
        m.name = name;
        m.usize = static_cast<uint32_t>(content.size());
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
        m.crc = static_cast<uint32_t>(crc) ^ (options.corrupt_crc ? 0xDEADBEEFu : 0u);
        m.flags = static_cast<uint16_t>((options.encrypted ? 0x0001 : 0x0000) | options.extra_flags);
        m.external_attrs = 0100644u << 16;

        if (options.raw_method != 0) {
            m.method = options.raw_method;
            m.data = options.compressed.empty() ? content : options.compressed;
        } else if (options.method == Method::Deflate) {
            m.method = 8;
            m.data = deflate_raw(content);
        } else {
            m.method = 0;
            m.data = content;
        }
        members_.push_back(std::move(m));
        return *this;
    }

    ZipWriter& add_directory(const std::string& name) {
        Member m;
        m.name = name;
        m.crc = 0;
        m.external_attrs = (040755u << 16) | 0x10;
        members_.push_back(std::move(m));
        return *this;
    }

    ZipWriter& comment(const std::string& text) { comment_ = text; return *this; }

    std::string bytes() const {
        std::string out;
        std::string central;

        for (const auto& m : members_) {
            uint32_t offset = static_cast<uint32_t>(out.size());

            put32(out, 0x04034b50);
            put16(out, 20);
            put16(out, m.flags);
            put16(out, m.method);
            put16(out, 0);            // time
            put16(out, 0x21);         // date
            put32(out, m.crc);
            put32(out, static_cast<uint32_t>(m.data.size()));
            put32(out, m.usize);
            put16(out, static_cast<uint16_t>(m.name.size()));
            put16(out, 0);
            out += m.name;
            out += m.data;

            put32(central, 0x02014b50);
            put16(central, 0x031E);   // made by: unix, 3.0
            put16(central, 20);
            put16(central, m.flags);
            put16(central, m.method);
            put16(central, 0);
            put16(central, 0x21);
            put32(central, m.crc);
            put32(central, static_cast<uint32_t>(m.data.size()));
            put32(central, m.usize);
            put16(central, static_cast<uint16_t>(m.name.size()));
            put16(central, 0);        // extra
            put16(central, 0);        // comment
            put16(central, 0);        // disk
            put16(central, 0);        // internal attrs
            put32(central, m.external_attrs);
            put32(central, offset);
            central += m.name;
        }

        uint32_t cd_offset = static_cast<uint32_t>(out.size());
        out += central;

        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<uint16_t>(members_.size()));
        put16(out, static_cast<uint16_t>(members_.size()));
        put32(out, static_cast<uint32_t>(central.size()));
        put32(out, cd_offset);
        put16(out, static_cast<uint16_t>(comment_.size()));
        out += comment_;
        return out;
    }

    void write(const std::filesystem::path& path) const {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("Could not create test archive " + path.string());
        std::string data = bytes();
        f.write(data.data(), static_cast<std::streamsize>(data.size()));
    }

private:
    struct Member {
        std::string name;
        std::string data;
        uint32_t usize = 0;
        uint32_t crc = 0;
        uint16_t method = 0;
        uint16_t flags = 0;
        uint32_t external_attrs = 0;
    };

    static void put16(std::string& out, uint16_t v) {
        out.push_back(static_cast<char>(v & 0xFF));
        out.push_back(static_cast<char>((v >> 8) & 0xFF));
    }

    static void put32(std::string& out, uint32_t v) {
        put16(out, static_cast<uint16_t>(v & 0xFFFF));
        put16(out, static_cast<uint16_t>(v >> 16));
    }

    static std::string deflate_raw(const std::string& input) {
        z_stream stream;
        std::memset(&stream, 0, sizeof(stream));
        if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }

        std::string out(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
        stream.avail_in = static_cast<uInt>(input.size());
        stream.next_out = reinterpret_cast<Bytef*>(&out[0]);
        stream.avail_out = static_cast<uInt>(out.size());

        int ret = deflate(&stream, Z_FINISH);
        if (ret != Z_STREAM_END) {
            deflateEnd(&stream);
            throw std::runtime_error("deflate failed");
        }
        out.resize(stream.total_out);
        deflateEnd(&stream);
        return out;
    }

    std::vector<Member> members_;
    std::string comment_;
};

} // namespace YangKeys::test_support
