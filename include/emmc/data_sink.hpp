#ifndef EMMC_DATA_SINK_HPP
#define EMMC_DATA_SINK_HPP

#include "emmc/error.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <string>

namespace emmc {

// Destination for page data read off the device
class DataSink {
public:
    virtual ~DataSink() {}
    virtual void write(const uint8_t* data, std::size_t n) = 0;
    virtual void flush() {}
};

class FileDataSink : public DataSink {
    std::string path_;
    std::ofstream out_;
public:
    explicit FileDataSink(const std::string& path)
        : path_(path), out_(path, std::ios::binary | std::ios::out | std::ios::trunc) {
        if (!out_) {
            throw Error(ErrorKind::Transport, "cannot open output file '" + path_ + "'");
        }
    }
    void write(const uint8_t* data, std::size_t n) override {
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
        if (!out_) {
            throw Error(ErrorKind::Transport, "write to '" + path_ + "' failed");
        }
    }
    void flush() override { out_.flush(); }
};

// Classic 16-column hex dump with a running offset and an ASCII sidebar
class HexOstreamDataSink : public DataSink {
    std::ostream& out_;
    std::size_t offset_;
public:
    explicit HexOstreamDataSink(std::ostream& o, std::size_t base_offset = 0)
        : out_(o), offset_(base_offset) {}

    void write(const uint8_t* data, std::size_t n) override {
        constexpr std::size_t kBytesPerLine = 16;
        for (std::size_t line = 0; line < n; line += kBytesPerLine) {
            const std::size_t line_end = std::min(line + kBytesPerLine, n);

            out_ << std::setw(8) << std::setfill('0') << std::hex << std::uppercase
                 << static_cast<unsigned long>(offset_ + line) << ": ";
            for (std::size_t j = line; j < line_end; ++j) {
                if (j == line + 8) out_ << ' ';
                out_ << std::setw(2) << static_cast<unsigned int>(data[j]) << ' ';
            }
            out_ << std::dec << std::nouppercase << std::setfill(' ');

            // keep the sidebar aligned on a short last line
            for (std::size_t j = line_end; j < line + kBytesPerLine; ++j) {
                out_ << "   ";
                if (j == line + 8) out_ << ' ';
            }

            out_ << " |";
            for (std::size_t j = line; j < line_end; ++j) {
                const char c = static_cast<char>(data[j]);
                out_ << ((c >= 32 && c <= 126) ? c : '.');
            }
            out_ << "|\n";
        }
        offset_ += n;
    }
    void flush() override { out_.flush(); }
};

} // namespace emmc

#endif // EMMC_DATA_SINK_HPP
