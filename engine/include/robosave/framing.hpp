/**
 * robosave - Incremental decoder for the controller's record framing.
 *
 * A record is an optional 0x17 escape byte, the three-byte record-start
 * marker, any run of bytes other than CR/LF, and a terminating CR. The
 * decoded payload is the text after the marker with the CR expanded to CRLF.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace robosave::protocol
{

    struct DecodedRecord
    {
        std::vector<std::uint8_t> payload;
        // Bytes removed from the front of the buffer, including any noise
        // that preceded the record.
        std::size_t bytes_consumed{};
    };

    std::optional<DecodedRecord> try_decode_record(std::span<const std::uint8_t> buffer);

    bool contains_end_of_transfer(std::span<const std::uint8_t> buffer);

    class RecordStream
    {
    public:
        void append(std::span<const std::uint8_t> chunk);

        // Removes and returns the next complete record, if the buffer holds one.
        std::optional<std::vector<std::uint8_t>> next_record();

        bool end_of_transfer() const;

        // Drops whatever is still buffered; returns the number of bytes dropped.
        std::size_t discard();

        std::size_t buffered() const noexcept { return buffer_.size(); }

    private:
        std::vector<std::uint8_t> buffer_;
    };

} // namespace robosave::protocol
