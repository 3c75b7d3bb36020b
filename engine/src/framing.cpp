#include "robosave/framing.hpp"

#include <algorithm>
#include <utility>

#include "robosave/protocol.hpp"

namespace robosave::protocol
{

    namespace
    {
        constexpr std::uint8_t kCarriageReturn = '\r';
        constexpr std::uint8_t kLineFeed = '\n';

        bool starts_with_record_marker(std::span<const std::uint8_t> buffer, std::size_t offset)
        {
            if (buffer.size() - offset < kRecordStart.size())
            {
                return false;
            }
            return std::equal(kRecordStart.begin(), kRecordStart.end(), buffer.begin() + static_cast<std::ptrdiff_t>(offset),
                              [](char lhs, std::uint8_t rhs)
                              { return static_cast<std::uint8_t>(lhs) == rhs; });
        }
    } // namespace

    std::optional<DecodedRecord> try_decode_record(std::span<const std::uint8_t> buffer)
    {
        for (std::size_t start = 0; start < buffer.size(); ++start)
        {
            std::size_t marker_at = start;
            if (buffer[start] == kRecordEscape && starts_with_record_marker(buffer, start + 1))
            {
                marker_at = start + 1;
            }
            else if (!starts_with_record_marker(buffer, start))
            {
                continue;
            }

            const auto body_begin = marker_at + kRecordStart.size();
            const auto terminator = std::find_if(buffer.begin() + static_cast<std::ptrdiff_t>(body_begin), buffer.end(),
                                                 [](std::uint8_t byte)
                                                 { return byte == kCarriageReturn || byte == kLineFeed; });
            if (terminator == buffer.end())
            {
                // Every later candidate would run into the same unterminated tail.
                return std::nullopt;
            }
            if (*terminator == kLineFeed)
            {
                continue;
            }

            const auto body_end = static_cast<std::size_t>(terminator - buffer.begin());
            DecodedRecord record;
            record.payload.reserve(body_end - body_begin + kLineEnding.size());
            record.payload.assign(buffer.begin() + static_cast<std::ptrdiff_t>(body_begin), terminator);
            record.payload.insert(record.payload.end(), kLineEnding.begin(), kLineEnding.end());
            record.bytes_consumed = body_end + 1;
            return record;
        }
        return std::nullopt;
    }

    bool contains_end_of_transfer(std::span<const std::uint8_t> buffer)
    {
        return find_marker(buffer, kEndOfTransfer).has_value();
    }

    void RecordStream::append(std::span<const std::uint8_t> chunk)
    {
        buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
    }

    std::optional<std::vector<std::uint8_t>> RecordStream::next_record()
    {
        auto record = try_decode_record(buffer_);
        if (!record)
        {
            return std::nullopt;
        }
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(record->bytes_consumed));
        return std::move(record->payload);
    }

    bool RecordStream::end_of_transfer() const
    {
        return contains_end_of_transfer(buffer_);
    }

    std::size_t RecordStream::discard()
    {
        const auto dropped = buffer_.size();
        buffer_.clear();
        return dropped;
    }

} // namespace robosave::protocol
