/**
 * @file hdrdelta.cpp
 * @brief Bulk compress() and decompress().
 */

#include <hdrdelta/hdrdelta.hpp>

#include <cstring>

namespace hdrdelta {

std::size_t max_compressed_size(std::size_t header_count) noexcept {
    if (header_count < 2) {
        return 0;
    }
    // The encoder never sends prev_digest
    return (header_count - 1) * (MAX_RECORD_BYTES - DIGEST_SIZE);
}

Error compress(const std::uint8_t* input_data, std::size_t input_size,
               std::uint8_t* output_buffer, std::size_t output_buffer_size,
               std::size_t& output_size, std::size_t* headers_consumed) noexcept {
    output_size = 0;
    if (headers_consumed != nullptr) {
        *headers_consumed = 0;
    }

    if (input_data == nullptr || input_size == 0 || (input_size % HEADER_SIZE) != 0) {
        return Error::MalformedHeader;
    }
    if (output_buffer == nullptr && output_buffer_size != 0) {
        return Error::InvalidArg;
    }

    const std::size_t num_headers = input_size / HEADER_SIZE;

    Header anchor;
    Error status = Header::parse(input_data, HEADER_SIZE, anchor);
    if (status != Error::Ok) {
        return status;
    }

    Compressor comp;
    comp.begin(anchor);
    BufferSink sink(output_buffer, output_buffer_size);

    for (std::size_t i = 1; i < num_headers; ++i) {
        Header header;
        status = Header::parse(&input_data[i * HEADER_SIZE], HEADER_SIZE, header);
        if (status != Error::Ok) {
            return status;
        }

        status = comp.push(header, sink);
        if (status != Error::Ok) {
            return status;
        }
    }

    status = comp.finish(sink);
    if (status != Error::Ok) {
        return status;
    }

    output_size = sink.size();
    if (headers_consumed != nullptr) {
        *headers_consumed = comp.headers_consumed();
    }
    return Error::Ok;
}

Error decompress(const std::uint8_t* anchor_data, std::size_t anchor_size,
                 const std::uint8_t* input_data, std::size_t input_size,
                 std::uint8_t* output_buffer, std::size_t output_buffer_size,
                 std::size_t& output_size, std::size_t* bytes_consumed) noexcept {
    output_size = 0;
    if (bytes_consumed != nullptr) {
        *bytes_consumed = 0;
    }

    Header anchor;
    Error status = Header::parse(anchor_data, anchor_size, anchor);
    if (status != Error::Ok) {
        return status;
    }
    if (output_buffer == nullptr && output_buffer_size != 0) {
        return Error::InvalidArg;
    }

    if (input_size == 0) {
        return Error::Ok;
    }
    if (input_data == nullptr) {
        return Error::InvalidArg;
    }

    Decompressor decomp;
    decomp.begin(anchor);
    ByteReader reader(input_data, input_size);

    std::size_t total_output = 0;

    while (!decomp.sequence_ended()) {
        // Input ran out before the sequence-end record
        if (reader.remaining() == 0) {
            return Error::DecodeError;
        }

        Header header;
        status = decomp.next(reader, header);
        if (status != Error::Ok) {
            return status;
        }

        if (output_buffer_size - total_output < HEADER_SIZE) {
            return Error::Overflow;
        }

        const HeaderBytes bytes = header.serialize();
        std::memcpy(&output_buffer[total_output], bytes.data(), HEADER_SIZE);
        total_output += HEADER_SIZE;
    }

    output_size = total_output;
    if (bytes_consumed != nullptr) {
        *bytes_consumed = reader.position();
    }
    return Error::Ok;
}

} // namespace hdrdelta
