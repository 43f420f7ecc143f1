#ifndef TBSTREAM_CODEC_TYPED_BYTES_CODEC_HPP
#define TBSTREAM_CODEC_TYPED_BYTES_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <boost/endian/conversion.hpp>
#include "codec/typed_value.hpp"
#include "codec/codec_error.hpp"

namespace tbstream {
namespace codec {

class TypedBytesCodec {
public:
  // ---- RECORD ENCODING AND DECODING ----
  // Writes key then value, returns the number of bytes written
  std::size_t encode(const Record& record, std::ostream& output);
  // Reads the next record. Returns false at a clean end of stream,
  // throws DecodeError when the stream ends inside a record.
  bool decode(std::istream& input, Record& record);


  // ---- VALUE ENCODING AND DECODING ----
  std::size_t encode_value(const TypedValue& value, std::ostream& output);
  TypedValue decode_value(std::istream& input);

  // Deepest container nesting accepted by the decoder
  static constexpr std::size_t MAX_NESTING_DEPTH = 512;
  // Length prefixed payloads are read in pieces of this size
  static constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

private:
  // ---- VALUE SUPPORT ----
  TypedValue decode_value(std::istream& input, std::size_t depth);
  // Decodes the payload following an already consumed type code
  TypedValue decode_payload(uint8_t code, std::istream& input, std::size_t depth);
  std::size_t write_length_prefixed(const std::string& data, std::ostream& output);
  std::string read_length_prefixed(std::istream& input);
  int32_t read_length(std::istream& input);


  // ---- STREAM OPERATIONS ----
  void write_bytes(std::ostream& output, const void* data, std::size_t size);
  void read_bytes(std::istream& input, void* data, std::size_t size);
  void write_code(std::ostream& output, uint8_t code);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  template <typename T>
  static T to_network_order(T host_value) {
    return boost::endian::native_to_big(host_value);
  }
  template <typename T>
  static T from_network_order(T network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace codec
} // namespace tbstream

#endif // TBSTREAM_CODEC_TYPED_BYTES_CODEC_HPP
