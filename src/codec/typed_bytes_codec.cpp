#include "codec/typed_bytes_codec.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>
#include <limits>
#include <string>

namespace tbstream {
namespace codec {

//==============================================
// RECORD ENCODING AND DECODING
//==============================================

std::size_t TypedBytesCodec::encode(const Record& record, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw EncodeError("invalid output stream");
  }

  std::size_t total_bytes = encode_value(record.key, output);
  total_bytes += encode_value(record.value, output);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Encoded record of " << total_bytes << " bytes";
  return total_bytes;
}

bool TypedBytesCodec::decode(std::istream& input, Record& record) {
  // Blocks until a byte or end of stream is available
  if (input.peek() == std::char_traits<char>::eof()) {
    if (input.bad()) {
      throw DecodeError("input stream failed");
    }
    BOOST_LOG_TRIVIAL(trace) << "Codec: End of stream";
    return false;
  }

  record.key = decode_value(input, 0);
  record.value = decode_value(input, 0);
  return true;
}


//==============================================
// VALUE ENCODING AND DECODING
//==============================================

std::size_t TypedBytesCodec::encode_value(const TypedValue& value, std::ostream& output) {
  const uint8_t code = static_cast<uint8_t>(value.type);
  write_code(output, code);
  std::size_t total_bytes = 1;

  switch (value.type) {
    case TypeCode::BYTES:
    case TypeCode::STRING:
      total_bytes += write_length_prefixed(value.data, output);
      break;
    case TypeCode::BYTE:
    case TypeCode::BOOL: {
      uint8_t byte = static_cast<uint8_t>(value.integer);
      write_bytes(output, &byte, sizeof(byte));
      total_bytes += sizeof(byte);
      break;
    }
    case TypeCode::INT: {
      int32_t network_value = to_network_order(static_cast<int32_t>(value.integer));
      write_bytes(output, &network_value, sizeof(network_value));
      total_bytes += sizeof(network_value);
      break;
    }
    case TypeCode::LONG: {
      int64_t network_value = to_network_order(value.integer);
      write_bytes(output, &network_value, sizeof(network_value));
      total_bytes += sizeof(network_value);
      break;
    }
    case TypeCode::FLOAT: {
      float host_value = static_cast<float>(value.real);
      uint32_t bits;
      std::memcpy(&bits, &host_value, sizeof(bits));
      bits = to_network_order(bits);
      write_bytes(output, &bits, sizeof(bits));
      total_bytes += sizeof(bits);
      break;
    }
    case TypeCode::DOUBLE: {
      uint64_t bits;
      std::memcpy(&bits, &value.real, sizeof(bits));
      bits = to_network_order(bits);
      write_bytes(output, &bits, sizeof(bits));
      total_bytes += sizeof(bits);
      break;
    }
    case TypeCode::VECTOR:
    case TypeCode::MAP: {
      std::size_t count = value.items.size();
      if (value.type == TypeCode::MAP) {
        if (count % 2 != 0) {
          throw EncodeError("map needs an even number of items");
        }
        count /= 2;
      }
      if (count > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        throw EncodeError("too many items");
      }
      int32_t network_count = to_network_order(static_cast<int32_t>(count));
      write_bytes(output, &network_count, sizeof(network_count));
      total_bytes += sizeof(network_count);
      for (const auto& item : value.items) {
        total_bytes += encode_value(item, output);
      }
      break;
    }
    case TypeCode::LIST:
      for (const auto& item : value.items) {
        total_bytes += encode_value(item, output);
      }
      write_code(output, static_cast<uint8_t>(TypeCode::END_OF_LIST));
      total_bytes += 1;
      break;
    default:
      if (!is_application_code(code)) {
        BOOST_LOG_TRIVIAL(error) << "Codec: Cannot encode type code " << static_cast<int>(code);
        throw EncodeError("unsupported type code " + std::to_string(code));
      }
      total_bytes += write_length_prefixed(value.data, output);
      break;
  }
  return total_bytes;
}

TypedValue TypedBytesCodec::decode_value(std::istream& input) {
  return decode_value(input, 0);
}

TypedValue TypedBytesCodec::decode_value(std::istream& input, std::size_t depth) {
  uint8_t code;
  read_bytes(input, &code, sizeof(code));
  if (code == static_cast<uint8_t>(TypeCode::END_OF_LIST)) {
    throw DecodeError("unexpected end of list marker");
  }
  return decode_payload(code, input, depth);
}


//==============================================
// VALUE SUPPORT
//==============================================

TypedValue TypedBytesCodec::decode_payload(uint8_t code, std::istream& input, std::size_t depth) {
  if (depth > MAX_NESTING_DEPTH) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Values nested deeper than " << MAX_NESTING_DEPTH;
    throw DecodeError("nesting deeper than " + std::to_string(MAX_NESTING_DEPTH));
  }

  TypedValue value;
  value.type = static_cast<TypeCode>(code);

  switch (value.type) {
    case TypeCode::BYTES:
    case TypeCode::STRING:
      value.data = read_length_prefixed(input);
      break;
    case TypeCode::BYTE: {
      int8_t byte;
      read_bytes(input, &byte, sizeof(byte));
      value.integer = byte;
      break;
    }
    case TypeCode::BOOL: {
      uint8_t byte;
      read_bytes(input, &byte, sizeof(byte));
      value.integer = byte != 0 ? 1 : 0;
      break;
    }
    case TypeCode::INT: {
      int32_t network_value;
      read_bytes(input, &network_value, sizeof(network_value));
      value.integer = from_network_order(network_value);
      break;
    }
    case TypeCode::LONG: {
      int64_t network_value;
      read_bytes(input, &network_value, sizeof(network_value));
      value.integer = from_network_order(network_value);
      break;
    }
    case TypeCode::FLOAT: {
      uint32_t bits;
      read_bytes(input, &bits, sizeof(bits));
      bits = from_network_order(bits);
      float host_value;
      std::memcpy(&host_value, &bits, sizeof(host_value));
      value.real = host_value;
      break;
    }
    case TypeCode::DOUBLE: {
      uint64_t bits;
      read_bytes(input, &bits, sizeof(bits));
      bits = from_network_order(bits);
      std::memcpy(&value.real, &bits, sizeof(bits));
      break;
    }
    case TypeCode::VECTOR: {
      int32_t count = read_length(input);
      for (int32_t i = 0; i < count; ++i) {
        value.items.push_back(decode_value(input, depth + 1));
      }
      break;
    }
    case TypeCode::MAP: {
      int32_t count = read_length(input);
      for (int32_t i = 0; i < count; ++i) {
        value.items.push_back(decode_value(input, depth + 1));
        value.items.push_back(decode_value(input, depth + 1));
      }
      break;
    }
    case TypeCode::LIST:
      while (true) {
        uint8_t item_code;
        read_bytes(input, &item_code, sizeof(item_code));
        if (item_code == static_cast<uint8_t>(TypeCode::END_OF_LIST)) {
          break;
        }
        value.items.push_back(decode_payload(item_code, input, depth + 1));
      }
      break;
    default:
      if (!is_application_code(code)) {
        BOOST_LOG_TRIVIAL(error) << "Codec: Unknown type code " << static_cast<int>(code);
        throw DecodeError("unknown type code " + std::to_string(code));
      }
      value.data = read_length_prefixed(input);
      break;
  }
  return value;
}

std::size_t TypedBytesCodec::write_length_prefixed(const std::string& data, std::ostream& output) {
  if (data.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    throw EncodeError("payload too large: " + std::to_string(data.size()) + " bytes");
  }
  int32_t network_length = to_network_order(static_cast<int32_t>(data.size()));
  write_bytes(output, &network_length, sizeof(network_length));
  write_bytes(output, data.data(), data.size());
  return sizeof(network_length) + data.size();
}

std::string TypedBytesCodec::read_length_prefixed(std::istream& input) {
  // Grown as bytes arrive so a corrupt length cannot force a huge allocation
  std::size_t remaining = static_cast<std::size_t>(read_length(input));
  std::string data;
  while (remaining > 0) {
    std::size_t chunk = std::min(remaining, READ_CHUNK_SIZE);
    std::size_t offset = data.size();
    data.resize(offset + chunk);
    read_bytes(input, &data[offset], chunk);
    remaining -= chunk;
  }
  return data;
}

int32_t TypedBytesCodec::read_length(std::istream& input) {
  int32_t network_length;
  read_bytes(input, &network_length, sizeof(network_length));
  int32_t length = from_network_order(network_length);
  if (length < 0) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Negative length " << length;
    throw DecodeError("negative length " + std::to_string(length));
  }
  return length;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void TypedBytesCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw EncodeError("failed to write to output stream");
  }
}

void TypedBytesCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw DecodeError("stream ended inside a record");
  }
}

void TypedBytesCodec::write_code(std::ostream& output, uint8_t code) {
  write_bytes(output, &code, sizeof(code));
}

} // namespace codec
} // namespace tbstream
