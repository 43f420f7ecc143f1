#include "codec/typed_value.hpp"
#include <iomanip>
#include <sstream>

namespace tbstream {
namespace codec {

//==============================================
// CONSTRUCTION HELPERS
//==============================================

TypedValue TypedValue::bytes(const std::string& value) {
  TypedValue result;
  result.type = TypeCode::BYTES;
  result.data = value;
  return result;
}

TypedValue TypedValue::byte(int8_t value) {
  TypedValue result;
  result.type = TypeCode::BYTE;
  result.integer = value;
  return result;
}

TypedValue TypedValue::boolean(bool value) {
  TypedValue result;
  result.type = TypeCode::BOOL;
  result.integer = value ? 1 : 0;
  return result;
}

TypedValue TypedValue::int32(int32_t value) {
  TypedValue result;
  result.type = TypeCode::INT;
  result.integer = value;
  return result;
}

TypedValue TypedValue::int64(int64_t value) {
  TypedValue result;
  result.type = TypeCode::LONG;
  result.integer = value;
  return result;
}

TypedValue TypedValue::float32(float value) {
  TypedValue result;
  result.type = TypeCode::FLOAT;
  result.real = value;
  return result;
}

TypedValue TypedValue::float64(double value) {
  TypedValue result;
  result.type = TypeCode::DOUBLE;
  result.real = value;
  return result;
}

TypedValue TypedValue::string(const std::string& value) {
  TypedValue result;
  result.type = TypeCode::STRING;
  result.data = value;
  return result;
}

TypedValue TypedValue::vector(std::vector<TypedValue> values) {
  TypedValue result;
  result.type = TypeCode::VECTOR;
  result.items = std::move(values);
  return result;
}

TypedValue TypedValue::list(std::vector<TypedValue> values) {
  TypedValue result;
  result.type = TypeCode::LIST;
  result.items = std::move(values);
  return result;
}

TypedValue TypedValue::map(std::vector<TypedValue> keys_and_values) {
  TypedValue result;
  result.type = TypeCode::MAP;
  result.items = std::move(keys_and_values);
  return result;
}

TypedValue TypedValue::application(uint8_t code, const std::string& raw) {
  TypedValue result;
  result.type = static_cast<TypeCode>(code);
  result.data = raw;
  return result;
}


//==============================================
// RENDERING
//==============================================

std::string TypedValue::to_string() const {
  std::ostringstream out;
  const uint8_t code = static_cast<uint8_t>(type);

  switch (type) {
    case TypeCode::STRING:
      out << std::quoted(data);
      break;
    case TypeCode::BYTES:
      out << "b" << std::quoted(data);
      break;
    case TypeCode::BOOL:
      out << (integer != 0 ? "true" : "false");
      break;
    case TypeCode::BYTE:
    case TypeCode::INT:
    case TypeCode::LONG:
      out << integer;
      break;
    case TypeCode::FLOAT:
    case TypeCode::DOUBLE:
      out << real;
      break;
    case TypeCode::VECTOR:
    case TypeCode::LIST:
      out << "[";
      for (std::size_t i = 0; i < items.size(); ++i) {
        out << (i ? ", " : "") << items[i].to_string();
      }
      out << "]";
      break;
    case TypeCode::MAP:
      out << "{";
      for (std::size_t i = 0; i + 1 < items.size(); i += 2) {
        out << (i ? ", " : "") << items[i].to_string() << ": " << items[i + 1].to_string();
      }
      out << "}";
      break;
    default:
      out << "app" << static_cast<int>(code) << "(" << data.size() << " bytes)";
      break;
  }
  return out.str();
}


//==============================================
// COMPARISON
//==============================================

bool operator==(const TypedValue& lhs, const TypedValue& rhs) {
  if (lhs.type != rhs.type) {
    return false;
  }
  switch (lhs.type) {
    case TypeCode::BYTE:
    case TypeCode::BOOL:
    case TypeCode::INT:
    case TypeCode::LONG:
      return lhs.integer == rhs.integer;
    case TypeCode::FLOAT:
    case TypeCode::DOUBLE:
      return lhs.real == rhs.real;
    case TypeCode::VECTOR:
    case TypeCode::LIST:
    case TypeCode::MAP:
      return lhs.items == rhs.items;
    default:
      return lhs.data == rhs.data;
  }
}

bool operator!=(const TypedValue& lhs, const TypedValue& rhs) {
  return !(lhs == rhs);
}

bool operator==(const Record& lhs, const Record& rhs) {
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

bool operator!=(const Record& lhs, const Record& rhs) {
  return !(lhs == rhs);
}

} // namespace codec
} // namespace tbstream
