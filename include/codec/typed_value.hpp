#ifndef TBSTREAM_CODEC_TYPED_VALUE_HPP
#define TBSTREAM_CODEC_TYPED_VALUE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace tbstream {
namespace codec {

// Type codes of the typed bytes format
enum class TypeCode : uint8_t {
    BYTES = 0,
    BYTE = 1,
    BOOL = 2,
    INT = 3,
    LONG = 4,
    FLOAT = 5,
    DOUBLE = 6,
    STRING = 7,
    VECTOR = 8,
    LIST = 9,
    MAP = 10,
    END_OF_LIST = 255
};

// Codes 50..200 carry application specific raw bytes
constexpr uint8_t FIRST_APPLICATION_CODE = 50;
constexpr uint8_t LAST_APPLICATION_CODE = 200;

inline bool is_application_code(uint8_t code) {
    return code >= FIRST_APPLICATION_CODE && code <= LAST_APPLICATION_CODE;
}

// One typed value. Which member holds the payload depends on type:
//   BYTES, STRING, application codes -> data
//   BYTE, BOOL, INT, LONG             -> integer
//   FLOAT, DOUBLE                     -> real
//   VECTOR, LIST                      -> items
//   MAP                               -> items as key, value, key, value...
struct TypedValue {
    TypeCode type{TypeCode::BYTES};
    std::string data;
    int64_t integer{0};
    double real{0.0};
    std::vector<TypedValue> items;

    static TypedValue bytes(const std::string& value);
    static TypedValue byte(int8_t value);
    static TypedValue boolean(bool value);
    static TypedValue int32(int32_t value);
    static TypedValue int64(int64_t value);
    static TypedValue float32(float value);
    static TypedValue float64(double value);
    static TypedValue string(const std::string& value);
    static TypedValue vector(std::vector<TypedValue> values);
    static TypedValue list(std::vector<TypedValue> values);
    static TypedValue map(std::vector<TypedValue> keys_and_values);
    static TypedValue application(uint8_t code, const std::string& raw);

    // Readable rendering used by the shell
    std::string to_string() const;
};

bool operator==(const TypedValue& lhs, const TypedValue& rhs);
bool operator!=(const TypedValue& lhs, const TypedValue& rhs);

// Key/value pair exchanged with the streaming tools
struct Record {
    TypedValue key;
    TypedValue value;
};

bool operator==(const Record& lhs, const Record& rhs);
bool operator!=(const Record& lhs, const Record& rhs);

} // namespace codec
} // namespace tbstream

#endif // TBSTREAM_CODEC_TYPED_VALUE_HPP
