/**
 * @file decoder.cpp
 * @brief Recursive JSONB element decoding.
 */

#include <jsonb/bytereader.hpp>
#include <jsonb/decoder.hpp>
#include <jsonb/scalar.hpp>

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace jsonb {

Error Decoder::check_input(const std::uint8_t* data, std::size_t size) noexcept {
    error_offset_ = 0;
    if (size == 0) {
        return Error::EmptyInput;
    }
    if (data == nullptr) {
        return Error::InvalidArg;
    }
    return Error::Ok;
}

Error Decoder::decode(const std::uint8_t* data, std::size_t size, Value& value) {
    Value result;
    std::size_t consumed = 0;
    auto status = decode_one(data, size, result, consumed);
    if (status != Error::Ok) {
        return status;
    }

    if (options_.strict && consumed != size) {
        return fail(Error::TrailingData, consumed);
    }

    value = std::move(result);
    return Error::Ok;
}

Error Decoder::decode_one(const std::uint8_t* data, std::size_t size, Value& value,
                          std::size_t& consumed) {
    auto status = check_input(data, size);
    if (status != Error::Ok) {
        return status;
    }
    return decode_element(data, 0, size, 0, value, consumed);
}

Error Decoder::decode_sequence(const std::uint8_t* data, std::size_t size,
                               std::vector<Value>& values) {
    auto status = check_input(data, size);
    if (status != Error::Ok) {
        return status;
    }

    std::vector<Value> result;
    std::size_t pos = 0;
    while (pos < size) {
        Value element;
        std::size_t used = 0;
        status = decode_element(data, pos, size, 0, element, used);
        if (status != Error::Ok) {
            return status;
        }
        result.push_back(std::move(element));
        pos += used;
    }

    values = std::move(result);
    return Error::Ok;
}

Error Decoder::decode_element(const std::uint8_t* data, std::size_t begin, std::size_t end,
                              std::size_t depth, Value& value, std::size_t& consumed) {
    // Children must fit inside their parent's payload window
    const bool nested = depth > 0;

    ByteReader reader(data + begin, end - begin);
    Header header;
    auto status = read_header(reader, header);
    if (status == Error::TruncatedHeader && nested) {
        status = Error::MalformedComposite;
    }
    if (status != Error::Ok) {
        return fail(status, begin);
    }

    if (header.payload_size > reader.remaining()) {
        return fail(nested ? Error::MalformedComposite : Error::TruncatedPayload, begin);
    }

    const auto payload_size = static_cast<std::size_t>(header.payload_size);
    const std::size_t payload_begin = begin + header.header_size;
    const std::size_t payload_end = payload_begin + payload_size;

    if (is_composite(header.type)) {
        if (depth >= options_.max_depth) {
            return fail(Error::DepthExceeded, begin);
        }
        status = (header.type == Type::Array)
                     ? decode_array(data, payload_begin, payload_end, depth, value)
                     : decode_object(data, payload_begin, payload_end, depth, value);
        if (status != Error::Ok) {
            return status;
        }
    } else {
        status = decode_scalar(header.type, data + payload_begin, payload_size, value);
        if (status != Error::Ok) {
            return fail(status, begin);
        }
    }

    consumed = header.header_size + payload_size;
    return Error::Ok;
}

Error Decoder::decode_scalar(Type type, const std::uint8_t* payload, std::size_t size,
                             Value& value) {
    std::string_view text(reinterpret_cast<const char*>(payload), size);

    switch (type) {
    case Type::Null:
        if (size != 0) {
            return Error::MalformedScalar;
        }
        value = Value::make_null();
        return Error::Ok;

    case Type::True:
    case Type::False:
        if (size != 0) {
            return Error::MalformedScalar;
        }
        value = Value::make_bool(type == Type::True);
        return Error::Ok;

    case Type::Int:
    case Type::Int5: {
        std::int64_t number = 0;
        auto status = (type == Type::Int) ? parse_integer(text, number) : parse_int5(text, number);
        if (status != Error::Ok) {
            return status;
        }
        value = Value::make_int(number);
        return Error::Ok;
    }

    case Type::Float:
    case Type::Float5: {
        double number = 0.0;
        auto status = parse_float(text, number);
        if (status != Error::Ok) {
            return status;
        }
        value = Value::make_float(number);
        return Error::Ok;
    }

    case Type::Text:
    case Type::TextRaw:
        if (!is_valid_utf8(text)) {
            return Error::TextDecodeError;
        }
        value = Value::make_text(std::string(text));
        return Error::Ok;

    case Type::TextJ:
    case Type::Text5:
        return Error::UnsupportedEncoding;

    default:
        return Error::InvalidType;
    }
}

Error Decoder::decode_array(const std::uint8_t* data, std::size_t begin, std::size_t end,
                            std::size_t depth, Value& value) {
    Array elements;
    std::size_t pos = begin;

    while (pos < end) {
        Value element;
        std::size_t used = 0;
        auto status = decode_element(data, pos, end, depth + 1, element, used);
        if (status != Error::Ok) {
            return status;
        }
        elements.push_back(std::move(element));
        pos += used;
    }

    value = Value::make_array(std::move(elements));
    return Error::Ok;
}

Error Decoder::decode_object(const std::uint8_t* data, std::size_t begin, std::size_t end,
                             std::size_t depth, Value& value) {
    Object members;
    // Keys are Text/TextRaw payloads, which are copied verbatim, so their
    // bytes can be compared in place
    std::unordered_set<std::string_view> keys;
    std::size_t pos = begin;

    while (pos < end) {
        const std::size_t key_offset = pos;

        Value key;
        std::size_t used = 0;
        auto status = decode_element(data, pos, end, depth + 1, key, used);
        if (status != Error::Ok) {
            return status;
        }
        if (!key.is_text()) {
            return fail(Error::NonTextKey, key_offset);
        }
        pos += used;

        const std::size_t key_size = key.as_text().size();
        std::string_view key_bytes(reinterpret_cast<const char*>(data) + pos - key_size,
                                   key_size);

        if (pos >= end) {
            return fail(Error::TruncatedObject, key_offset);
        }

        Value member_value;
        status = decode_element(data, pos, end, depth + 1, member_value, used);
        if (status != Error::Ok) {
            return status;
        }
        if (!keys.insert(key_bytes).second) {
            return fail(Error::DuplicateKey, key_offset);
        }
        pos += used;

        members.push_back(Member{std::move(key).as_text(), std::move(member_value)});
    }

    value = Value::make_object(std::move(members));
    return Error::Ok;
}

Error decode(const std::uint8_t* data, std::size_t size, Value& value,
             const DecodeOptions& options) {
    Decoder decoder(options);
    return decoder.decode(data, size, value);
}

Error decode_one(const std::uint8_t* data, std::size_t size, Value& value, std::size_t& consumed,
                 const DecodeOptions& options) {
    Decoder decoder(options);
    return decoder.decode_one(data, size, value, consumed);
}

Error decode_sequence(const std::uint8_t* data, std::size_t size, std::vector<Value>& values,
                      const DecodeOptions& options) {
    Decoder decoder(options);
    return decoder.decode_sequence(data, size, values);
}

#if !JSONB_NO_EXCEPTIONS

Value decode_or_throw(const std::uint8_t* data, std::size_t size, const DecodeOptions& options) {
    Decoder decoder(options);
    Value value;
    auto status = decoder.decode(data, size, value);
    if (status == Error::Ok) {
        return value;
    }

    std::string message = std::string(error_string(status)) + " at offset " +
                          std::to_string(decoder.error_offset());
    switch (status) {
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    case Error::UnsupportedEncoding:
        throw UnsupportedException(message, decoder.error_offset());
    default:
        throw DecodeException(message, status, decoder.error_offset());
    }
}

#endif // !JSONB_NO_EXCEPTIONS

} // namespace jsonb
