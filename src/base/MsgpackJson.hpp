#ifndef __NG_MSGPACK_JSON__
#define __NG_MSGPACK_JSON__

#include "GatewayException.hpp"
#include "Headers.hpp"

namespace ng {
/**
 * @brief Packs a JSON value as msgpack. Every JSON type has a msgpack
 * counterpart, so this never fails.
 */
template <typename Stream>
inline void packJson(msgpack::packer<Stream>& packer, const json& value) {
  switch (value.type()) {
    case json::value_t::null:
    case json::value_t::discarded:
      packer.pack_nil();
      break;
    case json::value_t::boolean:
      if (value.get<bool>()) {
        packer.pack_true();
      } else {
        packer.pack_false();
      }
      break;
    case json::value_t::number_integer:
      packer.pack_int64(value.get<int64_t>());
      break;
    case json::value_t::number_unsigned:
      packer.pack_uint64(value.get<uint64_t>());
      break;
    case json::value_t::number_float:
      packer.pack_double(value.get<double>());
      break;
    case json::value_t::string: {
      const string& s = value.get_ref<const string&>();
      packer.pack_str(uint32_t(s.size()));
      packer.pack_str_body(s.data(), uint32_t(s.size()));
      break;
    }
    case json::value_t::array:
      packer.pack_array(uint32_t(value.size()));
      for (const auto& item : value) {
        packJson(packer, item);
      }
      break;
    case json::value_t::object:
      packer.pack_map(uint32_t(value.size()));
      for (auto it = value.begin(); it != value.end(); ++it) {
        const string& key = it.key();
        packer.pack_str(uint32_t(key.size()));
        packer.pack_str_body(key.data(), uint32_t(key.size()));
        packJson(packer, it.value());
      }
      break;
    case json::value_t::binary:
      throw GatewayException(ErrorKind::API_ERROR,
                             "Binary values not supported");
  }
}

/**
 * @brief True when the bytes are well formed UTF-8: no overlong forms, no
 * surrogates, nothing above U+10FFFF.
 */
inline bool isValidUtf8(const char* data, size_t size) {
  const unsigned char* p = (const unsigned char*)data;
  const unsigned char* end = p + size;
  while (p < end) {
    unsigned char c = *p;
    int extra;
    uint32_t codepoint;
    if (c < 0x80) {
      ++p;
      continue;
    } else if (c >= 0xC2 && c <= 0xDF) {
      extra = 1;
      codepoint = c & 0x1F;
    } else if (c >= 0xE0 && c <= 0xEF) {
      extra = 2;
      codepoint = c & 0x0F;
    } else if (c >= 0xF0 && c <= 0xF4) {
      extra = 3;
      codepoint = c & 0x07;
    } else {
      return false;
    }
    if (end - p <= extra) {
      return false;
    }
    for (int i = 1; i <= extra; ++i) {
      if ((p[i] & 0xC0) != 0x80) {
        return false;
      }
      codepoint = (codepoint << 6) | (p[i] & 0x3F);
    }
    if ((extra == 2 && codepoint < 0x800) ||
        (extra == 3 && (codepoint < 0x10000 || codepoint > 0x10FFFF)) ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
      return false;
    }
    p += extra + 1;
  }
  return true;
}

/** @throws GatewayException (API_ERROR) unless the string is valid UTF-8. */
inline string msgpackString(const msgpack::object& o) {
  if (!isValidUtf8(o.via.str.ptr, o.via.str.size)) {
    throw GatewayException(ErrorKind::API_ERROR, "Invalid UTF-8 string");
  }
  return string(o.via.str.ptr, o.via.str.size);
}

/**
 * @brief Converts a decoded msgpack object to JSON.
 * @throws GatewayException (API_ERROR) for binary and extension values, for
 * map keys that are not strings and for strings that are not UTF-8.
 */
inline json msgpackToJson(const msgpack::object& o) {
  switch (o.type) {
    case msgpack::type::NIL:
      return json(nullptr);
    case msgpack::type::BOOLEAN:
      return json(o.via.boolean);
    case msgpack::type::POSITIVE_INTEGER:
      return json(uint64_t(o.via.u64));
    case msgpack::type::NEGATIVE_INTEGER:
      return json(int64_t(o.via.i64));
    case msgpack::type::FLOAT32:
    case msgpack::type::FLOAT64:
      return json(o.via.f64);
    case msgpack::type::STR:
      return json(msgpackString(o));
    case msgpack::type::ARRAY: {
      json array = json::array();
      for (uint32_t i = 0; i < o.via.array.size; ++i) {
        array.push_back(msgpackToJson(o.via.array.ptr[i]));
      }
      return array;
    }
    case msgpack::type::MAP: {
      json object = json::object();
      for (uint32_t i = 0; i < o.via.map.size; ++i) {
        const msgpack::object_kv& kv = o.via.map.ptr[i];
        if (kv.key.type != msgpack::type::STR) {
          throw GatewayException(ErrorKind::API_ERROR,
                                 "Map keys must be strings");
        }
        object[msgpackString(kv.key)] =
            msgpackToJson(kv.val);
      }
      return object;
    }
    case msgpack::type::BIN:
      throw GatewayException(ErrorKind::API_ERROR,
                             "Binary values not supported");
    case msgpack::type::EXT:
      throw GatewayException(ErrorKind::API_ERROR,
                             "Extension values not supported");
  }
  throw GatewayException(ErrorKind::API_ERROR, "Unknown msgpack value type");
}
}  // namespace ng

#endif  // __NG_MSGPACK_JSON__
