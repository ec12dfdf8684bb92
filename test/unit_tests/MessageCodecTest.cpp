#include "MessageReader.hpp"
#include "MessageWriter.hpp"
#include "TestHeaders.hpp"

using namespace ng;
using Catch::Matchers::ContainsSubstring;

namespace {
string packRaw(std::function<void(msgpack::packer<msgpack::sbuffer>&)> fn) {
  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> packer(buffer);
  fn(packer);
  return string(buffer.data(), buffer.size());
}
}  // namespace

TEST_CASE("Nested values survive the msgpack round trip", "[MessageCodec]") {
  json value = {
      {"nil", nullptr},
      {"flags", {true, false}},
      {"numbers", {0, 1, -1, 127, -129, 65536, -2147483649LL, 1.5, -0.25}},
      {"big", std::numeric_limits<uint64_t>::max()},
      {"text", "h\xC3\xA9llo"},
      {"nested", {{"list", json::array({json::object(), json::array()})},
                  {"map", {{"k", {{"deeper", "yes"}}}}}}},
  };
  MessageWriter writer;
  writer.writeValue(value);
  MessageReader reader;
  reader.feed(writer.finish());
  REQUIRE(reader.readValue() == value);
}

TEST_CASE("Frames decode with their fields", "[MessageCodec]") {
  MessageWriter writer;
  writer.writeRequest(7, "nvim_exec_lua", json::array({"return 1", {}}));
  writer.writeResponse(7, nullptr, json{{"ok", true}});
  writer.writeResponse(8, json::array({0, "boom"}), nullptr);
  writer.writeNotification("NVIM_MCP_DiagnosticsChanged",
                           json::array({{{"buf", 3}}}));
  MessageReader reader;
  reader.feed(writer.finish());

  RpcMessage message;
  REQUIRE(reader.next(&message));
  REQUIRE(message.type == RPC_REQUEST);
  REQUIRE(message.msgid == 7);
  REQUIRE(message.method == "nvim_exec_lua");
  REQUIRE(message.params[0] == "return 1");

  REQUIRE(reader.next(&message));
  REQUIRE(message.type == RPC_RESPONSE);
  REQUIRE(message.msgid == 7);
  REQUIRE(message.error.is_null());
  REQUIRE(message.result == json{{"ok", true}});

  REQUIRE(reader.next(&message));
  REQUIRE(message.msgid == 8);
  REQUIRE(message.error == json::array({0, "boom"}));

  REQUIRE(reader.next(&message));
  REQUIRE(message.type == RPC_NOTIFICATION);
  REQUIRE(message.method == "NVIM_MCP_DiagnosticsChanged");
  REQUIRE(message.params[0]["buf"] == 3);

  REQUIRE_FALSE(reader.next(&message));
}

TEST_CASE("Frames split across reads are reassembled", "[MessageCodec]") {
  MessageWriter writer;
  writer.writeResponse(42, nullptr, json{{"payload", string(1000, 'x')}});
  string bytes = writer.finish();

  MessageReader reader;
  RpcMessage message;
  for (size_t i = 0; i + 1 < bytes.size(); ++i) {
    reader.feed(&bytes[i], 1);
    REQUIRE_FALSE(reader.next(&message));
  }
  reader.feed(&bytes[bytes.size() - 1], 1);
  REQUIRE(reader.next(&message));
  REQUIRE(message.msgid == 42);
  REQUIRE(message.result["payload"].get<string>().size() == 1000);
}

TEST_CASE("Values without a JSON form are rejected by name",
          "[MessageCodec]") {
  SECTION("Binary") {
    MessageReader reader;
    reader.feed(packRaw([](msgpack::packer<msgpack::sbuffer>& packer) {
      packer.pack_bin(3);
      packer.pack_bin_body("abc", 3);
    }));
    REQUIRE_THROWS_WITH(reader.readValue(),
                        ContainsSubstring("Binary values not supported"));
  }

  SECTION("Extension") {
    MessageReader reader;
    reader.feed(packRaw([](msgpack::packer<msgpack::sbuffer>& packer) {
      packer.pack_array(1);
      packer.pack_ext(1, 0);
      packer.pack_ext_body("\x01", 1);
    }));
    REQUIRE_THROWS_WITH(reader.readValue(),
                        ContainsSubstring("Extension values not supported"));
  }

  SECTION("Integer map key") {
    MessageReader reader;
    reader.feed(packRaw([](msgpack::packer<msgpack::sbuffer>& packer) {
      packer.pack_map(1);
      packer.pack(1);
      packer.pack(string("one"));
    }));
    REQUIRE(gatewayErrorKind([&] { reader.readValue(); }) ==
            ErrorKind::API_ERROR);
  }

  SECTION("String that is not UTF-8") {
    MessageReader reader;
    reader.feed(packRaw([](msgpack::packer<msgpack::sbuffer>& packer) {
      packer.pack_array(1);
      packer.pack_str(9);
      packer.pack_str_body("bad\xff name", 9);
    }));
    REQUIRE_THROWS_WITH(reader.readValue(),
                        ContainsSubstring("Invalid UTF-8 string"));
  }

  SECTION("Map key that is not UTF-8") {
    MessageReader reader;
    reader.feed(packRaw([](msgpack::packer<msgpack::sbuffer>& packer) {
      packer.pack_map(1);
      packer.pack_str(2);
      packer.pack_str_body("\xc0\xaf", 2);
      packer.pack(1);
    }));
    REQUIRE(gatewayErrorKind([&] { reader.readValue(); }) ==
            ErrorKind::API_ERROR);
  }
}

TEST_CASE("UTF-8 validation", "[MessageCodec]") {
  auto valid = [](const string& s) { return isValidUtf8(s.data(), s.size()); };
  REQUIRE(valid(""));
  REQUIRE(valid("plain ascii"));
  REQUIRE(valid("h\xC3\xA9llo"));
  REQUIRE(valid("\xE2\x82\xAC"));
  REQUIRE(valid("\xF0\x9F\x98\x80"));
  REQUIRE_FALSE(valid("\xff"));
  REQUIRE_FALSE(valid("\xC3"));
  REQUIRE_FALSE(valid("\xE2\x82"));
  REQUIRE_FALSE(valid("\xC0\xAF"));
  REQUIRE_FALSE(valid("\xE0\x80\xAF"));
  REQUIRE_FALSE(valid("\xED\xA0\x80"));
  REQUIRE_FALSE(valid("\xF4\x90\x80\x80"));
}

TEST_CASE("A binary result fails only its own frame", "[MessageCodec]") {
  MessageReader reader;
  reader.feed(packRaw([](msgpack::packer<msgpack::sbuffer>& packer) {
    packer.pack_array(4);
    packer.pack(1);
    packer.pack(5);
    packer.pack_nil();
    packer.pack_bin(2);
    packer.pack_bin_body("hi", 2);
  }));
  MessageWriter writer;
  writer.writeResponse(6, nullptr, "fine");
  reader.feed(writer.finish());

  RpcMessage message;
  REQUIRE(reader.next(&message));
  REQUIRE(message.msgid == 5);
  REQUIRE_THAT(message.payloadError,
               ContainsSubstring("Binary values not supported"));
  REQUIRE(reader.next(&message));
  REQUIRE(message.msgid == 6);
  REQUIRE(message.payloadError.empty());
  REQUIRE(message.result == "fine");
}

TEST_CASE("A result that is not UTF-8 fails only its own frame",
          "[MessageCodec]") {
  MessageReader reader;
  reader.feed(packRaw([](msgpack::packer<msgpack::sbuffer>& packer) {
    packer.pack_array(4);
    packer.pack(1);
    packer.pack(9);
    packer.pack_nil();
    packer.pack_str(4);
    packer.pack_str_body("a\xfe\xfe!", 4);
  }));
  MessageWriter writer;
  writer.writeResponse(10, nullptr, "fine");
  reader.feed(writer.finish());

  RpcMessage message;
  REQUIRE(reader.next(&message));
  REQUIRE(message.msgid == 9);
  REQUIRE_THAT(message.payloadError, ContainsSubstring("Invalid UTF-8 string"));
  REQUIRE(reader.next(&message));
  REQUIRE(message.msgid == 10);
  REQUIRE(message.payloadError.empty());
}

TEST_CASE("Malformed frames are protocol errors", "[MessageCodec]") {
  RpcMessage message;

  SECTION("Not an array") {
    MessageReader reader;
    MessageWriter writer;
    writer.writeValue(json{{"type", 1}});
    reader.feed(writer.finish());
    REQUIRE(gatewayErrorKind([&] { reader.next(&message); }) ==
            ErrorKind::PROTOCOL_ERROR);
  }

  SECTION("Unknown type code") {
    MessageReader reader;
    MessageWriter writer;
    writer.writeValue(json::array({5, 1, "x", json::array()}));
    reader.feed(writer.finish());
    REQUIRE(gatewayErrorKind([&] { reader.next(&message); }) ==
            ErrorKind::PROTOCOL_ERROR);
  }

  SECTION("Wrong arity") {
    MessageReader reader;
    MessageWriter writer;
    writer.writeValue(json::array({1, 1, nullptr}));
    reader.feed(writer.finish());
    REQUIRE(gatewayErrorKind([&] { reader.next(&message); }) ==
            ErrorKind::PROTOCOL_ERROR);
  }

  SECTION("Method is not a string") {
    MessageReader reader;
    MessageWriter writer;
    writer.writeValue(json::array({2, 17, json::array()}));
    reader.feed(writer.finish());
    REQUIRE(gatewayErrorKind([&] { reader.next(&message); }) ==
            ErrorKind::PROTOCOL_ERROR);
  }

  SECTION("Invalid msgpack") {
    MessageReader reader;
    reader.feed(string("\xc1", 1));
    REQUIRE(gatewayErrorKind([&] { reader.next(&message); }) ==
            ErrorKind::PROTOCOL_ERROR);
  }
}
