#include "taskq/task/codec.hpp"

#include "gtest/gtest.h"

using namespace taskq;

namespace demo {

struct Payload {
  std::string name;
  int count{0};
};

void to_json(nlohmann::json& j, const Payload& p) {
  j = nlohmann::json{{"name", p.name}, {"count", p.count}};
}

void from_json(const nlohmann::json& j, Payload& p) {
  j.at("name").get_to(p.name);
  j.at("count").get_to(p.count);
}

}  // namespace demo

TEST(CodecTest, EncodeJson_ProducesCompactText) {
  auto bytes = encode_json(json{{"a", 1}});

  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(to_string(*bytes), R"({"a":1})");
}

TEST(CodecTest, EncodeJson_InvalidUtf8_IsSerializationFailed) {
  json j = std::string("\xff\xfe");

  auto bytes = encode_json(j);

  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error(), Error::SerializationFailed);
}

TEST(CodecTest, DecodeJson_Malformed_IsSerializationFailed) {
  auto j = decode_json(to_bytes("{not json"));

  ASSERT_FALSE(j.has_value());
  EXPECT_EQ(j.error(), Error::SerializationFailed);
}

TEST(CodecTest, TypedPayload) {
  auto bytes = encode_payload(demo::Payload{"widget", 3});
  ASSERT_TRUE(bytes.has_value());

  auto decoded = decode_payload<demo::Payload>(*bytes);

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->name, "widget");
  EXPECT_EQ(decoded->count, 3);
}

TEST(CodecTest, TypedPayload_MissingField_IsSerializationFailed) {
  auto decoded = decode_payload<demo::Payload>(to_bytes(R"({"name":"x"})"));

  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error(), Error::SerializationFailed);
}
