#include <gtest/gtest.h>

#include "pensync/obex/obex_codec.h"

using namespace pensync;
using namespace pensync::obex;

TEST(ObexCodecTest, DisconnectPacket) {
  auto packet = PacketBuilder(kOpDisconnect).build();
  EXPECT_EQ(packet, (std::vector<uint8_t>{0x81, 0x00, 0x03}));
}

TEST(ObexCodecTest, ConnectWithTarget) {
  auto packet = PacketBuilder(kOpConnect)
                    .addPrefix({kObexVersion, 0x00, 0x10, 0x00})
                    .addTarget(kFolderBrowsingTarget.data(),
                               kFolderBrowsingTarget.size())
                    .build();

  ASSERT_EQ(packet.size(), 3u + 4u + 3u + 16u);
  EXPECT_EQ(packet[0], kOpConnect);
  EXPECT_EQ(packetLength(packet.data()), packet.size());
  EXPECT_EQ(packet[3], 0x10);
  EXPECT_EQ(packet[7], kHeaderTarget);
  EXPECT_EQ(packet[8], 0x00);
  EXPECT_EQ(packet[9], 19);
  EXPECT_EQ(packet[10], 0xF9);
  EXPECT_EQ(packet[25], 0x09);
}

TEST(ObexCodecTest, NameIsNulTerminatedUtf16) {
  auto packet = PacketBuilder(kOpPutFinal).addName("AB").build();
  std::vector<uint8_t> expected = {0x82, 0x00, 0x0C, kHeaderName, 0x00, 0x09,
                                   0x00, 'A',  0x00, 'B',  0x00, 0x00};
  EXPECT_EQ(packet, expected);
}

TEST(ObexCodecTest, EmptyNameHasNoPayload) {
  auto packet = PacketBuilder(kOpSetPath).addPrefix({0x02, 0x00})
                    .addEmptyName()
                    .build();
  std::vector<uint8_t> expected = {0x85, 0x00, 0x08, 0x02, 0x00,
                                   kHeaderName, 0x00, 0x03};
  EXPECT_EQ(packet, expected);
}

TEST(ObexCodecTest, TypeIsNulTerminatedAscii) {
  auto packet = PacketBuilder(kOpGetFinal).addType("x").build();
  std::vector<uint8_t> expected = {0x83, 0x00, 0x08, kHeaderType,
                                   0x00, 0x05, 'x',  0x00};
  EXPECT_EQ(packet, expected);
}

TEST(ObexCodecTest, FourByteHeaders) {
  auto packet = PacketBuilder(kOpGetFinal)
                    .addConnectionId(0x01020304)
                    .addLength(512)
                    .build();
  std::vector<uint8_t> expected = {0x83, 0x00, 0x0D, kHeaderConnectionId,
                                   0x01, 0x02, 0x03, 0x04,
                                   kHeaderLength, 0x00, 0x00, 0x02, 0x00};
  EXPECT_EQ(packet, expected);
}

TEST(ObexCodecTest, ParseConnectResponse) {
  std::vector<uint8_t> data = {0xA0, 0x00, 0x0C, 0x10, 0x00, 0x04, 0x00,
                               kHeaderConnectionId, 0x00, 0x00, 0x00, 0x07};
  auto response = parseResponse(data.data(), data.size(), true);
  ASSERT_TRUE(response.ok());
  EXPECT_EQ(response->code, kResponseSuccess);
  ASSERT_TRUE(response->connect.has_value());
  EXPECT_EQ(response->connect->version, 0x10);
  EXPECT_EQ(response->connect->max_packet_length, 0x0400);
  const Header* id = response->find(kHeaderConnectionId);
  ASSERT_NE(id, nullptr);
  EXPECT_EQ(id->value, 7u);
  EXPECT_EQ(response->find(kHeaderBody), nullptr);
}

TEST(ObexCodecTest, ParseBodyResponse) {
  std::vector<uint8_t> data = {0x90, 0x00, 0x08, kHeaderBody,
                               0x00, 0x05, 'h',  'i'};
  auto response = parseResponse(data.data(), data.size(), false);
  ASSERT_TRUE(response.ok());
  EXPECT_EQ(response->code, kResponseContinue);
  const Header* body = response->find(kHeaderBody);
  ASSERT_NE(body, nullptr);
  EXPECT_EQ(body->bytes, (std::vector<uint8_t>{'h', 'i'}));
}

TEST(ObexCodecTest, ParseRejectsMalformed) {
  std::vector<uint8_t> short_packet = {0xA0, 0x00};
  EXPECT_FALSE(parseResponse(short_packet.data(), short_packet.size(), false)
                   .ok());

  std::vector<uint8_t> overlong = {0xA0, 0x00, 0x09, 0x00};
  auto result = parseResponse(overlong.data(), overlong.size(), false);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error_code(), EPROTO);

  std::vector<uint8_t> bad_header = {0xA0, 0x00, 0x06, kHeaderBody, 0x00,
                                     0x09};
  EXPECT_FALSE(parseResponse(bad_header.data(), bad_header.size(), false)
                   .ok());

  std::vector<uint8_t> short_connect = {0xA0, 0x00, 0x05, 0x10, 0x00};
  EXPECT_FALSE(parseResponse(short_connect.data(), short_connect.size(), true)
                   .ok());
}

TEST(ObexCodecTest, UnicodeOutsideBmpUsesSurrogates) {
  std::string utf8 = "\xF0\x9F\x96\x8A";  // U+1F58A
  auto encoded = encodeUnicode(utf8);
  std::vector<uint8_t> expected = {0xD8, 0x3D, 0xDD, 0x8A, 0x00, 0x00};
  EXPECT_EQ(encoded, expected);
  EXPECT_EQ(decodeUnicode(encoded), utf8);
}

TEST(ObexCodecTest, UnicodeReplacesInvalidBytes) {
  auto encoded = encodeUnicode("a\xFF" "b\xC3");
  std::vector<uint8_t> expected = {0x00, 'a',  0xFF, 0xFD, 0x00,
                                   'b',  0xFF, 0xFD, 0x00, 0x00};
  EXPECT_EQ(encoded, expected);
}

TEST(ObexCodecTest, DecodeStopsAtNul) {
  std::vector<uint8_t> data = {0x00, 'B', 0x00, 'B', 0x00, 0x00, 0x00, 'X'};
  EXPECT_EQ(decodeUnicode(data), "BB");
}

TEST(ObexCodecTest, ResponseCodeNames) {
  EXPECT_EQ(responseCodeToString(kResponseSuccess), "Success");
  EXPECT_EQ(responseCodeToString(kResponseNotFound), "Not Found");
  EXPECT_EQ(responseCodeToString(0xE0), "0xE0");
}
