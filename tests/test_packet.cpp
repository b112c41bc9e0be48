#include <gtest/gtest.h>
#include "common/net/packet.h"
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

class PacketTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(PacketTest, DynamicPacket_DefaultConstruct) {
    MCBE::Net::DynamicPacket packet;
    EXPECT_EQ(packet.Length(), 0u);
}

TEST_F(PacketTest, DynamicPacket_FromBytes) {
    MCBE::Net::DynamicPacket packet(std::string("\x01\x02\x03", 3));
    EXPECT_EQ(packet.Length(), 3u);
    EXPECT_EQ(packet.GetUInt8(2), 3u);
    EXPECT_EQ(packet.Bytes(), std::string("\x01\x02\x03", 3));
}

TEST_F(PacketTest, DynamicPacket_WriteGrows) {
    MCBE::Net::DynamicPacket packet;
    packet.PutUInt32(4, 0xDEADBEEF);
    EXPECT_EQ(packet.Length(), 8u);
    EXPECT_EQ(packet.GetUInt32(4), 0xDEADBEEFu);
}

TEST_F(PacketTest, LittleEndian_Layout) {
    MCBE::Net::DynamicPacket packet;
    packet.PutUInt32(0, 0x12345678);
    EXPECT_EQ(packet.GetUInt8(0), 0x78u);
    EXPECT_EQ(packet.GetUInt8(3), 0x12u);
}

TEST_F(PacketTest, Int32BE_Layout) {
    MCBE::Net::DynamicPacket packet;
    packet.PutInt32BE(0, 361);
    EXPECT_EQ(packet.GetUInt8(0), 0x00u);
    EXPECT_EQ(packet.GetUInt8(2), 0x01u);
    EXPECT_EQ(packet.GetUInt8(3), 0x69u);
    EXPECT_EQ(packet.GetInt32BE(0), 361);
}

TEST_F(PacketTest, UInt64_PutGet) {
    MCBE::Net::DynamicPacket packet;
    packet.PutUInt64(0, 0x0102030405060708ULL);
    EXPECT_EQ(packet.GetUInt64(0), 0x0102030405060708ULL);
    EXPECT_EQ(packet.GetUInt8(0), 0x08u);
}

TEST_F(PacketTest, ReadPastEnd_Throws) {
    MCBE::Net::DynamicPacket packet;
    packet.Resize(3);
    EXPECT_THROW(packet.GetUInt32(0), std::out_of_range);
    EXPECT_THROW(packet.GetUInt8(3), std::out_of_range);
    EXPECT_THROW(packet.GetString(1, 5), std::out_of_range);
}

TEST_F(PacketTest, StaticPacket_WritePastCapacityThrows) {
    char buffer[4];
    MCBE::Net::StaticPacket packet(buffer, sizeof(buffer));
    packet.PutUInt32(0, 1);
    EXPECT_THROW(packet.PutUInt8(4, 1), std::out_of_range);
}

// =============================================================================
// Varint Tests
// =============================================================================

TEST_F(PacketTest, VarUInt32_KnownEncoding) {
    MCBE::Net::DynamicPacket packet;
    EXPECT_EQ(packet.PutVarUInt32(0, 300), 2u);
    EXPECT_EQ(packet.GetUInt8(0), 0xACu);
    EXPECT_EQ(packet.GetUInt8(1), 0x02u);

    uint32_t value = 0;
    EXPECT_EQ(packet.GetVarUInt32(0, value), 2u);
    EXPECT_EQ(value, 300u);
}

TEST_F(PacketTest, VarUInt32_MaxIsFiveBytes) {
    MCBE::Net::DynamicPacket packet;
    EXPECT_EQ(packet.PutVarUInt32(0, std::numeric_limits<uint32_t>::max()), 5u);

    uint32_t value = 0;
    packet.GetVarUInt32(0, value);
    EXPECT_EQ(value, std::numeric_limits<uint32_t>::max());
}

TEST_F(PacketTest, VarInt32_ZigZag) {
    MCBE::Net::DynamicPacket packet;
    packet.PutVarInt32(0, -1);
    packet.PutVarInt32(1, 1);
    EXPECT_EQ(packet.GetUInt8(0), 0x01u);
    EXPECT_EQ(packet.GetUInt8(1), 0x02u);

    int32_t value = 0;
    packet.GetVarInt32(0, value);
    EXPECT_EQ(value, -1);
}

TEST_F(PacketTest, VarInt64_Extremes) {
    MCBE::Net::DynamicPacket packet;
    size_t first = packet.PutVarInt64(0, std::numeric_limits<int64_t>::min());
    packet.PutVarInt64(first, std::numeric_limits<int64_t>::max());

    int64_t value = 0;
    size_t read = packet.GetVarInt64(0, value);
    EXPECT_EQ(read, first);
    EXPECT_EQ(value, std::numeric_limits<int64_t>::min());
    packet.GetVarInt64(read, value);
    EXPECT_EQ(value, std::numeric_limits<int64_t>::max());
}

TEST_F(PacketTest, VarUInt32_Unterminated) {
    MCBE::Net::DynamicPacket packet(std::string(6, '\xff'));
    uint32_t value = 0;
    EXPECT_THROW(packet.GetVarUInt32(0, value), std::out_of_range);
}

TEST_F(PacketTest, VarUInt32_TruncatedInput) {
    MCBE::Net::DynamicPacket packet(std::string("\x80\x80", 2));
    uint32_t value = 0;
    EXPECT_THROW(packet.GetVarUInt32(0, value), std::out_of_range);
}

TEST_F(PacketTest, ToString_HexDump) {
    MCBE::Net::DynamicPacket packet(std::string("\xfe\x01\x02", 3));
    EXPECT_EQ(packet.ToString(), "fe 01 02 ");
    EXPECT_EQ(packet.ToString(1), "fe ...");
}

// =============================================================================
// Reader/Writer Tests
// =============================================================================

TEST_F(PacketTest, Writer_AppendsInOrder) {
    MCBE::Net::DynamicPacket packet;
    MCBE::Net::PacketWriter w(packet);
    w.UInt8(0x7f);
    w.Bool(true);
    w.Int16(-2);
    w.UInt32(70000);
    w.Int32BE(-5);
    w.VarUInt64(1ULL << 40);
    w.VarInt32(-300);
    w.String("steve");
    w.Bytes("tail");

    MCBE::Net::PacketReader r(packet);
    EXPECT_EQ(r.UInt8(), 0x7fu);
    EXPECT_TRUE(r.Bool());
    EXPECT_EQ(r.Int16(), -2);
    EXPECT_EQ(r.UInt32(), 70000u);
    EXPECT_EQ(r.Int32BE(), -5);
    EXPECT_EQ(r.VarUInt64(), 1ULL << 40);
    EXPECT_EQ(r.VarInt32(), -300);
    EXPECT_EQ(r.String(), "steve");
    EXPECT_EQ(r.Left(), 4u);
    EXPECT_EQ(r.Remaining(), "tail");
    EXPECT_TRUE(r.Empty());
}

TEST_F(PacketTest, Writer_StringIsLengthPrefixed) {
    MCBE::Net::DynamicPacket packet;
    MCBE::Net::PacketWriter w(packet);
    w.String("abc");
    ASSERT_EQ(packet.Length(), 4u);
    EXPECT_EQ(packet.GetUInt8(0), 3u);
    EXPECT_EQ(packet.GetString(1, 3), "abc");
}

TEST_F(PacketTest, Reader_StringLongerThanPacket) {
    MCBE::Net::DynamicPacket packet;
    packet.PutVarUInt32(0, 50);
    packet.PutString(1, "short");

    MCBE::Net::PacketReader r(packet);
    EXPECT_THROW(r.String(), std::out_of_range);
}

TEST_F(PacketTest, Reader_StartOffset) {
    MCBE::Net::DynamicPacket packet(std::string("\x00\x00\x05", 3));
    MCBE::Net::PacketReader r(packet, 2);
    EXPECT_EQ(r.Offset(), 2u);
    EXPECT_EQ(r.UInt8(), 5u);
    EXPECT_THROW(r.UInt8(), std::out_of_range);
}
