#include <gtest/gtest.h>
#include "client/protocol/game_packet.h"
#include "client/protocol/packets.h"
#include <stdexcept>
#include <string>

using namespace MCBE::Protocol;

class GamePacketTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = PacketPool::Default();
    }

    template<typename T>
    T* Decode(const GamePacket &pk, PacketHeader &header) {
        std::string payload;
        auto data = EncodePacket(pk, PacketHeader(pk.ID()));
        decoded = DecodePacket(data, pool, header, payload);
        return dynamic_cast<T*>(decoded.get());
    }

    PacketPool pool;
    std::unique_ptr<GamePacket> decoded;
};

// =============================================================================
// Header Tests
// =============================================================================

TEST_F(GamePacketTest, Header_PacksSubClients) {
    PacketHeader header(IDResourcePackChunkRequest);
    header.sender_sub_client = 2;
    header.target_sub_client = 3;

    MCBE::Net::DynamicPacket out;
    MCBE::Net::PacketWriter w(out);
    header.Write(w);

    uint32_t raw = 0;
    out.GetVarUInt32(0, raw);
    EXPECT_EQ(raw, 0x54u | (2u << 10) | (3u << 12));

    MCBE::Net::PacketReader r(out);
    PacketHeader read;
    read.Read(r);
    EXPECT_EQ(read.packet_id, static_cast<uint32_t>(IDResourcePackChunkRequest));
    EXPECT_EQ(read.sender_sub_client, 2);
    EXPECT_EQ(read.target_sub_client, 3);
}

TEST_F(GamePacketTest, Header_SmallIdIsOneByte) {
    MCBE::Net::DynamicPacket out = EncodePacket(ClientToServerHandshake(), PacketHeader(IDClientToServerHandshake));
    ASSERT_EQ(out.Length(), 1u);
    EXPECT_EQ(out.GetUInt8(0), 0x04u);
}

TEST_F(GamePacketTest, Header_IdMaskedToTenBits) {
    PacketHeader header(0x7ff);
    MCBE::Net::DynamicPacket out;
    MCBE::Net::PacketWriter w(out);
    header.Write(w);

    MCBE::Net::PacketReader r(out);
    PacketHeader read;
    read.Read(r);
    EXPECT_EQ(read.packet_id, 0x3ffu);
    EXPECT_EQ(read.sender_sub_client, 0);
}

// =============================================================================
// Pool Tests
// =============================================================================

TEST_F(GamePacketTest, Pool_DefaultRegistersSessionPackets) {
    EXPECT_TRUE(pool.Registered(IDLogin));
    EXPECT_TRUE(pool.Registered(IDStartGame));
    EXPECT_TRUE(pool.Registered(IDSetLocalPlayerAsInitialised));
    EXPECT_FALSE(pool.Registered(0x09));
}

TEST_F(GamePacketTest, Pool_UnknownKeepsPayload) {
    MCBE::Net::DynamicPacket data;
    MCBE::Net::PacketWriter w(data);
    PacketHeader(0x09).Write(w);
    w.Bytes("chat text");

    PacketHeader header;
    std::string payload;
    auto pk = DecodePacket(data, pool, header, payload);

    auto unknown = dynamic_cast<UnknownPacket*>(pk.get());
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->ID(), 0x09u);
    EXPECT_EQ(unknown->payload, "chat text");
    EXPECT_EQ(payload, "chat text");
}

TEST_F(GamePacketTest, Pool_CustomRegistration) {
    PacketPool custom;
    custom.Register(0x09, []() { return std::unique_ptr<GamePacket>(new UnknownPacket(0x09)); });
    EXPECT_TRUE(custom.Registered(0x09));
    EXPECT_FALSE(custom.Registered(IDLogin));
    EXPECT_EQ(custom.Create(IDLogin)->ID(), static_cast<uint32_t>(IDLogin));
}

TEST_F(GamePacketTest, PacketName_KnownAndUnknown) {
    EXPECT_EQ(PacketName(IDStartGame), "StartGame");
    EXPECT_EQ(PacketName(0x09), "Unknown(0x09)");
}

// =============================================================================
// Packet Layout Tests
// =============================================================================

TEST_F(GamePacketTest, PlayStatus_BigEndian) {
    MCBE::Net::DynamicPacket out = EncodePacket(PlayStatus(PlayStatusPlayerSpawn), PacketHeader(IDPlayStatus));
    ASSERT_EQ(out.Length(), 5u);
    EXPECT_EQ(out.GetUInt8(4), 3u);

    PacketHeader header;
    auto pk = Decode<PlayStatus>(PlayStatus(PlayStatusLoginFailedServerFull), header);
    ASSERT_NE(pk, nullptr);
    EXPECT_EQ(pk->status, PlayStatusLoginFailedServerFull);
    EXPECT_STREQ(PlayStatusName(pk->status), "server full");
}

TEST_F(GamePacketTest, Login_Fields) {
    Login login;
    login.client_protocol = CurrentProtocol;
    login.connection_request = std::string("\x05\x00\x00\x00{...}", 9);

    PacketHeader header;
    auto pk = Decode<Login>(login, header);
    ASSERT_NE(pk, nullptr);
    EXPECT_EQ(pk->client_protocol, 361);
    EXPECT_EQ(pk->connection_request, login.connection_request);
}

TEST_F(GamePacketTest, Disconnect_HiddenOmitsMessage) {
    Disconnect hidden;
    hidden.hide_disconnection_screen = true;
    hidden.message = "ignored";
    EXPECT_EQ(EncodePacket(hidden, PacketHeader(IDDisconnect)).Length(), 2u);

    Disconnect shown;
    shown.message = "server closed";
    PacketHeader header;
    auto pk = Decode<Disconnect>(shown, header);
    ASSERT_NE(pk, nullptr);
    EXPECT_FALSE(pk->hide_disconnection_screen);
    EXPECT_EQ(pk->message, "server closed");
}

TEST_F(GamePacketTest, ResourcePacksInfo_Entries) {
    ResourcePacksInfo info;
    info.texture_pack_required = true;
    ResourcePackInfoEntry entry;
    entry.uuid = "a";
    entry.version = "1.0";
    entry.size = 12345;
    entry.has_scripts = true;
    info.texture_packs.push_back(entry);

    PacketHeader header;
    auto pk = Decode<ResourcePacksInfo>(info, header);
    ASSERT_NE(pk, nullptr);
    EXPECT_TRUE(pk->texture_pack_required);
    EXPECT_TRUE(pk->behaviour_packs.empty());
    ASSERT_EQ(pk->texture_packs.size(), 1u);
    EXPECT_EQ(pk->texture_packs[0].uuid, "a");
    EXPECT_EQ(pk->texture_packs[0].size, 12345u);
    EXPECT_TRUE(pk->texture_packs[0].has_scripts);
}

TEST_F(GamePacketTest, ResourcePacksInfo_NegativeCount) {
    MCBE::Net::DynamicPacket data;
    MCBE::Net::PacketWriter w(data);
    PacketHeader(IDResourcePacksInfo).Write(w);
    w.Bool(false);
    w.Bool(false);
    w.Int16(-1);

    PacketHeader header;
    std::string payload;
    EXPECT_THROW(DecodePacket(data, pool, header, payload), std::out_of_range);
}

TEST_F(GamePacketTest, ResourcePackStack_Entries) {
    ResourcePackStack stack;
    StackResourcePack entry;
    entry.uuid = "b";
    entry.version = "2.0";
    stack.behaviour_packs.push_back(entry);
    stack.experimental = true;

    PacketHeader header;
    auto pk = Decode<ResourcePackStack>(stack, header);
    ASSERT_NE(pk, nullptr);
    ASSERT_EQ(pk->behaviour_packs.size(), 1u);
    EXPECT_EQ(pk->behaviour_packs[0].version, "2.0");
    EXPECT_TRUE(pk->experimental);
}

TEST_F(GamePacketTest, ClientResponse_Identifiers) {
    ResourcePackClientResponse response(PackResponseSendPacks);
    response.packs_to_download.push_back("a_1.0");
    response.packs_to_download.push_back("b_2.0");

    PacketHeader header;
    auto pk = Decode<ResourcePackClientResponse>(response, header);
    ASSERT_NE(pk, nullptr);
    EXPECT_EQ(pk->response, PackResponseSendPacks);
    ASSERT_EQ(pk->packs_to_download.size(), 2u);
    EXPECT_EQ(pk->packs_to_download[1], "b_2.0");
}

TEST_F(GamePacketTest, StartGame_KeepsWorldData) {
    StartGame start;
    start.entity_unique_id = -42;
    start.entity_runtime_id = 7;
    start.world_data = std::string("\x01\x02\x00\x03", 4);

    PacketHeader header;
    auto pk = Decode<StartGame>(start, header);
    ASSERT_NE(pk, nullptr);
    EXPECT_EQ(pk->entity_unique_id, -42);
    EXPECT_EQ(pk->entity_runtime_id, 7u);
    EXPECT_EQ(pk->world_data, start.world_data);
}

TEST_F(GamePacketTest, ChunkData_Fields) {
    ResourcePackChunkData chunk;
    chunk.uuid = "a";
    chunk.chunk_index = 2;
    chunk.data_offset = 2048;
    chunk.data = std::string(100, 'z');

    PacketHeader header;
    auto pk = Decode<ResourcePackChunkData>(chunk, header);
    ASSERT_NE(pk, nullptr);
    EXPECT_EQ(pk->chunk_index, 2u);
    EXPECT_EQ(pk->data_offset, 2048u);
    EXPECT_EQ(pk->data.size(), 100u);
}

TEST_F(GamePacketTest, DataInfo_Truncated) {
    ResourcePackDataInfo info;
    info.uuid = "a";
    info.data_chunk_size = 1024;
    info.chunk_count = 3;
    info.size = 3000;
    info.hash = std::string(32, 'h');

    auto data = EncodePacket(info, PacketHeader(IDResourcePackDataInfo));
    data.Resize(data.Length() - 10);

    PacketHeader header;
    std::string payload;
    EXPECT_THROW(DecodePacket(data, pool, header, payload), std::out_of_range);
}

TEST_F(GamePacketTest, ChunkRadius_Signed) {
    PacketHeader header;
    auto pk = Decode<RequestChunkRadius>(RequestChunkRadius(-3), header);
    ASSERT_NE(pk, nullptr);
    EXPECT_EQ(pk->chunk_radius, -3);
}
