#include <gtest/gtest.h>
#include "client/resource_pack_queue.h"
#include "common/crypto/crypto.h"
#include "common/net/errors.h"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace MCBE;

class ResourcePackQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string a_content;
        for (int i = 0; i < 2500; i++) {
            a_content.push_back(static_cast<char>(i % 251));
        }
        pack_a = std::make_shared<ResourcePack>("A", "1.0", a_content);
        pack_b = std::make_shared<ResourcePack>("B", "2.0", std::string(1024, 'b'));
        catalog = { pack_a, pack_b };
    }

    // Delivers every chunk of the current pack, returns the final result
    ChunkResult DeliverAll(ResourcePackQueue &queue, const ResourcePack &source, const PackDataInfo &info) {
        ChunkResult result;
        for (uint32_t i = 0; i < info.chunk_count; i++) {
            result = queue.DeliverChunk(info.uuid, i, static_cast<uint64_t>(i) * info.chunk_size, source.ReadChunk(i, info.chunk_size));
            if (i + 1 < info.chunk_count) {
                EXPECT_FALSE(result.complete);
                EXPECT_EQ(result.next_index, i + 1);
            }
        }
        return result;
    }

    std::shared_ptr<ResourcePack> pack_a;
    std::shared_ptr<ResourcePack> pack_b;
    std::vector<std::shared_ptr<ResourcePack>> catalog;
};

// =============================================================================
// ResourcePack Tests
// =============================================================================

TEST_F(ResourcePackQueueTest, Pack_IdentifierAndChunks) {
    EXPECT_EQ(pack_a->Identifier(), "A_1.0");
    EXPECT_EQ(pack_a->DataChunkCount(1024), 3u);
    EXPECT_EQ(pack_b->DataChunkCount(1024), 1u);
    EXPECT_EQ(pack_a->ReadChunk(2, 1024).size(), 2500u - 2048u);
    EXPECT_THROW(pack_a->ReadChunk(3, 1024), std::out_of_range);
    EXPECT_THROW(pack_a->DataChunkCount(0), std::invalid_argument);
}

TEST_F(ResourcePackQueueTest, Pack_OfferedHasNoContent) {
    ResourcePack offered("C", "1.0", static_cast<uint64_t>(10));
    EXPECT_FALSE(offered.HasContent());
    EXPECT_THROW(offered.ReadChunk(0, 4), std::out_of_range);

    ResourcePack empty("D", "1.0", static_cast<uint64_t>(0));
    EXPECT_TRUE(empty.HasContent());
}

TEST_F(ResourcePackQueueTest, SplitIdentifier) {
    std::string uuid, version;
    EXPECT_TRUE(SplitPackIdentifier("5a2e-11_1.0.2", uuid, version));
    EXPECT_EQ(uuid, "5a2e-11");
    EXPECT_EQ(version, "1.0.2");
    EXPECT_FALSE(SplitPackIdentifier("noversion", uuid, version));
}

// =============================================================================
// Request Tests
// =============================================================================

TEST_F(ResourcePackQueueTest, Initial_AllOffered) {
    ResourcePackQueue queue(catalog, 1024);
    EXPECT_EQ(queue.GetState("A_1.0"), PackStateOffered);
    EXPECT_EQ(queue.GetState("Z_9"), PackStateUnknown);
    EXPECT_TRUE(queue.AllDownloaded());
    EXPECT_EQ(queue.PendingCount(), 0u);
}

TEST_F(ResourcePackQueueTest, Request_QueuesPack) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0" });

    EXPECT_EQ(queue.PendingCount(), 1u);
    EXPECT_EQ(queue.GetState("A_1.0"), PackStateRequested);
    EXPECT_EQ(queue.GetState("B_2.0"), PackStateOffered);
    EXPECT_FALSE(queue.AllDownloaded());
}

TEST_F(ResourcePackQueueTest, Request_MissingPackIsAtomic) {
    ResourcePackQueue queue(catalog, 1024);
    try {
        queue.Request({ "A_1.0", "C_1.0" });
        FAIL() << "expected ProtocolError";
    }
    catch (Net::ProtocolError &ex) {
        EXPECT_NE(std::string(ex.what()).find("C_1.0"), std::string::npos);
    }

    EXPECT_EQ(queue.PendingCount(), 0u);
    EXPECT_EQ(queue.GetState("A_1.0"), PackStateOffered);
    EXPECT_TRUE(queue.AllDownloaded());
}

TEST_F(ResourcePackQueueTest, Request_DuplicatesIgnored) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0", "A_1.0" });
    queue.Request({ "A_1.0" });
    EXPECT_EQ(queue.PendingCount(), 1u);
}

// =============================================================================
// Sending Side Tests
// =============================================================================

TEST_F(ResourcePackQueueTest, NextPack_FullTransfer) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_EQ(info.uuid, "A");
    EXPECT_EQ(info.chunk_size, 1024u);
    EXPECT_EQ(info.chunk_count, 3u);
    EXPECT_EQ(info.size, 2500u);
    EXPECT_EQ(info.hash, Crypto::Sha256(pack_a->Content()));
    EXPECT_EQ(queue.GetState("A_1.0"), PackStateDownloading);

    auto result = DeliverAll(queue, *pack_a, info);
    EXPECT_TRUE(result.complete);
    EXPECT_TRUE(result.all_downloaded);
    ASSERT_NE(result.pack, nullptr);
    EXPECT_EQ(result.pack->Content(), pack_a->Content());

    EXPECT_EQ(queue.GetState("A_1.0"), PackStateVerified);
    EXPECT_TRUE(queue.AllDownloaded());
    EXPECT_FALSE(queue.NextPack(info));
}

TEST_F(ResourcePackQueueTest, NextPack_RequestOrder) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "B_2.0", "A_1.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_EQ(info.uuid, "B");
    DeliverAll(queue, *pack_b, info);

    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_EQ(info.uuid, "A");
}

TEST_F(ResourcePackQueueTest, NextPack_OneAtATime) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0", "B_2.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_THROW(queue.NextPack(info), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, NextPack_WithoutContent) {
    std::vector<std::shared_ptr<ResourcePack>> offered = {
        std::make_shared<ResourcePack>("C", "1.0", static_cast<uint64_t>(10))
    };
    ResourcePackQueue queue(offered, 4);
    queue.Request({ "C_1.0" });

    PackDataInfo info;
    EXPECT_THROW(queue.NextPack(info), Net::ProtocolError);
}

// =============================================================================
// Receiving Side Tests
// =============================================================================

TEST_F(ResourcePackQueueTest, BeginDownload_ServerChunkSize) {
    std::vector<std::shared_ptr<ResourcePack>> offered = {
        std::make_shared<ResourcePack>("A", "1.0", static_cast<uint64_t>(pack_a->Size()))
    };
    ResourcePackQueue queue(offered);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    info.uuid = "A";
    info.chunk_size = 1000;
    info.chunk_count = 3;
    info.size = pack_a->Size();
    info.hash = pack_a->Checksum();

    auto start = queue.BeginDownload(info);
    EXPECT_FALSE(start.complete);
    EXPECT_EQ(queue.CurrentPack()->Identifier(), "A_1.0");

    auto result = DeliverAll(queue, *pack_a, info);
    EXPECT_TRUE(result.complete);
    EXPECT_TRUE(result.pack->HasContent());
    EXPECT_EQ(queue.Downloaded().size(), 1u);
    EXPECT_EQ(queue.CurrentPack(), nullptr);
}

TEST_F(ResourcePackQueueTest, BeginDownload_NotRequested) {
    ResourcePackQueue queue(catalog, 1024);
    PackDataInfo info;
    info.uuid = "A";
    info.chunk_size = 1024;
    info.chunk_count = 3;
    info.size = 2500;
    EXPECT_THROW(queue.BeginDownload(info), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, BeginDownload_BadChunkCount) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    info.uuid = "A";
    info.chunk_size = 1024;
    info.chunk_count = 2;
    info.size = 2500;
    EXPECT_THROW(queue.BeginDownload(info), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, BeginDownload_SizeDiffersFromOffer) {
    std::vector<std::shared_ptr<ResourcePack>> offered = {
        std::make_shared<ResourcePack>("A", "1.0", static_cast<uint64_t>(2500))
    };
    ResourcePackQueue queue(offered);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    info.uuid = "A";
    info.chunk_size = 1024;
    info.chunk_count = 1;
    info.size = 3;
    info.hash = Crypto::Sha256("abc");

    try {
        queue.BeginDownload(info);
        FAIL() << "expected ProtocolError";
    }
    catch (Net::ProtocolError &ex) {
        EXPECT_NE(std::string(ex.what()).find("2500"), std::string::npos);
    }

    EXPECT_EQ(queue.CurrentPack(), nullptr);
    EXPECT_EQ(queue.GetState("A_1.0"), PackStateRequested);
    EXPECT_THROW(queue.DeliverChunk("A", 0, 0, "abc"), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, BeginDownload_HugeSizeRejected) {
    std::vector<std::shared_ptr<ResourcePack>> offered = {
        std::make_shared<ResourcePack>("H", "1.0", static_cast<uint64_t>(UINT64_MAX))
    };
    ResourcePackQueue queue(offered);
    queue.Request({ "H_1.0" });

    PackDataInfo info;
    info.uuid = "H";
    info.chunk_size = 1024;
    info.chunk_count = 1;
    info.size = UINT64_MAX;
    EXPECT_THROW(queue.BeginDownload(info), Net::ProtocolError);
    EXPECT_EQ(queue.CurrentPack(), nullptr);
}

TEST_F(ResourcePackQueueTest, BeginDownload_EmptyPackCompletes) {
    std::vector<std::shared_ptr<ResourcePack>> offered = {
        std::make_shared<ResourcePack>("E", "1.0", static_cast<uint64_t>(0))
    };
    ResourcePackQueue queue(offered);
    queue.Request({ "E_1.0" });

    PackDataInfo info;
    info.uuid = "E";
    info.hash = Crypto::Sha256("");

    auto result = queue.BeginDownload(info);
    EXPECT_TRUE(result.complete);
    EXPECT_TRUE(result.all_downloaded);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_OutOfOrder) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_THROW(queue.DeliverChunk("A", 1, 1024, pack_a->ReadChunk(1, 1024)), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_RepeatedIndex) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    queue.DeliverChunk("A", 0, 0, pack_a->ReadChunk(0, 1024));
    EXPECT_EQ(queue.CurrentOffset(), 1024u);
    EXPECT_THROW(queue.DeliverChunk("A", 0, 1024, pack_a->ReadChunk(0, 1024)), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_WrongPack) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_THROW(queue.DeliverChunk("B", 0, 0, "x"), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_NothingDownloading) {
    ResourcePackQueue queue(catalog, 1024);
    EXPECT_THROW(queue.DeliverChunk("A", 0, 0, "x"), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_Overrun) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "B_2.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_THROW(queue.DeliverChunk("B", 0, 0, std::string(1025, 'b')), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_LongerThanChunkSize) {
    std::vector<std::shared_ptr<ResourcePack>> offered = {
        std::make_shared<ResourcePack>("A", "1.0", static_cast<uint64_t>(pack_a->Size()))
    };
    ResourcePackQueue queue(offered);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    info.uuid = "A";
    info.chunk_size = 1000;
    info.chunk_count = 3;
    info.size = pack_a->Size();
    info.hash = pack_a->Checksum();
    queue.BeginDownload(info);

    EXPECT_THROW(queue.DeliverChunk("A", 0, 0, pack_a->Content().substr(0, 1500)), Net::ProtocolError);
    EXPECT_EQ(queue.CurrentOffset(), 0u);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_WrongOffset) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    queue.DeliverChunk("A", 0, 0, pack_a->ReadChunk(0, 1024));

    EXPECT_THROW(queue.DeliverChunk("A", 1, 2048, pack_a->ReadChunk(1, 1024)), Net::ProtocolError);
    EXPECT_EQ(queue.CurrentOffset(), 1024u);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_ShortTransfer) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "B_2.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    EXPECT_THROW(queue.DeliverChunk("B", 0, 0, std::string(100, 'b')), Net::ProtocolError);
}

TEST_F(ResourcePackQueueTest, DeliverChunk_ChecksumMismatch) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "B_2.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));

    std::string corrupted(1024, 'b');
    corrupted[512] = 'c';
    EXPECT_THROW(queue.DeliverChunk("B", 0, 0, corrupted), Net::ProtocolError);
    EXPECT_NE(queue.GetState("B_2.0"), PackStateVerified);
}

TEST_F(ResourcePackQueueTest, AllDownloaded_WaitsForEveryRequest) {
    ResourcePackQueue queue(catalog, 1024);
    queue.Request({ "A_1.0", "B_2.0" });

    PackDataInfo info;
    ASSERT_TRUE(queue.NextPack(info));
    auto first = DeliverAll(queue, *pack_a, info);
    EXPECT_TRUE(first.complete);
    EXPECT_FALSE(first.all_downloaded);
    EXPECT_FALSE(queue.AllDownloaded());

    ASSERT_TRUE(queue.NextPack(info));
    auto second = DeliverAll(queue, *pack_b, info);
    EXPECT_TRUE(second.all_downloaded);
    EXPECT_TRUE(queue.AllDownloaded());
    EXPECT_EQ(queue.Downloaded().size(), 2u);
}

TEST_F(ResourcePackQueueTest, PackStateName_Values) {
    EXPECT_STREQ(PackStateName(PackStateRequested), "requested");
    EXPECT_STREQ(PackStateName(PackStateVerified), "verified");
}
