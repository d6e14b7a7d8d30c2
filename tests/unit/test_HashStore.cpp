#include <gtest/gtest.h>
#include "TestFs.hpp"
#include "protocols/Error.hpp"
#include "storage/HashStore.hpp"
#include "util/digest.hpp"

#include <nlohmann/json.hpp>

using namespace ferry::storage;
using namespace ferry::test;
using ferry::config::HashAlgorithm;
namespace fs = std::filesystem;

class HashStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    ferry::config::DedupConfig cfg;

    void SetUp() override { cfg.enabled = true; }

    [[nodiscard]] fs::path ledger() const { return tmp / "state" / "file_hash_db.json"; }
};

TEST_F(HashStoreTest, KnownDigests) {
    HashStore store(ledger(), cfg);
    const auto f = tmp / "abc.txt";
    writeBytes(f, "abc");

    EXPECT_EQ(store.hash(f, HashAlgorithm::Md5), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(store.hash(f, HashAlgorithm::Sha256),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(ferry::util::md5Hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(HashStoreTest, ContentNotPathAddressed) {
    HashStore store(ledger(), cfg);
    const auto a = tmp / "a" / "one.jpg";
    const auto b = tmp / "b" / "two.jpg";
    const auto data = randomBytes(5000);
    writeBytes(a, data);
    writeBytes(b, data);

    EXPECT_EQ(store.contentHash(a), store.contentHash(b));

    store.record(a);
    const auto dup = store.isDuplicate(b);
    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(*dup, a);
}

TEST_F(HashStoreTest, QuickHashSmallFileIsWholeFileMd5) {
    HashStore store(ledger(), cfg);
    const auto f = tmp / "small.png";
    writeBytes(f, "abc");
    EXPECT_EQ(store.quickHash(f), "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(HashStoreTest, QuickHashIgnoresMiddleOfLargeFile) {
    HashStore store(ledger(), cfg);
    auto data = randomBytes(3 * 1024 * 1024);
    const auto a = tmp / "a.raw";
    writeBytes(a, data);

    data[data.size() / 2] ^= 0x5a;
    const auto b = tmp / "b.raw";
    writeBytes(b, data);

    EXPECT_EQ(store.quickHash(a), store.quickHash(b));
    EXPECT_NE(store.hash(a, HashAlgorithm::Md5), store.hash(b, HashAlgorithm::Md5));
}

TEST_F(HashStoreTest, LookupEvictsVanishedCanonicalFile) {
    HashStore store(ledger(), cfg);
    const auto f = tmp / "photo.jpg";
    writeBytes(f, randomBytes(100));
    const auto h = store.contentHash(f);
    store.record(h, f, 100);

    ASSERT_TRUE(store.lookup(h).has_value());
    fs::remove(f);
    EXPECT_FALSE(store.lookup(h).has_value());
    EXPECT_EQ(store.stats().records, 0u);
}

TEST_F(HashStoreTest, PersistsAcrossInstances) {
    const auto f = tmp / "photo.jpg";
    writeBytes(f, randomBytes(1234));
    {
        HashStore store(ledger(), cfg);
        store.record(f);
    }

    HashStore reopened(ledger(), cfg);
    const auto stats = reopened.stats();
    EXPECT_EQ(stats.records, 1u);
    EXPECT_EQ(stats.totalBytes, 1234u);

    const auto j = nlohmann::json::parse(readBytes(ledger()));
    EXPECT_EQ(j["version"], "1.0");
    ASSERT_EQ(j["records"].size(), 1u);
    EXPECT_EQ(j["records"][0]["path"], f.string());
}

TEST_F(HashStoreTest, CorruptLedgerLoadsEmpty) {
    writeBytes(ledger(), "{\"records\": [ {\"hash\": ");
    HashStore store(ledger(), cfg);
    EXPECT_EQ(store.stats().records, 0u);

    const auto f = tmp / "x.jpg";
    writeBytes(f, "x");
    store.record(f);
    EXPECT_EQ(store.stats().records, 1u);
}

TEST_F(HashStoreTest, OneCanonicalPathPerHash) {
    HashStore store(ledger(), cfg);
    const auto a = tmp / "a.jpg";
    const auto b = tmp / "b.jpg";
    writeBytes(a, "same");
    writeBytes(b, "same");

    store.record(a);
    store.record(b);
    EXPECT_EQ(store.stats().records, 1u);
    EXPECT_EQ(store.lookup(store.contentHash(a))->canonicalPath, b);
}

TEST_F(HashStoreTest, RemoveAndClear) {
    HashStore store(ledger(), cfg);
    const auto a = tmp / "a.jpg";
    const auto b = tmp / "b.jpg";
    writeBytes(a, "one");
    writeBytes(b, "two");
    store.record(a);
    store.record(b);

    EXPECT_TRUE(store.remove(a));
    EXPECT_FALSE(store.remove(a));
    EXPECT_EQ(store.stats().records, 1u);

    store.clear();
    EXPECT_EQ(store.stats().records, 0u);
    EXPECT_FALSE(fs::exists(ledger()));
}

TEST_F(HashStoreTest, HashingHonoursCancel) {
    HashStore store(ledger(), cfg);
    const auto f = tmp / "big.raw";
    writeBytes(f, randomBytes(3 * 1024 * 1024));

    EXPECT_THROW((void)store.hash(f, HashAlgorithm::Md5, [] { return true; }), ferry::protocols::InterruptedError);
}
