#include <gtest/gtest.h>
#include "../src/CacheStore.hpp"
#include "../src/ProxyError.hpp"
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <tuple>
#include <vector>

namespace fs = std::filesystem;

class CacheStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const ::testing::TestInfo * info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              ("caching_proxy_store_" + std::to_string(getpid()) + "_" + info->name());
        fs::remove_all(dir);
        store = std::make_unique<CacheStore>(dir.string());
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    static CacheEntry sample_entry(const std::string & body) {
        http::fields headers;
        headers.insert("Content-Type", "application/json");
        headers.insert("Set-Cookie", "a=1");
        headers.insert("Set-Cookie", "b=2");
        headers.insert("Content-Length", std::to_string(body.size()));
        return CacheEntry("HTTP/1.1 200 OK", headers, body);
    }

    void write_raw(const std::string & key, const std::string & bytes) {
        fs::create_directories(dir);
        std::ofstream out(dir / key, std::ios::binary);
        out << bytes;
    }

    fs::path dir;
    std::unique_ptr<CacheStore> store;
};

TEST(CacheKeyTest, TestDeterministic) {
    std::vector<std::tuple<std::string, std::string, std::string>> corpus = {
        {"GET", "dummyjson.com", "/products/1"},
        {"GET", "http://dummyjson.com", "/products/1"},
        {"POST", "dummyjson.com", "/products/1"},
        {"GET", "dummyjson.com", "/products/2"},
        {"GET", "example.com", "/"},
        {"HEAD", "example.com", "/"},
        {"GET", "", ""},
    };
    std::set<std::string> keys;
    for (const auto & [method, host, target] : corpus) {
        std::string key = CacheStore::computeKey(method, host, target);
        EXPECT_EQ(key, CacheStore::computeKey(method, host, target));
        EXPECT_EQ(key.size(), 64u);
        EXPECT_EQ(key.find_first_not_of("0123456789abcdef"), std::string::npos);
        keys.insert(key);
    }
    EXPECT_EQ(keys.size(), corpus.size());
}

TEST(CacheKeyTest, TestKnownDigest) {
    // method, host and target are hashed back to back: this is sha256("abc")
    EXPECT_EQ(CacheStore::computeKey("a", "b", "c"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(CacheStore::computeKey("GET", "", ""), CacheStore::computeKey("G", "", "ET"));
}

TEST_F(CacheStoreTest, TestRoundTrip) {
    std::cout << "\n=== Starting TestRoundTrip ===" << std::endl;
    std::string key = CacheStore::computeKey("GET", "dummyjson.com", "/products/1");
    CacheEntry entry = sample_entry("{\"id\":1}");

    EXPECT_FALSE(store->contains(key));
    store->put(key, entry);
    EXPECT_TRUE(store->contains(key));
    EXPECT_TRUE(fs::is_regular_file(dir / key));

    std::optional<CacheEntry> loaded = store->get(key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, entry);
    EXPECT_EQ(loaded->getStatusCode(), 200);
    EXPECT_EQ(loaded->getHeader("content-type"), "application/json");

    // both Set-Cookie entries survive in order
    auto range = loaded->getResponseHeaders().equal_range("Set-Cookie");
    std::vector<std::string> cookies;
    for (auto it = range.first; it != range.second; ++it) {
        cookies.push_back(it->value().to_string());
    }
    EXPECT_EQ(cookies, (std::vector<std::string>{"a=1", "b=2"}));
    std::cout << "=== Completed TestRoundTrip ===" << std::endl;
}

TEST_F(CacheStoreTest, TestBinaryAndEmptyBodies) {
    std::string binary("\x00\x01\xfe\xff\r\n\x00", 7);
    std::string key1 = CacheStore::computeKey("GET", "h", "/bin");
    std::string key2 = CacheStore::computeKey("GET", "h", "/empty");

    store->put(key1, sample_entry(binary));
    store->put(key2, CacheEntry("HTTP/1.0 204 No Content", http::fields(), ""));

    std::optional<CacheEntry> bin = store->get(key1);
    ASSERT_TRUE(bin.has_value());
    EXPECT_EQ(bin->getResponseBody(), binary);

    std::optional<CacheEntry> empty = store->get(key2);
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->hasBody());
    EXPECT_EQ(empty->getResponseLine(), "HTTP/1.0 204 No Content");
    EXPECT_EQ(empty->getStatusCode(), 204);
}

TEST_F(CacheStoreTest, TestAbsentKey) {
    std::string key = CacheStore::computeKey("GET", "nowhere", "/");
    EXPECT_FALSE(store->contains(key));
    EXPECT_FALSE(store->get(key).has_value());
}

TEST_F(CacheStoreTest, TestInvalidKeyRejected) {
    EXPECT_THROW(store->get("../etc/passwd"), StoreError);
    EXPECT_THROW(store->put("", sample_entry("x")), StoreError);
}

TEST_F(CacheStoreTest, TestClear) {
    std::string key = CacheStore::computeKey("GET", "h", "/");
    store->put(key, sample_entry("x"));
    store->put(CacheStore::computeKey("GET", "h", "/2"), sample_entry("y"));

    EXPECT_EQ(store->clear(), 2u);
    EXPECT_FALSE(store->contains(key));
    EXPECT_FALSE(store->get(key).has_value());
    EXPECT_EQ(store->clear(), 0u);
}

TEST_F(CacheStoreTest, TestClearMissingDirectory) {
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_EQ(store->clear(), 0u);
}

TEST_F(CacheStoreTest, TestCorruptRecords) {
    std::string record = CacheStore::encode(sample_entry("hello world"));
    std::string key = CacheStore::computeKey("GET", "h", "/corrupt");

    write_raw(key, "XXXX" + record.substr(4));
    EXPECT_THROW(store->get(key), StoreError);

    write_raw(key, record.substr(0, record.size() - 3));
    EXPECT_THROW(store->get(key), StoreError);

    write_raw(key, record + "junk");
    EXPECT_THROW(store->get(key), StoreError);

    write_raw(key, "PX");
    EXPECT_THROW(store->get(key), StoreError);

    // a length field pointing far past the end
    std::string huge = record;
    huge[4] = '\x7f';
    write_raw(key, huge);
    EXPECT_THROW(store->get(key), StoreError);

    write_raw(key, record);
    EXPECT_NO_THROW(store->get(key));
}

TEST_F(CacheStoreTest, TestOversizedHeaderIsCorrupt) {
    // one header whose value is longer than a header field may be
    std::string value(70000, 'v');
    std::string record("PXC1"
                       "\x00\x00\x00\x01" "S"
                       "\x00\x00\x00\x01"
                       "\x00\x00\x00\x01" "A", 4 + 5 + 4 + 5);
    record += std::string("\x00\x01\x11\x70", 4) + value;
    record += std::string("\x00\x00\x00\x00", 4);

    std::string key = CacheStore::computeKey("GET", "h", "/oversized");
    write_raw(key, record);
    EXPECT_THROW(store->get(key), StoreError);
    EXPECT_THROW(CacheStore::decode(record), StoreError);
}

TEST_F(CacheStoreTest, TestRecordLayout) {
    http::fields headers;
    headers.insert("A", "b");
    std::string record = CacheStore::encode(CacheEntry("S", headers, "xy"));
    std::string expected("PXC1"
                         "\x00\x00\x00\x01" "S"
                         "\x00\x00\x00\x01"
                         "\x00\x00\x00\x01" "A"
                         "\x00\x00\x00\x01" "b"
                         "\x00\x00\x00\x02" "xy", 4 + 5 + 4 + 5 + 5 + 6);
    EXPECT_EQ(record, expected);
}

TEST_F(CacheStoreTest, TestConcurrentWritersSameKey) {
    std::cout << "\n=== Starting TestConcurrentWritersSameKey ===" << std::endl;
    std::string key = CacheStore::computeKey("GET", "race", "/");
    CacheEntry first = sample_entry(std::string(64 * 1024, 'a'));
    CacheEntry second = sample_entry(std::string(32 * 1024, 'b'));

    std::vector<std::thread> writers;
    for (int i = 0; i < 8; i++) {
        writers.emplace_back([&, i]() {
            for (int j = 0; j < 10; j++) {
                store->put(key, (i % 2 == 0) ? first : second);
            }
        });
    }
    for (auto & writer : writers) {
        writer.join();
    }

    std::optional<CacheEntry> loaded = store->get(key);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(*loaded == first || *loaded == second);

    // no temporary files are left behind
    size_t files = 0;
    for (const auto & item : fs::directory_iterator(dir)) {
        (void)item;
        files++;
    }
    EXPECT_EQ(files, 1u);
    std::cout << "=== Completed TestConcurrentWritersSameKey ===" << std::endl;
}
