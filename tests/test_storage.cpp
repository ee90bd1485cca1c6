/**
 * @file test_storage.cpp
 * @brief Tests for per-key JSON storage and the debounced writer.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>

#include "TestSupport.hpp"
#include "clipfolio/DebouncedSaver.hpp"
#include "clipfolio/Errors.hpp"
#include "clipfolio/KeyValueStorage.hpp"

using namespace std::chrono_literals;
using clipfolio::DebouncedSaver;
using clipfolio::KeyValueStorage;
using clipfolio::StorageError;
using clipfolio::test::TempDir;
using nlohmann::json;

// --------------------------- KeyValueStorage -------------------------------

TEST(KeyValueStorage, Save_Then_Load) {
    TempDir dir;
    KeyValueStorage storage(dir / "store");
    EXPECT_FALSE(storage.load("history"));

    storage.save("history", json::array({1, 2, 3}));
    auto loaded = storage.load("history");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(*loaded, json::array({1, 2, 3}));
    EXPECT_TRUE(std::filesystem::exists(dir / "store" / "history.json"));
    EXPECT_FALSE(std::filesystem::exists(dir / "store" / "history.json.tmp"));
}

TEST(KeyValueStorage, Corrupt_File_Loads_As_Missing) {
    TempDir dir;
    KeyValueStorage storage(dir.path());
    std::ofstream(dir / "projects.json") << "[1, 2";
    EXPECT_FALSE(storage.load("projects"));
}

TEST(KeyValueStorage, Rejects_Path_Like_Keys) {
    TempDir dir;
    KeyValueStorage storage(dir.path());
    EXPECT_THROW(storage.save("../escape", json{}), StorageError);
    EXPECT_THROW(storage.pathFor("a/b"), StorageError);
    EXPECT_THROW(storage.pathFor(""), StorageError);
}

TEST(KeyValueStorage, Unusable_Directory_Throws) {
    TempDir dir;
    std::ofstream(dir / "file") << "x";
    EXPECT_THROW(KeyValueStorage(dir / "file" / "sub"), StorageError);
}

// --------------------------- DebouncedSaver --------------------------------

namespace {

struct Recorder {
    std::mutex mutex;
    std::map<std::string, json> last;
    std::atomic<int> writes{0};

    DebouncedSaver::SaveFn fn() {
        return [this](const std::string& key, const json& data) {
            std::lock_guard<std::mutex> lock(mutex);
            last[key] = data;
            writes++;
        };
    }
};

} // namespace

TEST(DebouncedSaver, Coalesces_Bursts) {
    Recorder rec;
    DebouncedSaver saver(rec.fn(), 50ms);
    for (int i = 0; i < 10; i++) saver.schedule("k", json(i));

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (rec.writes.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(rec.writes.load(), 1);
    std::lock_guard<std::mutex> lock(rec.mutex);
    EXPECT_EQ(rec.last["k"], json(9));
}

TEST(DebouncedSaver, Flush_Writes_Immediately) {
    Recorder rec;
    DebouncedSaver saver(rec.fn(), 10s);
    saver.schedule("a", json("x"));
    saver.schedule("b", json("y"));
    EXPECT_EQ(saver.pendingCount(), 2u);

    saver.flush();
    EXPECT_EQ(saver.pendingCount(), 0u);
    EXPECT_EQ(rec.writes.load(), 2);
}

TEST(DebouncedSaver, Destructor_Flushes_Pending) {
    Recorder rec;
    {
        DebouncedSaver saver(rec.fn(), 10s);
        saver.schedule("a", json(1));
    }
    EXPECT_EQ(rec.writes.load(), 1);
}

TEST(DebouncedSaver, Failed_Save_Does_Not_Stop_Others) {
    int written = 0;
    DebouncedSaver saver([&](const std::string& key, const json&) {
        if (key == "bad") throw StorageError("disk full");
        written++;
    }, 10s);
    saver.schedule("bad", json(1));
    saver.schedule("good", json(2));
    EXPECT_NO_THROW(saver.flush());
    EXPECT_EQ(written, 1);
}
