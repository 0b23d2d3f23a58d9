#include <gtest/gtest.h>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "TestSupport.hpp"
#include "core/catalog/CatalogStore.hpp"
#include "core/residency/ActiveSet.hpp"

using namespace bitserve;
using namespace bitserve::test;

class ActiveSetTest : public ::testing::Test {
protected:
  // Row first, then engine, then admit: the order the controller uses.
  std::vector<std::string> admitNew(ActiveSet& set, const std::string& id) {
    catalog.insert(id, id);
    return set.admit(id, engine.load(descriptor(id), dir / "downloads"));
  }

  TempDir dir;
  std::string dbPath = freshCatalog(dir);
  CatalogStore catalog{dbPath};
  FakeEngine engine;
};

TEST_F(ActiveSetTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(ActiveSet(engine, catalog, 0), std::invalid_argument);
}

TEST_F(ActiveSetTest, AdmitBelowCapacityEvictsNothing) {
  ActiveSet set(engine, catalog, 2);
  EXPECT_TRUE(admitNew(set, "aa01").empty());
  EXPECT_TRUE(admitNew(set, "aa02").empty());
  EXPECT_EQ(set.size(), 2u);
}

TEST_F(ActiveSetTest, AdmitAtCapacityEvictsOldestLastAccess) {
  ActiveSet set(engine, catalog, 2);
  admitNew(set, "aa01");
  admitNew(set, "aa02");

  auto evicted = admitNew(set, "aa03");
  ASSERT_EQ(evicted, std::vector<std::string>{"aa01"});
  EXPECT_FALSE(set.contains("aa01"));
  EXPECT_TRUE(set.contains("aa02"));
  EXPECT_TRUE(set.contains("aa03"));
  EXPECT_EQ(catalog.get("aa01")->residency, Residency::inactive);
  EXPECT_FALSE(engine.isLoaded("aa01"));
}

TEST_F(ActiveSetTest, TouchChangesVictim) {
  ActiveSet set(engine, catalog, 2);
  admitNew(set, "aa01");
  admitNew(set, "aa02");
  ASSERT_TRUE(set.touch("aa01"));

  EXPECT_EQ(admitNew(set, "aa03"), std::vector<std::string>{"aa02"});
  EXPECT_TRUE(set.contains("aa01"));
}

TEST_F(ActiveSetTest, TouchOnNonResidentIsFalse) {
  ActiveSet set(engine, catalog, 2);
  catalog.insert("aa01", "a");
  EXPECT_FALSE(set.touch("aa01"));
}

TEST_F(ActiveSetTest, EvictionNeverDeletesPayload) {
  ActiveSet set(engine, catalog, 1);
  admitNew(set, "aa01");
  admitNew(set, "aa02");
  ASSERT_EQ(engine.unloads.size(), 1u);
  EXPECT_EQ(engine.unloads[0], std::make_pair(std::string("aa01"), false));
}

TEST_F(ActiveSetTest, EvictFlushesStatsFirst) {
  ActiveSet set(engine, catalog, 2);
  admitNew(set, "aa01");
  engine.setCounters("aa01", 700, 900);
  ASSERT_TRUE(set.evict("aa01"));

  auto rec = catalog.get("aa01");
  EXPECT_EQ(rec->bytes_uploaded, 700);
  EXPECT_EQ(rec->bytes_downloaded, 900);
  EXPECT_EQ(rec->residency, Residency::inactive);
  EXPECT_FALSE(set.evict("aa01"));
}

TEST_F(ActiveSetTest, ReleaseHonoursDeleteFilesAndKeepsRow) {
  ActiveSet set(engine, catalog, 2);
  admitNew(set, "aa01");
  ASSERT_TRUE(set.release("aa01", true));
  EXPECT_EQ(engine.unloads.back(), std::make_pair(std::string("aa01"), true));
  EXPECT_TRUE(catalog.get("aa01").has_value());
  EXPECT_FALSE(set.release("aa01", true));
}

TEST_F(ActiveSetTest, CountersAccumulateAcrossReloads) {
  ActiveSet set(engine, catalog, 2);
  admitNew(set, "aa01");
  engine.setCounters("aa01", 100, 1000);
  set.evict("aa01");

  // engine counters restart from zero after a reload
  set.admit("aa01", engine.load(descriptor("aa01"), dir / "downloads"));
  engine.setCounters("aa01", 5, 50);
  auto snap = set.snapshot("aa01");
  ASSERT_TRUE(snap.has_value());
  EXPECT_EQ(snap->bytes_uploaded, 105);
  EXPECT_EQ(snap->bytes_downloaded, 1050);

  EXPECT_EQ(set.flushStats(), 1u);
  EXPECT_EQ(catalog.get("aa01")->bytes_uploaded, 105);
}

TEST_F(ActiveSetTest, FlushSkipsItemsWithEngineErrors) {
  ActiveSet set(engine, catalog, 3);
  admitNew(set, "aa01");
  admitNew(set, "aa02");
  engine.setCounters("aa01", 10, 10);
  engine.setCounters("aa02", 20, 20);
  engine.failStatus.insert("aa01");

  EXPECT_EQ(set.flushStats(), 1u);
  EXPECT_EQ(catalog.get("aa01")->bytes_uploaded, 0);
  EXPECT_EQ(catalog.get("aa02")->bytes_uploaded, 20);
}

TEST_F(ActiveSetTest, FailedVictimUnloadRejectsAdmissionAndUnloadsNewcomer) {
  ActiveSet set(engine, catalog, 1);
  admitNew(set, "aa01");
  engine.failUnload.insert("aa01");

  catalog.insert("aa02", "b");
  auto handle = engine.load(descriptor("aa02"), dir / "downloads");
  EXPECT_THROW(set.admit("aa02", std::move(handle)), EngineError);
  EXPECT_TRUE(set.contains("aa01"));
  EXPECT_FALSE(set.contains("aa02"));
  EXPECT_FALSE(engine.isLoaded("aa02"));
  EXPECT_EQ(set.size(), 1u);
}

TEST_F(ActiveSetTest, DuplicateAdmitIsConflict) {
  ActiveSet set(engine, catalog, 2);
  admitNew(set, "aa01");
  auto other = std::make_unique<FakeHandle>("aa01", "dup", dir / "downloads");
  EXPECT_THROW(set.admit("aa01", std::move(other)), ConflictError);
  EXPECT_EQ(set.size(), 1u);
}

TEST_F(ActiveSetTest, EnforceCapacityIsIdempotent) {
  ActiveSet set(engine, catalog, 2);
  admitNew(set, "aa01");
  admitNew(set, "aa02");
  EXPECT_TRUE(set.enforceCapacity().empty());
  EXPECT_TRUE(set.enforceCapacity().empty());
  EXPECT_EQ(set.size(), 2u);
}

TEST_F(ActiveSetTest, EvictionLogCarriesLastAccess) {
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));

  ActiveSet set(engine, catalog, 1);
  admitNew(set, "aa01");
  const auto stamp = catalog.get("aa01")->last_access;
  admitNew(set, "aa02");
  spdlog::set_default_logger(previous);

  bool found = false;
  for (const auto& line : sink->last_formatted()) {
    if (line.find("evicted aa01 (last_access " + std::to_string(stamp) + ")") != std::string::npos) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}
