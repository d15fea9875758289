// test_style_index.cpp
// Tests for catalog parsing and the StyleIndex snapshot queries
//
// Framework: GoogleTest

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "designex/style_index.hpp"
#include "test_support.hpp"

using namespace designex;
using namespace designex::testutil;

namespace {

const char* kCatalog = R"({
  "main_walls": {
    "Modern":   [{"color": "#F5F5F5", "texture": "smooth", "material": "stucco", "finish": "matte", "rating": 4.6, "keywords": ["clean", "minimal"]}],
    "Colonial": [{"color": "#FFFFF0", "texture": "lap", "material": "wood siding", "finish": "semi-gloss", "rating": 4.4, "keywords": ["classic"]}]
  },
  "windows": {
    "Modern": [{"color": "#FFFFFF", "texture": "matte", "material": "aluminum", "finish": "satin", "rating": 4.5, "keywords": ["sleek"]}]
  },
  "doors": {
    "Craftsman": [
      {"color": "#5C4033", "texture": "grain", "material": "fir", "finish": "oil", "rating": 4.8, "keywords": []},
      {"color": "#2E4A3A", "texture": "grain", "material": "oak", "finish": "stain", "rating": 4.0}
    ]
  },
  "roof": {}
})";

}

// ============================================================================
// Queries
// ============================================================================

TEST(StyleIndex, StyleExistsForStylesUnderAnyRegion) {
    StyleIndex index;
    ASSERT_TRUE(index.loadJson(kCatalog));

    EXPECT_TRUE(index.styleExists("Modern"));
    EXPECT_TRUE(index.styleExists("Colonial"));
    EXPECT_TRUE(index.styleExists("Craftsman"));   // only under doors
}

TEST(StyleIndex, StyleExistsIsExactMatch) {
    StyleIndex index;
    ASSERT_TRUE(index.loadJson(kCatalog));

    EXPECT_FALSE(index.styleExists(""));
    EXPECT_FALSE(index.styleExists("modern"));
    EXPECT_FALSE(index.styleExists("Modern "));
    EXPECT_FALSE(index.styleExists("Baroque"));
    EXPECT_FALSE(index.styleExists("windows"));
}

TEST(StyleIndex, RegionTypesFollowCatalogOrder) {
    StyleIndex index;
    ASSERT_TRUE(index.loadJson(kCatalog));

    EXPECT_EQ(index.allRegionTypes(),
              (std::vector<std::string>{"main_walls", "windows", "doors", "roof"}));
}

TEST(StyleIndex, StylesAreDistinctInFirstSeenOrder) {
    StyleIndex index;
    ASSERT_TRUE(index.loadJson(kCatalog));

    EXPECT_EQ(index.allStyles(), (std::vector<std::string>{"Modern", "Colonial", "Craftsman"}));
}

TEST(StyleIndex, RecommendationFieldsAreParsed) {
    StyleIndex index;
    ASSERT_TRUE(index.loadJson(kCatalog));

    Recommendations windows = index.recommendationsFor("windows", "Modern");
    ASSERT_EQ(windows.size(), 1u);
    EXPECT_EQ(windows[0].color, "#FFFFFF");
    EXPECT_EQ(windows[0].texture, "matte");
    EXPECT_EQ(windows[0].material, "aluminum");
    EXPECT_EQ(windows[0].finish, "satin");
    EXPECT_DOUBLE_EQ(windows[0].rating, 4.5);
    EXPECT_EQ(windows[0].keywords, (std::vector<std::string>{"sleek"}));

    Recommendations doors = index.recommendationsFor("doors", "Craftsman");
    ASSERT_EQ(doors.size(), 2u);
    EXPECT_EQ(doors[0].material, "fir");
    EXPECT_TRUE(doors[0].keywords.empty());
    EXPECT_EQ(doors[1].material, "oak");
    EXPECT_TRUE(doors[1].keywords.empty());
}

TEST(StyleIndex, UnknownRegionOrStyleYieldsEmpty) {
    StyleIndex index;
    ASSERT_TRUE(index.loadJson(kCatalog));

    EXPECT_TRUE(index.recommendationsFor("chimney", "Modern").empty());
    EXPECT_TRUE(index.recommendationsFor("windows", "Baroque").empty());
    EXPECT_TRUE(index.recommendationsFor("windows", "Colonial").empty());
    EXPECT_TRUE(index.recommendationsFor("roof", "Modern").empty());
    EXPECT_TRUE(index.recommendationsFor("", "").empty());

    // Queries have no side effects
    EXPECT_TRUE(index.recommendationsFor("chimney", "Modern").empty());
    EXPECT_FALSE(index.styleExists("Baroque"));
    EXPECT_EQ(index.allRegionTypes().size(), 4u);
}

// ============================================================================
// Loading
// ============================================================================

TEST(StyleIndex, LoadsFromFile) {
    TempDir dir;
    writeFile(dir / "library.json", kCatalog);

    StyleIndex index;
    CatalogLoadResult result = index.load(dir / "library.json");

    ASSERT_TRUE(result) << result.message;
    EXPECT_FALSE(index.degraded());
    EXPECT_TRUE(index.styleExists("Modern"));
}

TEST(StyleIndex, StartsEmptyAndDegraded) {
    StyleIndex index;
    EXPECT_TRUE(index.degraded());
    EXPECT_TRUE(index.allRegionTypes().empty());
    EXPECT_TRUE(index.allStyles().empty());
    EXPECT_FALSE(index.styleExists("Modern"));
}

TEST(StyleIndex, MissingFileLeavesDegradedEmptyIndex) {
    TempDir dir;
    StyleIndex index;
    CatalogLoadResult result = index.load(dir / "absent.json");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, CatalogError::NotFound);
    EXPECT_TRUE(index.degraded());
    EXPECT_FALSE(index.styleExists("Modern"));
    EXPECT_TRUE(index.allStyles().empty());
}

TEST(StyleIndex, MalformedJsonIsParseError) {
    StyleIndex index;
    CatalogLoadResult result = index.loadJson(R"({"windows": {"Modern": [)");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, CatalogError::ParseError);
    EXPECT_TRUE(index.degraded());
    EXPECT_TRUE(index.allRegionTypes().empty());
}

TEST(StyleIndex, WrongShapesAreSchemaErrors) {
    EXPECT_EQ(parseCatalog(R"(["windows"])").error, CatalogError::InvalidSchema);
    EXPECT_EQ(parseCatalog(R"({"windows": ["Modern"]})").error, CatalogError::InvalidSchema);
    EXPECT_EQ(parseCatalog(R"({"windows": {"Modern": {"color": "#FFF"}}})").error, CatalogError::InvalidSchema);
    EXPECT_EQ(parseCatalog(R"({"windows": {"Modern": ["#FFF"]}})").error, CatalogError::InvalidSchema);
    EXPECT_EQ(parseCatalog(R"({"windows": {"Modern": [{"keywords": "sleek"}]}})").error, CatalogError::InvalidSchema);
}

TEST(StyleIndex, FailedLoadReplacesPreviousCatalog) {
    StyleIndex index;
    ASSERT_TRUE(index.loadJson(kCatalog));
    EXPECT_FALSE(index.loadJson("not json"));

    EXPECT_TRUE(index.degraded());
    EXPECT_FALSE(index.styleExists("Modern"));
}

TEST(StyleIndex, ReloadSwapsCatalog) {
    TempDir dir;
    auto path = dir / "library.json";
    writeFile(path, kCatalog);

    StyleIndex index;
    ASSERT_TRUE(index.load(path));
    auto before = index.snapshot();

    writeFile(path, R"({"garage": {"Industrial": [{"color": "#777777"}]}})");
    ASSERT_TRUE(index.reload(path));

    EXPECT_TRUE(index.styleExists("Industrial"));
    EXPECT_FALSE(index.styleExists("Modern"));
    // A snapshot taken earlier is unaffected
    EXPECT_TRUE(before->styleExists("Modern"));
    EXPECT_EQ(before->regions().size(), 4u);
}

TEST(StyleIndex, FailedReloadKeepsCurrentCatalog) {
    TempDir dir;
    auto path = dir / "library.json";
    writeFile(path, kCatalog);

    StyleIndex index;
    ASSERT_TRUE(index.load(path));

    writeFile(path, "{ broken");
    CatalogLoadResult result = index.reload(path);

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error, CatalogError::ParseError);
    EXPECT_FALSE(index.degraded());
    EXPECT_TRUE(index.styleExists("Modern"));
}

TEST(StyleIndex, ConcurrentReadsDuringReload) {
    TempDir dir;
    auto first = dir / "first.json";
    auto second = dir / "second.json";
    writeFile(first, kCatalog);
    writeFile(second, R"({"windows": {"Modern": [{"color": "#000000"}, {"color": "#111111"}]}})");

    StyleIndex index;
    ASSERT_TRUE(index.load(first));

    std::atomic<bool> done{false};
    std::atomic<int> misses{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done.load()) {
                if (!index.styleExists("Modern")) {
                    misses.fetch_add(1);
                }
                auto snapshot = index.snapshot();
                std::size_t count = snapshot->recommendationsFor("windows", "Modern").size();
                if (count != 1 && count != 2) {
                    misses.fetch_add(1);
                }
            }
        });
    }

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(index.reload(i % 2 == 0 ? second : first));
    }
    done.store(true);
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(misses.load(), 0);
}

TEST(CatalogError, Names) {
    EXPECT_STREQ(toString(CatalogError::NotFound), "not_found");
    EXPECT_STREQ(toString(CatalogError::ParseError), "parse_error");
    EXPECT_STREQ(toString(CatalogError::InvalidSchema), "invalid_schema");
}
