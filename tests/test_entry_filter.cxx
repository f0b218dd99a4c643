#include <mabi-pack/entry-filter.hxx>

#include "test-support.hxx"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace mabi_pack;
using mabi_pack::test::caught_pack_error;

TEST(EntryFilter, EmptyFilterMatchesEverything) {
  const EntryFilter filter;
  EXPECT_TRUE(filter.empty());
  EXPECT_TRUE(filter.matches("db/item.xml"));
  EXPECT_TRUE(filter.matches(""));

  const EntryFilter from_empty_list(std::vector<std::string>{});
  EXPECT_TRUE(from_empty_list.matches("gfx/a.dds"));
}

TEST(EntryFilter, MatchesAnywhereInThePath) {
  const EntryFilter filter({"xml"});
  EXPECT_TRUE(filter.matches("db/item.xml"));
  EXPECT_TRUE(filter.matches("xml/readme.txt"));
  EXPECT_TRUE(filter.matches("db/xmlish/data.bin"));
  EXPECT_FALSE(filter.matches("db/item.txt"));
}

TEST(EntryFilter, AnchorsApplyToTheWholePath) {
  const EntryFilter filter({"^db/", "\\.dds$"});
  EXPECT_TRUE(filter.matches("db/item.xml"));
  EXPECT_FALSE(filter.matches("local/db/item.xml"));
  EXPECT_TRUE(filter.matches("gfx/image.dds"));
  EXPECT_FALSE(filter.matches("gfx/image.dds.bak"));
}

TEST(EntryFilter, UnionOfPatterns) {
  const std::vector<std::string> paths = {"db/item.xml", "db/skill.xml",
                                          "gfx/a.dds", "sound/b.wav",
                                          "local/text.txt"};
  const EntryFilter a({"\\.xml$"});
  const EntryFilter b({"^gfx/"});
  const EntryFilter both({"\\.xml$", "^gfx/"});

  for (const auto &path : paths)
    EXPECT_EQ(both.matches(path), a.matches(path) || b.matches(path)) << path;
}

TEST(EntryFilter, BackslashPathsAreMatchedInNormalizedForm) {
  const EntryFilter filter({"^db/item"});
  EXPECT_TRUE(filter.matches("db\\item.xml"));
}

TEST(EntryFilter, InvalidPatternFailsAtConstruction) {
  const auto error =
      caught_pack_error([] { EntryFilter({"ok", "(unclosed"}); });
  ASSERT_TRUE(error);
  EXPECT_EQ(error->code(), ErrorCode::InvalidFilterPattern);
  EXPECT_TRUE(test::contains(error->what(), "(unclosed"));

  EXPECT_EQ(test::pack_error_of([] { EntryFilter({"[a-"}); }),
            ErrorCode::InvalidFilterPattern);
}
