#include "reel/entity_store.hpp"
#include "reel/hash.hpp"
#include "reel/relation_index.hpp"
#include <gtest/gtest.h>

using namespace reel;

class RelationIndexTest : public ::testing::Test {
protected:
  EntityStore store;
  RelationIndex relations;

  ActorId tom = 0, meryl = 0, leo = 0;
  MovieId gump = 0, prada = 0, titanic = 0;

  void SetUp() override {
    tom = *store.insert_actor("Tom Hanks", 67);
    meryl = *store.insert_actor("Meryl Streep", 74);
    leo = *store.insert_actor("Leonardo DiCaprio", 49);
    gump = *store.insert_movie("Forrest Gump", 1994);
    prada = *store.insert_movie("The Devil Wears Prada", 2006);
    titanic = *store.insert_movie("Titanic", 1997);
  }
};

TEST_F(RelationIndexTest, LinkIsSymmetric) {
  ASSERT_TRUE(relations.link(store, gump, tom).has_value());

  EXPECT_TRUE(relations.contains(gump, tom));
  EXPECT_EQ(relations.actors_of(gump), std::vector<ActorId>{tom});
  EXPECT_EQ(relations.movies_of(tom), std::vector<MovieId>{gump});
  EXPECT_EQ(relations.size(), 1u);
}

TEST_F(RelationIndexTest, LinkUnknownIdsIsNotFound) {
  EXPECT_EQ(relations.link(store, 999, tom).error(), CatalogError::NotFound);
  EXPECT_EQ(relations.link(store, gump, 999).error(), CatalogError::NotFound);
  EXPECT_EQ(relations.size(), 0u);
  EXPECT_TRUE(relations.movies_of(tom).empty());
}

TEST_F(RelationIndexTest, DuplicateLinkLeavesStateUnchanged) {
  ASSERT_TRUE(relations.link(store, gump, tom).has_value());
  ASSERT_TRUE(relations.link(store, gump, meryl).has_value());
  auto before = relations.roles();

  auto again = relations.link(store, gump, tom);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), CatalogError::Duplicate);

  EXPECT_EQ(relations.roles(), before);
  EXPECT_EQ(relations.actors_of(gump), (std::vector<ActorId>{tom, meryl}));
  EXPECT_EQ(relations.movies_of(tom), std::vector<MovieId>{gump});
}

TEST_F(RelationIndexTest, LookupsFollowLinkOrder) {
  relations.link(store, titanic, leo);
  relations.link(store, prada, meryl);
  relations.link(store, gump, meryl);
  relations.link(store, gump, tom);

  EXPECT_EQ(relations.movies_of(meryl), (std::vector<MovieId>{prada, gump}));
  EXPECT_EQ(relations.actors_of(gump), (std::vector<ActorId>{meryl, tom}));

  auto roles = relations.roles();
  ASSERT_EQ(roles.size(), 4u);
  EXPECT_EQ(roles.front(), (Role{titanic, leo}));
  EXPECT_EQ(roles.back(), (Role{gump, tom}));
}

TEST_F(RelationIndexTest, UnlinkAllByMovie) {
  relations.link(store, gump, tom);
  relations.link(store, gump, meryl);
  relations.link(store, prada, meryl);

  EXPECT_EQ(relations.unlink_all(gump, std::nullopt), 2u);
  EXPECT_TRUE(relations.actors_of(gump).empty());
  EXPECT_TRUE(relations.movies_of(tom).empty());
  EXPECT_EQ(relations.movies_of(meryl), std::vector<MovieId>{prada});
  EXPECT_EQ(relations.size(), 1u);
}

TEST_F(RelationIndexTest, UnlinkAllByActor) {
  relations.link(store, gump, meryl);
  relations.link(store, prada, meryl);
  relations.link(store, gump, tom);

  EXPECT_EQ(relations.unlink_all(std::nullopt, meryl), 2u);
  EXPECT_TRUE(relations.movies_of(meryl).empty());
  EXPECT_EQ(relations.actors_of(gump), std::vector<ActorId>{tom});
  EXPECT_TRUE(relations.actors_of(prada).empty());
}

TEST_F(RelationIndexTest, UnlinkAllSinglePair) {
  relations.link(store, gump, tom);
  relations.link(store, gump, meryl);

  EXPECT_EQ(relations.unlink_all(gump, tom), 1u);
  EXPECT_FALSE(relations.contains(gump, tom));
  EXPECT_TRUE(relations.contains(gump, meryl));

  // Relinking a removed pair is allowed
  EXPECT_TRUE(relations.link(store, gump, tom).has_value());
  EXPECT_EQ(relations.actors_of(gump), (std::vector<ActorId>{meryl, tom}));
}

TEST_F(RelationIndexTest, UnlinkAllIsIdempotent) {
  relations.link(store, gump, tom);

  EXPECT_EQ(relations.unlink_all(gump, std::nullopt), 1u);
  EXPECT_EQ(relations.unlink_all(gump, std::nullopt), 0u);
  EXPECT_EQ(relations.unlink_all(std::nullopt, tom), 0u);
  EXPECT_EQ(relations.unlink_all(gump, tom), 0u);
  EXPECT_EQ(relations.unlink_all(), 0u);
  EXPECT_EQ(relations.size(), 0u);
}

TEST(RoleHashTest, DistinguishesOrientation) {
  static_assert(hash::role_key(1, 2) == hash::role_key(1, 2));
  EXPECT_NE(hash::role_key(1, 2), hash::role_key(2, 1));
  EXPECT_EQ(hash::RoleHash{}(Role{4, 5}),
            static_cast<size_t>(hash::role_key(4, 5)));
}
